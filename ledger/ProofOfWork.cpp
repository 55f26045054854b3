#include "ProofOfWork.h"
#include "../crypto/Hash.h"
#include "../crypto/Random.h"

#include <thread>

namespace vl {

ProofOfWork::ProofOfWork() : ProofOfWork(Config{}) {}

ProofOfWork::ProofOfWork(const Config &config)
    : Module("ledger.pow"), config_(config) {}

bool ProofOfWork::verify(const std::string &hash, uint32_t difficulty) {
  if (hash.size() < difficulty) {
    return false;
  }
  for (uint32_t i = 0; i < difficulty; ++i) {
    if (hash[i] != '0') {
      return false;
    }
  }
  return true;
}

std::string ProofOfWork::computeHash(const std::string &payload,
                                     const std::string &previousHash,
                                     const std::string &nonce) {
  return crypto::Sha256()
      .update(payload)
      .update(previousHash)
      .update(nonce)
      .finalHex();
}

ProofOfWork::Roe<ProofOfWork::Result>
ProofOfWork::mine(const std::string &payload, const std::string &previousHash,
                  uint32_t difficulty, const std::atomic<bool> *cancel) const {
  if (difficulty > MAX_DIFFICULTY) {
    return Error(E_INVALID_DIFFICULTY,
                 "Difficulty " + std::to_string(difficulty) +
                     " exceeds digest length " + std::to_string(MAX_DIFFICULTY));
  }

  Result result;
  while (result.attempts < config_.maxAttempts) {
    if (cancel && cancel->load()) {
      log().info << "Mining cancelled after " << result.attempts << " attempts";
      return Error(E_MINING_CANCELLED, "Mining cancelled after " +
                                           std::to_string(result.attempts) +
                                           " attempts");
    }

    ++result.attempts;
    std::string nonce = crypto::randomHex(NONCE_BYTES);
    std::string hash = computeHash(payload, previousHash, nonce);
    if (verify(hash, difficulty)) {
      result.nonce = std::move(nonce);
      result.hash = std::move(hash);
      log().debug << "Found nonce after " << result.attempts
                  << " attempts at difficulty " << difficulty;
      return result;
    }

    if (config_.yieldInterval > 0 &&
        result.attempts % config_.yieldInterval == 0) {
      std::this_thread::yield();
    }
  }

  log().warning << "No nonce found within " << config_.maxAttempts
                << " attempts at difficulty " << difficulty;
  return Error(E_MINING_TIMEOUT, "No nonce found within " +
                                     std::to_string(config_.maxAttempts) +
                                     " attempts at difficulty " +
                                     std::to_string(difficulty));
}

std::future<ProofOfWork::Roe<ProofOfWork::Result>>
ProofOfWork::mineAsync(std::string payload, std::string previousHash,
                       uint32_t difficulty,
                       const std::atomic<bool> *cancel) const {
  return std::async(std::launch::async,
                    [this, payload = std::move(payload),
                     previousHash = std::move(previousHash), difficulty,
                     cancel]() { return mine(payload, previousHash, difficulty, cancel); });
}

} // namespace vl
