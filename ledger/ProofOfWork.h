#ifndef VOTE_LEDGER_PROOF_OF_WORK_H
#define VOTE_LEDGER_PROOF_OF_WORK_H

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <string>

namespace vl {

/**
 * ProofOfWork - nonce search over SHA-256
 *
 * A digest satisfies difficulty d when its first d hex characters are '0'.
 * Each attempt draws a fresh random nonce, so concurrent miners on the same
 * payload do not repeat each other's work.
 *
 * The search is bounded by Config::maxAttempts and fails with
 * E_MINING_TIMEOUT when the bound is hit; it never returns a digest that
 * misses the target. Callers can retry, which draws new nonces.
 */
class ProofOfWork : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INVALID_DIFFICULTY = 1; // difficulty > digest length
  constexpr static int32_t E_MINING_TIMEOUT = 2;     // attempt ceiling reached
  constexpr static int32_t E_MINING_CANCELLED = 3;   // cancel flag raised

  constexpr static uint32_t MAX_DIFFICULTY = 64;
  constexpr static size_t NONCE_BYTES = 16;

  struct Config {
    uint64_t maxAttempts{5000000};
    // Yield the thread every this many attempts, 0 disables yielding
    uint64_t yieldInterval{100};
  };

  struct Result {
    std::string nonce;
    std::string hash;
    uint64_t attempts{0};
  };

  ProofOfWork();
  explicit ProofOfWork(const Config &config);
  ~ProofOfWork() override = default;

  const Config &getConfig() const { return config_; }

  /**
   * Search for a nonce such that computeHash(payload, previousHash, nonce)
   * meets the difficulty.
   * @param cancel Optional flag, checked before every attempt
   */
  Roe<Result> mine(const std::string &payload, const std::string &previousHash,
                   uint32_t difficulty,
                   const std::atomic<bool> *cancel = nullptr) const;

  /**
   * mine() on a worker thread. This object and *cancel must outlive the
   * returned future.
   */
  std::future<Roe<Result>> mineAsync(std::string payload,
                                     std::string previousHash,
                                     uint32_t difficulty,
                                     const std::atomic<bool> *cancel = nullptr) const;

  /** True iff the first `difficulty` characters of hash are '0'. */
  static bool verify(const std::string &hash, uint32_t difficulty);

  /** SHA-256 hex of payload || previousHash || nonce */
  static std::string computeHash(const std::string &payload,
                                 const std::string &previousHash,
                                 const std::string &nonce);

private:
  Config config_;
};

} // namespace vl

#endif // VOTE_LEDGER_PROOF_OF_WORK_H
