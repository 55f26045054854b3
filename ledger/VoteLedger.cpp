#include "VoteLedger.h"
#include "../lib/Utilities.h"

#include <algorithm>
#include <chrono>

namespace vl {

nlohmann::json VoteLedger::ValidationResult::toJson() const {
  nlohmann::json j;
  j["isValid"] = isValid;
  j["firstInvalidIndex"] =
      firstInvalidIndex ? nlohmann::json(*firstInvalidIndex) : nlohmann::json();
  j["reason"] = reason.empty() ? nlohmann::json() : nlohmann::json(reason);
  return j;
}

nlohmann::json VoteLedger::Statistics::toJson() const {
  nlohmann::json j;
  j["totalBlocks"] = totalBlocks;
  j["uniqueVoters"] = uniqueVoters;
  j["lastBlockTime"] = lastBlockTimestamp
                           ? nlohmann::json(*lastBlockTimestamp)
                           : nlohmann::json();
  j["chainIntegrity"] = chainIntegrity;
  return j;
}

std::ostream &operator<<(std::ostream &os,
                         const VoteLedger::ValidationResult &result) {
  if (result.isValid) {
    os << "ValidationResult{valid}";
  } else {
    os << "ValidationResult{invalid at "
       << result.firstInvalidIndex.value_or(0) << ": " << result.reason << "}";
  }
  return os;
}

VoteLedger::VoteLedger() : VoteLedger(Config{}) {}

VoteLedger::VoteLedger(const Config &config)
    : Module("ledger"), config_(config), pow_(config.pow),
      state_(initialize()) {}

// ----------------- state operations ------------------------------

VoteLedger::State VoteLedger::initialize() {
  State state;
  state.chain.push_back(std::make_shared<const Block>(Block::genesis()));
  state.isValid = true;
  state.lastValidated = utl::getCurrentTimeMs();
  return state;
}

VoteLedger::Roe<VoteLedger::AppendResult>
VoteLedger::appendVote(const State &state, const std::string &encryptedVote,
                       const std::string &voterHash, uint32_t difficulty,
                       const std::atomic<bool> *cancel) const {
  if (state.chain.empty() || !state.chain.back()) {
    return Error(E_INVALID_STATE, "State has no tail block, initialize() first");
  }
  if (encryptedVote.empty()) {
    return Error(E_INVALID_VOTE, "Encrypted vote is empty");
  }
  if (voterHash.empty()) {
    return Error(E_INVALID_VOTER, "Voter hash is empty");
  }

  auto startTime = std::chrono::steady_clock::now();
  const Block &tail = *state.chain.back();

  Block block;
  block.index = tail.index + 1;
  // Clock steps backwards must not break timestamp ordering
  block.timestamp = std::max(utl::getCurrentTimeMs(), tail.timestamp);
  block.encryptedVote = encryptedVote;
  block.voterHash = voterHash;
  block.previousHash = tail.hash;
  block.difficulty = difficulty;

  auto mined = pow_.mine(block.canonicalPayload(), tail.hash, difficulty, cancel);
  if (!mined) {
    log().error << "Failed to mine block " << block.index << ": "
                << mined.error().message;
    return Error(fromPowCode(mined.error().code), mined.error().message);
  }
  block.nonce = mined->nonce;
  block.hash = mined->hash;

  AppendResult result;
  result.block = std::make_shared<const Block>(std::move(block));
  result.state.chain = state.chain;
  result.state.chain.push_back(result.block);
  result.state.latestPerVoter = state.latestPerVoter;
  result.state.latestPerVoter[voterHash] = result.block;
  result.state.isValid = state.isValid;
  result.state.lastValidated = state.lastValidated;
  result.attempts = mined->attempts;
  result.elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - startTime)
                         .count();

  log().info << "Appended block " << result.block->index << " hash "
             << result.block->hash.substr(0, 16) << " after "
             << result.attempts << " attempts in " << result.elapsedMs << " ms";
  return result;
}

VoteLedger::ValidationResult VoteLedger::invalidAt(uint64_t index,
                                                   const std::string &reason) {
  ValidationResult result;
  result.isValid = false;
  result.firstInvalidIndex = index;
  result.reason = reason;
  return result;
}

VoteLedger::ValidationResult VoteLedger::validate(const Chain &chain) {
  if (chain.empty()) {
    return invalidAt(0, REASON_EMPTY_CHAIN);
  }
  if (!chain[0] || chain[0]->index != 0) {
    return invalidAt(0, REASON_INVALID_GENESIS);
  }

  for (size_t i = 1; i < chain.size(); ++i) {
    if (!chain[i]) {
      return invalidAt(i, REASON_MISSING_BLOCK);
    }
    const Block &current = *chain[i];
    const Block &previous = *chain[i - 1];

    if (current.index != previous.index + 1) {
      return invalidAt(i, REASON_INDEX);
    }
    if (current.previousHash != previous.hash) {
      return invalidAt(i, REASON_LINK);
    }
    if (current.calculateHash() != current.hash) {
      return invalidAt(i, REASON_HASH);
    }
    if (!ProofOfWork::verify(current.hash, current.difficulty)) {
      return invalidAt(i, REASON_POW);
    }
    if (current.timestamp < previous.timestamp) {
      return invalidAt(i, REASON_TIMESTAMP);
    }
  }

  return ValidationResult{};
}

VoteLedger::Statistics VoteLedger::statistics(const State &state) {
  Statistics stats;
  stats.totalBlocks = state.chain.empty() ? 0 : state.chain.size() - 1;
  stats.uniqueVoters = state.latestPerVoter.size();
  if (!state.chain.empty() && state.chain.back() &&
      !state.chain.back()->isGenesis()) {
    stats.lastBlockTimestamp = state.chain.back()->timestamp;
  }
  stats.chainIntegrity = state.isValid;
  return stats;
}

nlohmann::json VoteLedger::exportForAudit(const State &state) {
  nlohmann::json j;
  j["exportedAt"] = utl::formatIsoTimestamp(utl::getCurrentTimeMs());
  j["blockCount"] = state.chain.size();
  j["chainHash"] = (state.chain.empty() || !state.chain.back())
                       ? nlohmann::json()
                       : nlohmann::json(state.chain.back()->hash);

  nlohmann::json blocks = nlohmann::json::array();
  for (const auto &block : state.chain) {
    if (!block) {
      continue;
    }
    nlohmann::json entry;
    entry["index"] = block->index;
    entry["timestamp"] = utl::formatIsoTimestamp(block->timestamp);
    entry["hash"] = block->hash;
    entry["previousHash"] = block->previousHash;
    entry["voterHash"] = block->voterHash.substr(0, AUDIT_VOTER_PREFIX) + "...";
    entry["difficulty"] = block->difficulty;
    blocks.push_back(entry);
  }
  j["blocks"] = blocks;
  return j;
}

std::vector<VoteLedger::BlockPtr> VoteLedger::countedVotes(const State &state) {
  std::vector<BlockPtr> votes;
  votes.reserve(state.latestPerVoter.size());
  for (const auto &entry : state.latestPerVoter) {
    votes.push_back(entry.second);
  }
  std::sort(votes.begin(), votes.end(),
            [](const BlockPtr &a, const BlockPtr &b) { return a->index < b->index; });
  return votes;
}

int32_t VoteLedger::fromPowCode(int32_t powCode) {
  switch (powCode) {
  case ProofOfWork::E_INVALID_DIFFICULTY:
    return E_INVALID_DIFFICULTY;
  case ProofOfWork::E_MINING_CANCELLED:
    return E_MINING_CANCELLED;
  case ProofOfWork::E_MINING_TIMEOUT:
  default:
    return E_MINING_TIMEOUT;
  }
}

// ----------------- single-writer handle --------------------------

VoteLedger::Roe<VoteLedger::AppendResult>
VoteLedger::submitVote(const std::string &encryptedVote,
                       const std::string &voterHash,
                       const std::atomic<bool> *cancel) {
  std::lock_guard<std::mutex> writeLock(writeMutex_);

  // Only this writer replaces state_, so the tail cannot move while we mine
  State base = snapshot();
  auto result = appendVote(base, encryptedVote, voterHash, config_.difficulty,
                           cancel);
  if (!result) {
    return result;
  }

  {
    // isValid and lastValidated belong to validateChain(), which may have run
    // while we were mining
    std::lock_guard<std::mutex> stateLock(stateMutex_);
    state_.chain = result->state.chain;
    state_.latestPerVoter = result->state.latestPerVoter;
  }
  return result;
}

VoteLedger::State VoteLedger::snapshot() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return state_;
}

VoteLedger::ValidationResult VoteLedger::validateChain() {
  State current = snapshot();
  ValidationResult result = validate(current.chain);

  if (result.isValid) {
    log().info << "Chain of " << current.chain.size() << " blocks is valid";
  } else {
    log().error << "Chain validation failed at block "
                << result.firstInvalidIndex.value_or(0) << ": " << result.reason;
  }

  std::lock_guard<std::mutex> lock(stateMutex_);
  state_.isValid = result.isValid;
  state_.lastValidated = utl::getCurrentTimeMs();
  return result;
}

VoteLedger::Statistics VoteLedger::getStatistics() const {
  return statistics(snapshot());
}

nlohmann::json VoteLedger::exportAudit() const {
  return exportForAudit(snapshot());
}

} // namespace vl
