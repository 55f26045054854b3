#ifndef VOTE_LEDGER_VOTE_LEDGER_H
#define VOTE_LEDGER_VOTE_LEDGER_H

#include "Block.h"
#include "ProofOfWork.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vl {

/**
 * VoteLedger - tamper-evident append-only chain of vote blocks
 *
 * Two layers:
 * - State operations (initialize, appendVote, validate, statistics,
 *   exportForAudit) never modify their input. appendVote returns a new State
 *   whose chain shares the existing immutable blocks with the old one, so a
 *   State is a stable snapshot that can be validated while appends go on.
 * - The VoteLedger object is the single writer for one authoritative State.
 *   submitVote() serializes appends; snapshot() hands out the current State
 *   without waiting for a mining append to finish.
 *
 * A voter may vote more than once. Every vote stays in the chain for audit,
 * only the latest block per voter hash is counted.
 */
class VoteLedger : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Input errors (1-9)
  constexpr static int32_t E_INVALID_VOTE = 1;       // empty vote payload
  constexpr static int32_t E_INVALID_VOTER = 2;      // empty voter hash
  constexpr static int32_t E_INVALID_STATE = 3;      // state without genesis
  // Mining errors (10-19), mirror ProofOfWork codes
  constexpr static int32_t E_INVALID_DIFFICULTY = 10;
  constexpr static int32_t E_MINING_TIMEOUT = 11;
  constexpr static int32_t E_MINING_CANCELLED = 12;

  constexpr static size_t AUDIT_VOTER_PREFIX = 16;

  // Validation failure reasons, in the order the checks run
  constexpr static const char *REASON_EMPTY_CHAIN = "empty chain";
  constexpr static const char *REASON_INVALID_GENESIS = "invalid genesis";
  constexpr static const char *REASON_MISSING_BLOCK = "missing block";
  constexpr static const char *REASON_INDEX = "index discontinuity";
  constexpr static const char *REASON_LINK = "hash chain broken";
  constexpr static const char *REASON_HASH = "hash mismatch";
  constexpr static const char *REASON_POW = "invalid proof-of-work";
  constexpr static const char *REASON_TIMESTAMP = "timestamp violation";

  using BlockPtr = std::shared_ptr<const Block>;
  using Chain = std::vector<BlockPtr>;

  struct Config {
    uint32_t difficulty{4};
    ProofOfWork::Config pow;
  };

  struct State {
    Chain chain;
    std::map<std::string, BlockPtr> latestPerVoter; // voterHash -> counted vote
    bool isValid{true};
    int64_t lastValidated{0};
  };

  struct AppendResult {
    State state;
    BlockPtr block;
    int64_t elapsedMs{0};
    uint64_t attempts{0};
  };

  /**
   * Outcome of a full chain scan. Failures are data, not errors: auditors
   * need the index of the first offending block.
   */
  struct ValidationResult {
    bool isValid{true};
    std::optional<uint64_t> firstInvalidIndex;
    std::string reason;

    nlohmann::json toJson() const;
  };

  struct Statistics {
    uint64_t totalBlocks{0}; // excluding genesis
    uint64_t uniqueVoters{0};
    std::optional<int64_t> lastBlockTimestamp; // unset while only genesis exists
    bool chainIntegrity{true};

    nlohmann::json toJson() const;
  };

  VoteLedger();
  explicit VoteLedger(const Config &config);
  ~VoteLedger() override = default;

  // ----------------- state operations ------------------------------
  static State initialize();

  /**
   * Mine a block for the vote on top of state's tail.
   * @param state Input state, left untouched
   * @param cancel Optional flag that aborts mining
   */
  Roe<AppendResult> appendVote(const State &state,
                               const std::string &encryptedVote,
                               const std::string &voterHash,
                               uint32_t difficulty,
                               const std::atomic<bool> *cancel = nullptr) const;

  static ValidationResult validate(const Chain &chain);
  static Statistics statistics(const State &state);

  /**
   * Audit snapshot: export time, block count (genesis included), tip hash and
   * per-block metadata. Vote payloads are left out and voter hashes are
   * truncated.
   */
  static nlohmann::json exportForAudit(const State &state);

  /** Counted votes (latest per voter), in chain order. */
  static std::vector<BlockPtr> countedVotes(const State &state);

  // ----------------- single-writer handle --------------------------
  const Config &getConfig() const { return config_; }

  /**
   * Append a vote to the authoritative chain at the configured difficulty.
   * Concurrent callers are serialized.
   */
  Roe<AppendResult> submitVote(const std::string &encryptedVote,
                               const std::string &voterHash,
                               const std::atomic<bool> *cancel = nullptr);

  State snapshot() const;

  /**
   * Validate a snapshot of the authoritative chain and record the outcome
   * (isValid, lastValidated) on the authoritative state.
   */
  ValidationResult validateChain();

  Statistics getStatistics() const;
  nlohmann::json exportAudit() const;

private:
  static ValidationResult invalidAt(uint64_t index, const std::string &reason);
  static int32_t fromPowCode(int32_t powCode);

  Config config_;
  ProofOfWork pow_;
  State state_;
  std::mutex writeMutex_;         // held for a whole append, including mining
  mutable std::mutex stateMutex_; // guards state_ reads and publication
};

std::ostream &operator<<(std::ostream &os,
                         const VoteLedger::ValidationResult &result);

} // namespace vl

#endif // VOTE_LEDGER_VOTE_LEDGER_H
