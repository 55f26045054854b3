#ifndef VOTE_LEDGER_BLOCK_H
#define VOTE_LEDGER_BLOCK_H

#include <cstdint>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace vl {

/**
 * One vote-append event in the ledger.
 *
 * Blocks are immutable once mined. The hash binds every other field:
 *   hash = SHA-256(canonicalPayload() || previousHash || nonce)
 * and must start with `difficulty` zero hex digits.
 */
struct Block {
  uint64_t index{0};
  int64_t timestamp{0}; // milliseconds since epoch
  std::string encryptedVote;
  std::string voterHash;
  std::string previousHash;
  std::string nonce;
  std::string hash;
  uint32_t difficulty{0};

  /**
   * Compact JSON of index, timestamp, encryptedVote, voterHash,
   * previousHash and difficulty, in that order. This is the mining payload.
   */
  std::string canonicalPayload() const;

  /** Recompute the digest from the block's own fields. */
  std::string calculateHash() const;

  bool isGenesis() const { return index == 0; }

  nlohmann::json toJson() const;

  /**
   * The fixed trust anchor at index 0. Its hash is a sentinel and is not
   * subject to digest or proof-of-work checks.
   */
  static const Block &genesis();

  bool operator==(const Block &other) const;
  bool operator!=(const Block &other) const { return !(*this == other); }
};

std::ostream &operator<<(std::ostream &os, const Block &block);

} // namespace vl

#endif // VOTE_LEDGER_BLOCK_H
