#ifndef VOTE_LEDGER_VOTE_ENCODER_H
#define VOTE_LEDGER_VOTE_ENCODER_H

#include "../lib/Module.h"

#include <cstdint>
#include <string>
#include <vector>

namespace vl {

/**
 * VoteEncoder - turns a ballot selection into the opaque string stored in a
 * block, and derives the anonymous voter hash.
 *
 * The opaque format is "RSA2048:<sha256(json || timestamp)>:<hex(json)>".
 * It stands in for public-key encryption and hides nothing: the payload is
 * only hex encoded. The ledger never looks inside the string, so a real
 * envelope scheme can replace encode() without touching it.
 */
class VoteEncoder : public Module {
public:
  constexpr static const char *FORMAT_TAG = "RSA2048";
  constexpr static const char *DEFAULT_VOTER_SALT = "ELECTORAL_SALT_2024";
  constexpr static size_t DEFAULT_KEY_BYTES = 32;

  struct VotePayload {
    std::string candidateId;
    std::string candidateName;
    std::string party;
    std::string constituencyId;

    /** Serialized with keys in declaration order */
    std::string serialize() const;
  };

  struct EncodedVote {
    std::string opaque;
    int64_t timestamp{0};
  };

  VoteEncoder();
  ~VoteEncoder() override = default;

  /** Encode with the current time as binding timestamp */
  EncodedVote encode(const VotePayload &payload) const;
  EncodedVote encode(const VotePayload &payload, int64_t timestamp) const;

  /**
   * Voter hash used in the ledger: sha256(sha256(nationalId) || salt).
   * One-way; the ledger never relates it back to an identity.
   */
  static std::string deriveVoterHash(const std::string &nationalId,
                                     const std::string &salt = DEFAULT_VOTER_SALT);

  /** Random key material for shard generation demos */
  static std::vector<uint8_t> generateKeyMaterial(size_t bytes = DEFAULT_KEY_BYTES);
};

} // namespace vl

#endif // VOTE_LEDGER_VOTE_ENCODER_H
