#include "VoteEncoder.h"
#include "../crypto/Hash.h"
#include "../crypto/Random.h"
#include "../lib/Utilities.h"

#include <nlohmann/json.hpp>

namespace vl {

std::string VoteEncoder::VotePayload::serialize() const {
  nlohmann::ordered_json j;
  j["candidateId"] = candidateId;
  j["candidateName"] = candidateName;
  j["party"] = party;
  j["constituencyId"] = constituencyId;
  return j.dump();
}

VoteEncoder::VoteEncoder() : Module("ledger.encoder") {}

VoteEncoder::EncodedVote VoteEncoder::encode(const VotePayload &payload) const {
  return encode(payload, utl::getCurrentTimeMs());
}

VoteEncoder::EncodedVote VoteEncoder::encode(const VotePayload &payload,
                                             int64_t timestamp) const {
  std::string plaintext = payload.serialize();
  std::string digest = crypto::sha256(plaintext + std::to_string(timestamp));

  EncodedVote encoded;
  encoded.timestamp = timestamp;
  encoded.opaque =
      std::string(FORMAT_TAG) + ":" + digest + ":" + utl::hexEncode(plaintext);

  log().debug << "Encoded vote for constituency " << payload.constituencyId
              << " digest " << digest.substr(0, 16);
  return encoded;
}

std::string VoteEncoder::deriveVoterHash(const std::string &nationalId,
                                         const std::string &salt) {
  return crypto::sha256(crypto::sha256(nationalId) + salt);
}

std::vector<uint8_t> VoteEncoder::generateKeyMaterial(size_t bytes) {
  return crypto::randomBytes(bytes);
}

} // namespace vl
