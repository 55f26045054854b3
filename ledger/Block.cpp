#include "Block.h"
#include "ProofOfWork.h"

namespace vl {

std::string Block::canonicalPayload() const {
  nlohmann::ordered_json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["encryptedVote"] = encryptedVote;
  j["voterHash"] = voterHash;
  j["previousHash"] = previousHash;
  j["difficulty"] = difficulty;
  return j.dump();
}

std::string Block::calculateHash() const {
  return ProofOfWork::computeHash(canonicalPayload(), previousHash, nonce);
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["encryptedVote"] = encryptedVote;
  j["voterHash"] = voterHash;
  j["previousHash"] = previousHash;
  j["nonce"] = nonce;
  j["hash"] = hash;
  j["difficulty"] = difficulty;
  return j;
}

const Block &Block::genesis() {
  static const Block block = [] {
    Block b;
    b.index = 0;
    b.timestamp = 1700000000000;
    b.encryptedVote = "GENESIS";
    b.voterHash = std::string(64, '0');
    b.previousHash = std::string(64, '0');
    b.nonce = std::string(32, '0');
    b.hash = "GENESIS_HASH_ELECTORAL_COMMISSION_2024";
    b.difficulty = 4;
    return b;
  }();
  return block;
}

bool Block::operator==(const Block &other) const {
  return index == other.index && timestamp == other.timestamp &&
         encryptedVote == other.encryptedVote && voterHash == other.voterHash &&
         previousHash == other.previousHash && nonce == other.nonce &&
         hash == other.hash && difficulty == other.difficulty;
}

std::ostream &operator<<(std::ostream &os, const Block &block) {
  os << "Block{index: " << block.index << ", timestamp: " << block.timestamp
     << ", hash: " << block.hash.substr(0, 16)
     << ", previousHash: " << block.previousHash.substr(0, 16)
     << ", difficulty: " << block.difficulty << "}";
  return os;
}

} // namespace vl
