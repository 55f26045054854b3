#include "SecretSharing.h"
#include "GaloisField.h"
#include "Random.h"
#include "../lib/Utilities.h"

#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>

namespace vl {
namespace crypto {

SecretSharing::SecretSharing() : Module("crypto.shamir") {}

SecretSharing::Roe<std::vector<SecretSharing::Share>>
SecretSharing::split(const std::vector<uint8_t> &secret, int n, int k) const {
  if (k < 2) {
    return Error(E_INVALID_THRESHOLD,
                 "Threshold must be at least 2, got " + std::to_string(k));
  }
  if (k > n) {
    return Error(E_INVALID_THRESHOLD, "Threshold " + std::to_string(k) +
                                          " exceeds total shares " +
                                          std::to_string(n));
  }
  if (n > MAX_SHARES) {
    return Error(E_INVALID_THRESHOLD, "At most " + std::to_string(MAX_SHARES) +
                                          " shares supported, got " +
                                          std::to_string(n));
  }

  std::vector<Share> shares(static_cast<size_t>(n));
  for (int i = 0; i < n; ++i) {
    shares[i].x = static_cast<uint8_t>(i + 1);
    shares[i].y.resize(secret.size());
  }

  std::vector<uint8_t> coeffs(static_cast<size_t>(k));
  for (size_t byteIdx = 0; byteIdx < secret.size(); ++byteIdx) {
    coeffs[0] = secret[byteIdx];
    randomFill(coeffs.data() + 1, coeffs.size() - 1);

    for (auto &share : shares) {
      share.y[byteIdx] = GF256::evaluate(coeffs, share.x);
    }
  }
  secureZero(coeffs);

  log().debug << "Split " << secret.size() << "-byte secret into " << n
              << " shares, threshold " << k;
  return shares;
}

SecretSharing::Roe<std::vector<uint8_t>>
SecretSharing::combine(const std::vector<Share> &shares) const {
  if (shares.size() < 2) {
    return Error(E_INSUFFICIENT_SHARES, "Need at least 2 shares, got " +
                                            std::to_string(shares.size()));
  }

  const size_t secretSize = shares[0].y.size();
  std::set<uint8_t> seen;
  for (const auto &share : shares) {
    if (share.x == 0) {
      return Error(E_INVALID_SHARE, "Share id 0 is not a valid evaluation point");
    }
    if (!seen.insert(share.x).second) {
      return Error(E_INVALID_SHARE,
                   "Duplicate share id " + std::to_string(share.x));
    }
    if (share.y.size() != secretSize) {
      return Error(E_INVALID_SHARE, "Share " + std::to_string(share.x) +
                                        " has length " +
                                        std::to_string(share.y.size()) +
                                        ", expected " +
                                        std::to_string(secretSize));
    }
  }

  // Basis values at x = 0 depend only on the ids, compute them once
  std::vector<uint8_t> basis(shares.size(), 1);
  for (size_t i = 0; i < shares.size(); ++i) {
    for (size_t j = 0; j < shares.size(); ++j) {
      if (i != j) {
        uint8_t num = shares[j].x;
        uint8_t den = GF256::sub(shares[i].x, shares[j].x);
        basis[i] = GF256::mul(basis[i], GF256::div(num, den));
      }
    }
  }

  std::vector<uint8_t> secret(secretSize, 0);
  for (size_t byteIdx = 0; byteIdx < secretSize; ++byteIdx) {
    uint8_t value = 0;
    for (size_t i = 0; i < shares.size(); ++i) {
      value = GF256::add(value, GF256::mul(shares[i].y[byteIdx], basis[i]));
    }
    secret[byteIdx] = value;
  }

  log().debug << "Combined " << shares.size() << " shares into "
              << secretSize << "-byte secret";
  return secret;
}

std::string SecretSharing::encodeShare(const Share &share) {
  std::ostringstream oss;
  oss << SHARD_PREFIX << std::setw(2) << std::setfill('0')
      << static_cast<int>(share.x) << ':' << utl::hexEncode(share.y);
  return oss.str();
}

SecretSharing::Roe<SecretSharing::Share>
SecretSharing::decodeShare(const std::string &encoded) {
  const std::string prefix(SHARD_PREFIX);
  if (encoded.size() <= prefix.size()) {
    return Error(E_INVALID_SHARE_FORMAT, "Invalid share format: too short");
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(encoded[i])) != prefix[i]) {
      return Error(E_INVALID_SHARE_FORMAT,
                   "Invalid share format: missing " + prefix + " prefix");
    }
  }

  size_t colon = encoded.find(':', prefix.size());
  if (colon == std::string::npos) {
    return Error(E_INVALID_SHARE_FORMAT, "Invalid share format: missing ':'");
  }

  std::string idText = encoded.substr(prefix.size(), colon - prefix.size());
  if (idText.empty()) {
    return Error(E_INVALID_SHARE_FORMAT, "Invalid share format: missing id");
  }
  for (char c : idText) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return Error(E_INVALID_SHARE_FORMAT,
                   "Invalid share format: id '" + idText + "' is not a number");
    }
  }
  uint64_t id = 0;
  if (!utl::parseUInt64(idText, id) || id < 1 ||
      id > static_cast<uint64_t>(MAX_SHARES)) {
    return Error(E_INVALID_SHARE_FORMAT,
                 "Invalid share format: id " + idText + " out of range");
  }

  std::string hex = encoded.substr(colon + 1);
  Share share;
  share.x = static_cast<uint8_t>(id);
  if (hex.empty() || !utl::hexDecode(hex, share.y)) {
    return Error(E_INVALID_SHARE_FORMAT,
                 "Invalid share format: payload is not hex");
  }
  return share;
}

SecretSharing::Roe<std::vector<std::string>>
SecretSharing::splitToShards(const std::vector<uint8_t> &secret, int n,
                             int k) const {
  auto sharesResult = split(secret, n, k);
  if (!sharesResult) {
    return sharesResult.error();
  }
  std::vector<std::string> shards;
  shards.reserve(sharesResult->size());
  for (const auto &share : sharesResult.value()) {
    shards.push_back(encodeShare(share));
  }
  return shards;
}

SecretSharing::Roe<std::vector<uint8_t>>
SecretSharing::combineShards(const std::vector<std::string> &shards) const {
  std::vector<Share> shares;
  shares.reserve(shards.size());
  for (const auto &shard : shards) {
    auto decoded = decodeShare(shard);
    if (!decoded) {
      log().warning << "Rejected shard: " << decoded.error().message;
      return decoded.error();
    }
    shares.push_back(std::move(decoded.value()));
  }
  return combine(shares);
}

} // namespace crypto
} // namespace vl
