#ifndef VOTE_LEDGER_SECRET_SHARING_H
#define VOTE_LEDGER_SECRET_SHARING_H

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vl {
namespace crypto {

/**
 * SecretSharing - Shamir k-of-n threshold sharing over GF(256)
 *
 * Every byte of the secret gets its own random polynomial of degree k-1 with
 * the byte as constant term. Share x holds the evaluations at x for all byte
 * positions, so a share is as long as the secret.
 *
 * Any k shares reconstruct the secret; fewer than k reveal nothing about it.
 * Combining fewer than the real threshold cannot be detected and yields an
 * unrelated value.
 *
 * Shard text format: "SHARD-<x, two digits>:<hex of y>", e.g. "SHARD-03:9f1c..."
 */
class SecretSharing : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INVALID_THRESHOLD = 1;    // k < 2, k > n or n > 255
  constexpr static int32_t E_INSUFFICIENT_SHARES = 2;  // fewer than 2 shares
  constexpr static int32_t E_INVALID_SHARE = 3;        // x == 0, duplicate x, length mismatch
  constexpr static int32_t E_INVALID_SHARE_FORMAT = 4; // malformed shard text

  constexpr static int MAX_SHARES = 255;
  constexpr static const char *SHARD_PREFIX = "SHARD-";

  struct Share {
    uint8_t x{0};
    std::vector<uint8_t> y;

    bool operator==(const Share &other) const {
      return x == other.x && y == other.y;
    }
  };

  SecretSharing();
  ~SecretSharing() override = default;

  /**
   * Split a secret into n shares, any k of which recover it.
   * @return n shares with x = 1..n, or E_INVALID_THRESHOLD
   */
  Roe<std::vector<Share>> split(const std::vector<uint8_t> &secret, int n,
                                int k) const;

  /**
   * Lagrange-interpolate the shares at x = 0.
   * @return the secret, E_INSUFFICIENT_SHARES or E_INVALID_SHARE
   */
  Roe<std::vector<uint8_t>> combine(const std::vector<Share> &shares) const;

  static std::string encodeShare(const Share &share);
  static Roe<Share> decodeShare(const std::string &encoded);

  /** split() followed by encodeShare() on every share */
  Roe<std::vector<std::string>> splitToShards(const std::vector<uint8_t> &secret,
                                              int n, int k) const;

  /** decodeShare() on every shard followed by combine() */
  Roe<std::vector<uint8_t>>
  combineShards(const std::vector<std::string> &shards) const;
};

} // namespace crypto
} // namespace vl

#endif // VOTE_LEDGER_SECRET_SHARING_H
