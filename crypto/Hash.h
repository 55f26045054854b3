#ifndef VOTE_LEDGER_HASH_H
#define VOTE_LEDGER_HASH_H

#include <cstdint>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace vl {
namespace crypto {

constexpr size_t SHA256_DIGEST_SIZE = 32;
constexpr size_t SHA256_HEX_SIZE = 2 * SHA256_DIGEST_SIZE;

/**
 * Incremental SHA-256 over OpenSSL EVP.
 *
 * The digest context is released when the object goes out of scope.
 * Backend failures throw std::runtime_error; they indicate a broken crypto
 * library rather than bad input.
 */
class Sha256 {
public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256 &) = delete;
  Sha256 &operator=(const Sha256 &) = delete;

  Sha256 &update(const std::string &data);
  Sha256 &update(const std::vector<uint8_t> &data);
  Sha256 &update(const void *data, size_t size);

  /** Finish and return the raw 32-byte digest. The object cannot be reused. */
  std::vector<uint8_t> finalBytes();

  /** Finish and return the digest as 64 lowercase hex chars. */
  std::string finalHex();

private:
  evp_md_ctx_st *ctx_;
  bool finalized_{false};
};

/**
 * SHA-256 of a text or byte string as lowercase hex
 */
std::string sha256(const std::string &input);
std::string sha256(const std::vector<uint8_t> &input);

/**
 * SHA-256 of a text or byte string as raw bytes
 */
std::vector<uint8_t> sha256Bytes(const std::string &input);

} // namespace crypto
} // namespace vl

#endif // VOTE_LEDGER_HASH_H
