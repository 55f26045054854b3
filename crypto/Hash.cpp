#include "Hash.h"
#include "../lib/Utilities.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace vl {
namespace crypto {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

Sha256::~Sha256() { EVP_MD_CTX_free(ctx_); }

Sha256 &Sha256::update(const void *data, size_t size) {
  if (finalized_) {
    throw std::runtime_error("Sha256::update after final");
  }
  if (size > 0 && EVP_DigestUpdate(ctx_, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

Sha256 &Sha256::update(const std::string &data) {
  return update(data.data(), data.size());
}

Sha256 &Sha256::update(const std::vector<uint8_t> &data) {
  return update(data.data(), data.size());
}

std::vector<uint8_t> Sha256::finalBytes() {
  if (finalized_) {
    throw std::runtime_error("Sha256::final called twice");
  }
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;
  if (EVP_DigestFinal_ex(ctx_, hash, &hashLen) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  finalized_ = true;
  return std::vector<uint8_t>(hash, hash + hashLen);
}

std::string Sha256::finalHex() { return utl::hexEncode(finalBytes()); }

std::string sha256(const std::string &input) {
  return Sha256().update(input).finalHex();
}

std::string sha256(const std::vector<uint8_t> &input) {
  return Sha256().update(input).finalHex();
}

std::vector<uint8_t> sha256Bytes(const std::string &input) {
  return Sha256().update(input).finalBytes();
}

} // namespace crypto
} // namespace vl
