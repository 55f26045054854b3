#include "Random.h"
#include "../lib/Utilities.h"

#include <sodium.h>

#include <stdexcept>

namespace vl {
namespace crypto {

namespace {

// sodium_init() is idempotent and thread-safe, a static keeps it to one call
void ensureSodium() {
  static const int status = sodium_init();
  if (status < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

} // namespace

void randomFill(uint8_t *buffer, size_t count) {
  ensureSodium();
  if (count > 0) {
    randombytes_buf(buffer, count);
  }
}

std::vector<uint8_t> randomBytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  randomFill(bytes.data(), bytes.size());
  return bytes;
}

std::string randomHex(size_t count) {
  return utl::hexEncode(randomBytes(count));
}

void secureZero(std::vector<uint8_t> &buffer) {
  if (!buffer.empty()) {
    sodium_memzero(buffer.data(), buffer.size());
  }
}

} // namespace crypto
} // namespace vl
