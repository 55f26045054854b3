#ifndef VOTE_LEDGER_RANDOM_H
#define VOTE_LEDGER_RANDOM_H

#include <cstdint>
#include <string>
#include <vector>

namespace vl {
namespace crypto {

/**
 * Cryptographically secure random bytes from libsodium.
 * libsodium is initialized on first use; failure to initialize throws
 * std::runtime_error.
 */
std::vector<uint8_t> randomBytes(size_t count);

/** Fill an existing buffer with secure random bytes. */
void randomFill(uint8_t *buffer, size_t count);

/** `count` random bytes rendered as 2*count lowercase hex chars. */
std::string randomHex(size_t count);

/** Overwrite a buffer with zeros in a way the compiler will not elide. */
void secureZero(std::vector<uint8_t> &buffer);

} // namespace crypto
} // namespace vl

#endif // VOTE_LEDGER_RANDOM_H
