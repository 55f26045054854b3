#ifndef VOTE_LEDGER_UTILITIES_H
#define VOTE_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vl {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Current wall-clock time in milliseconds since the epoch
 */
int64_t getCurrentTimeMs();

/**
 * Format milliseconds since the epoch as ISO-8601 UTC,
 * e.g. "2023-11-14T22:13:20.000Z"
 */
std::string formatIsoTimestamp(int64_t unixMs);

/**
 * Format milliseconds since the epoch as a UTC calendar date "YYYY-MM-DD"
 */
std::string formatIsoDate(int64_t unixMs);

bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Lowercase hex, two chars per byte
 */
std::string hexEncode(const std::string &data);
std::string hexEncode(const std::vector<uint8_t> &data);

/**
 * Decode hex (either case) into bytes
 * @return false on odd length or a non-hex character
 */
bool hexDecode(const std::string &hex, std::vector<uint8_t> &out);

/**
 * Load and parse a JSON file
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Write a string to a file that must not exist yet.
 * Creates parent directories if needed.
 */
Roe<void> writeToNewFile(const std::string &filePath, const std::string &content);

} // namespace utl
} // namespace vl

#endif // VOTE_LEDGER_UTILITIES_H
