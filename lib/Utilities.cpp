#include "Utilities.h"

#include <charconv>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace vl {
namespace utl {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::tm toUtc(int64_t unixMs) {
  // floor division keeps pre-epoch milliseconds on the right second
  int64_t seconds = unixMs / 1000;
  if (unixMs % 1000 < 0) {
    --seconds;
  }
  time_t t = static_cast<time_t>(seconds);
  std::tm utc{};
  gmtime_r(&t, &utc);
  return utc;
}

} // namespace

int64_t getCurrentTimeMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string formatIsoTimestamp(int64_t unixMs) {
  std::tm utc = toUtc(unixMs);
  int64_t ms = unixMs % 1000;
  if (ms < 0) {
    ms += 1000;
  }
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << ms << 'Z';
  return oss.str();
}

std::string formatIsoDate(int64_t unixMs) {
  std::tm utc = toUtc(unixMs);
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%d");
  return oss.str();
}

bool parseUInt64(const std::string &str, uint64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

std::string hexEncode(const std::vector<uint8_t> &data) {
  std::stringstream ss;
  for (uint8_t b : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return ss.str();
}

bool hexDecode(const std::string &hex, std::vector<uint8_t> &out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  std::vector<uint8_t> bytes;
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hexValue(hex[i]);
    int lo = hexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  out = std::move(bytes);
  return true;
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "Configuration file not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(2, "Failed to open configuration file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }
  return json;
}

Roe<void> writeToNewFile(const std::string &filePath, const std::string &content) {
  if (std::filesystem::exists(filePath)) {
    return Error(1, "File already exists: " + filePath);
  }

  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(2, "Failed to create parent directories for " + filePath +
                          ": " + ec.message());
    }
  }

  std::ofstream file(filePath, std::ios::binary);
  if (!file) {
    return Error(3, "Failed to open file for writing: " + filePath);
  }
  file << content;
  if (!file) {
    return Error(4, "Failed to write file: " + filePath);
  }
  return {};
}

} // namespace utl
} // namespace vl
