#include "Config.h"
#include "ProofOfWork.h"
#include "../crypto/SecretSharing.h"
#include "../lib/Utilities.h"

#include <stdexcept>

namespace vl {

namespace {

Config::Error typeError(const std::string &key, const std::string &expected) {
  return Config::Error(Config::E_CONFIG_TYPE,
                       "Config key '" + key + "' must be " + expected);
}

Config::Error rangeError(const std::string &key, const std::string &detail) {
  return Config::Error(Config::E_CONFIG_RANGE,
                       "Config key '" + key + "' " + detail);
}

// Reads an optional unsigned integer key into value
Config::Roe<void> readUnsigned(const nlohmann::json &json, const std::string &key,
                               uint64_t &value) {
  if (!json.contains(key)) {
    return {};
  }
  const auto &node = json[key];
  if (!node.is_number_integer()) {
    return typeError(key, "a non-negative integer");
  }
  if (node.is_number_unsigned()) {
    value = node.get<uint64_t>();
    return {};
  }
  int64_t signedValue = node.get<int64_t>();
  if (signedValue < 0) {
    return typeError(key, "a non-negative integer");
  }
  value = static_cast<uint64_t>(signedValue);
  return {};
}

Config::Roe<void> readString(const nlohmann::json &json, const std::string &key,
                             std::string &value) {
  if (!json.contains(key)) {
    return {};
  }
  if (!json[key].is_string()) {
    return typeError(key, "a string");
  }
  value = json[key].get<std::string>();
  return {};
}

} // namespace

Config::Roe<Config> Config::fromJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    return Error(E_CONFIG_TYPE, "Configuration must be a JSON object");
  }

  Config config;

  uint64_t difficulty = config.difficulty;
  auto result = readUnsigned(json, "difficulty", difficulty);
  if (!result) {
    return result.error();
  }
  if (difficulty > ProofOfWork::MAX_DIFFICULTY) {
    return rangeError("difficulty", "must not exceed " +
                                        std::to_string(ProofOfWork::MAX_DIFFICULTY));
  }
  config.difficulty = static_cast<uint32_t>(difficulty);

  result = readUnsigned(json, "maxAttempts", config.maxAttempts);
  if (!result) {
    return result.error();
  }
  if (config.maxAttempts == 0) {
    return rangeError("maxAttempts", "must be positive");
  }

  result = readUnsigned(json, "yieldInterval", config.yieldInterval);
  if (!result) {
    return result.error();
  }

  if (json.contains("shares")) {
    const auto &shares = json["shares"];
    if (!shares.is_object()) {
      return typeError("shares", "an object");
    }
    uint64_t total = static_cast<uint64_t>(config.shareTotal);
    uint64_t threshold = static_cast<uint64_t>(config.shareThreshold);
    result = readUnsigned(shares, "total", total);
    if (!result) {
      return result.error();
    }
    result = readUnsigned(shares, "threshold", threshold);
    if (!result) {
      return result.error();
    }
    if (total > static_cast<uint64_t>(crypto::SecretSharing::MAX_SHARES)) {
      return rangeError("shares.total",
                        "must not exceed " +
                            std::to_string(crypto::SecretSharing::MAX_SHARES));
    }
    if (threshold < 2 || threshold > total) {
      return rangeError("shares.threshold",
                        "must be between 2 and shares.total");
    }
    config.shareTotal = static_cast<int>(total);
    config.shareThreshold = static_cast<int>(threshold);
  }

  result = readString(json, "voterSalt", config.voterSalt);
  if (!result) {
    return result.error();
  }

  std::string levelName;
  result = readString(json, "logLevel", levelName);
  if (!result) {
    return result.error();
  }
  if (!levelName.empty() && !logging::parseLevel(levelName, config.logLevel)) {
    return rangeError("logLevel", "has unknown level '" + levelName + "'");
  }

  result = readString(json, "logFile", config.logFile);
  if (!result) {
    return result.error();
  }

  return config;
}

Config::Roe<Config> Config::load(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    return Error(E_CONFIG_FILE, jsonResult.error().message);
  }
  return fromJson(jsonResult.value());
}

Config::Roe<void> Config::configureLogging(bool debug) const {
  auto root = logging::getRootLogger();
  if (!logFile.empty()) {
    try {
      root.addFileHandler(logFile, logging::Level::DEBUG);
    } catch (const std::runtime_error &e) {
      return Error(E_CONFIG_LOG_FILE, e.what());
    }
  }
  root.setLevel(debug ? logging::Level::DEBUG : logLevel);
  return {};
}

VoteLedger::Config Config::toLedgerConfig() const {
  VoteLedger::Config ledgerConfig;
  ledgerConfig.difficulty = difficulty;
  ledgerConfig.pow.maxAttempts = maxAttempts;
  ledgerConfig.pow.yieldInterval = yieldInterval;
  return ledgerConfig;
}

nlohmann::json Config::toJson() const {
  nlohmann::json j;
  j["difficulty"] = difficulty;
  j["maxAttempts"] = maxAttempts;
  j["yieldInterval"] = yieldInterval;
  j["shares"] = {{"total", shareTotal}, {"threshold", shareThreshold}};
  j["voterSalt"] = voterSalt;
  j["logLevel"] = logging::levelToString(logLevel);
  j["logFile"] = logFile;
  return j;
}

std::ostream &operator<<(std::ostream &os, const Config &config) {
  os << "Config{difficulty: " << config.difficulty
     << ", maxAttempts: " << config.maxAttempts
     << ", yieldInterval: " << config.yieldInterval
     << ", shares: " << config.shareThreshold << "-of-" << config.shareTotal
     << ", logLevel: " << logging::levelToString(config.logLevel) << "}";
  return os;
}

} // namespace vl
