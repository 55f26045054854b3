#ifndef VOTE_LEDGER_CONFIG_H
#define VOTE_LEDGER_CONFIG_H

#include "VoteLedger.h"
#include "../lib/Logger.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace vl {

/**
 * Runtime configuration, read from a JSON file. Every key is optional:
 *
 * {
 *   "difficulty": 4,
 *   "maxAttempts": 5000000,
 *   "yieldInterval": 100,
 *   "shares": { "total": 5, "threshold": 3 },
 *   "voterSalt": "ELECTORAL_SALT_2024",
 *   "logLevel": "INFO",
 *   "logFile": ""
 * }
 */
struct Config {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG_FILE = 1;  // missing or unparsable file
  constexpr static int32_t E_CONFIG_TYPE = 2;  // key has the wrong JSON type
  constexpr static int32_t E_CONFIG_RANGE = 3; // value out of range
  constexpr static int32_t E_CONFIG_LOG_FILE = 4; // logFile cannot be opened

  uint32_t difficulty{4};
  uint64_t maxAttempts{5000000};
  uint64_t yieldInterval{100};
  int shareTotal{5};
  int shareThreshold{3};
  std::string voterSalt{"ELECTORAL_SALT_2024"};
  logging::Level logLevel{logging::Level::INFO};
  std::string logFile;

  static Roe<Config> fromJson(const nlohmann::json &json);
  static Roe<Config> load(const std::string &path);

  /**
   * Apply logLevel (DEBUG when debug is set) and logFile to the root logger.
   * The level is left unchanged when the log file cannot be opened.
   */
  Roe<void> configureLogging(bool debug) const;

  VoteLedger::Config toLedgerConfig() const;
  nlohmann::json toJson() const;
};

std::ostream &operator<<(std::ostream &os, const Config &config);

} // namespace vl

#endif // VOTE_LEDGER_CONFIG_H
