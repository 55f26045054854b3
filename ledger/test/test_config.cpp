#include "Config.h"
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

namespace vl {

TEST(ConfigTest, DefaultsWhenEmpty) {
  auto result = Config::fromJson(nlohmann::json::object());
  ASSERT_TRUE(result.isOk()) << result.error().message;
  const Config &config = result.value();
  EXPECT_EQ(config.difficulty, 4u);
  EXPECT_EQ(config.maxAttempts, 5000000u);
  EXPECT_EQ(config.yieldInterval, 100u);
  EXPECT_EQ(config.shareTotal, 5);
  EXPECT_EQ(config.shareThreshold, 3);
  EXPECT_EQ(config.voterSalt, "ELECTORAL_SALT_2024");
  EXPECT_EQ(config.logLevel, logging::Level::INFO);
  EXPECT_TRUE(config.logFile.empty());
}

TEST(ConfigTest, ReadsAllKeys) {
  auto json = nlohmann::json::parse(R"({
    "difficulty": 2,
    "maxAttempts": 1000,
    "yieldInterval": 0,
    "shares": { "total": 7, "threshold": 4 },
    "voterSalt": "SALT",
    "logLevel": "debug",
    "logFile": "ledger.log"
  })");
  auto result = Config::fromJson(json);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result->difficulty, 2u);
  EXPECT_EQ(result->maxAttempts, 1000u);
  EXPECT_EQ(result->yieldInterval, 0u);
  EXPECT_EQ(result->shareTotal, 7);
  EXPECT_EQ(result->shareThreshold, 4);
  EXPECT_EQ(result->voterSalt, "SALT");
  EXPECT_EQ(result->logLevel, logging::Level::DEBUG);
  EXPECT_EQ(result->logFile, "ledger.log");

  auto ledgerConfig = result->toLedgerConfig();
  EXPECT_EQ(ledgerConfig.difficulty, 2u);
  EXPECT_EQ(ledgerConfig.pow.maxAttempts, 1000u);
  EXPECT_EQ(ledgerConfig.pow.yieldInterval, 0u);
}

TEST(ConfigTest, RejectsWrongTypes) {
  const std::vector<std::string> bad = {
      R"({"difficulty": "4"})",
      R"({"difficulty": -1})",
      R"({"maxAttempts": 1.5})",
      R"({"shares": 5})",
      R"({"shares": {"total": "5"}})",
      R"({"voterSalt": 12})",
      R"({"logLevel": 1})",
      R"([1, 2])",
  };
  for (const auto &text : bad) {
    auto result = Config::fromJson(nlohmann::json::parse(text));
    ASSERT_TRUE(result.isError()) << text;
    EXPECT_EQ(result.error().code, Config::E_CONFIG_TYPE) << text;
  }
}

TEST(ConfigTest, RejectsOutOfRangeValues) {
  const std::vector<std::string> bad = {
      R"({"difficulty": 65})",
      R"({"maxAttempts": 0})",
      R"({"shares": {"total": 256, "threshold": 3}})",
      R"({"shares": {"total": 5, "threshold": 1}})",
      R"({"shares": {"total": 3, "threshold": 4}})",
      R"({"logLevel": "verbose"})",
  };
  for (const auto &text : bad) {
    auto result = Config::fromJson(nlohmann::json::parse(text));
    ASSERT_TRUE(result.isError()) << text;
    EXPECT_EQ(result.error().code, Config::E_CONFIG_RANGE) << text;
  }
}

TEST(ConfigTest, HugeUnsignedValues) {
  auto tooHard = Config::fromJson(
      nlohmann::json::parse(R"({"difficulty": 18446744073709551615})"));
  ASSERT_TRUE(tooHard.isError());
  EXPECT_EQ(tooHard.error().code, Config::E_CONFIG_RANGE);

  auto manyShares = Config::fromJson(nlohmann::json::parse(
      R"({"shares": {"total": 9223372036854775808, "threshold": 3}})"));
  ASSERT_TRUE(manyShares.isError());
  EXPECT_EQ(manyShares.error().code, Config::E_CONFIG_RANGE);

  auto attempts = Config::fromJson(
      nlohmann::json::parse(R"({"maxAttempts": 9223372036854775808})"));
  ASSERT_TRUE(attempts.isOk()) << attempts.error().message;
  EXPECT_EQ(attempts->maxAttempts, 9223372036854775808ULL);
}

TEST(ConfigTest, UnopenableLogFileIsReported) {
  const std::string path = "vote_ledger_bad_log_config.json";
  {
    std::ofstream out(path);
    out << R"({"logLevel": "ERROR", "logFile": "/nonexistent-dir/vote.log"})";
  }
  auto loaded = Config::load(path);
  std::remove(path.c_str());
  ASSERT_TRUE(loaded.isOk()) << loaded.error().message;

  auto root = logging::getRootLogger();
  const logging::Level before = root.getLevel();

  Config::Roe<void> result;
  EXPECT_NO_THROW(result = loaded->configureLogging(false));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Config::E_CONFIG_LOG_FILE);
  EXPECT_NE(result.error().message.find("/nonexistent-dir/vote.log"),
            std::string::npos);
  EXPECT_EQ(root.getLevel(), before);
}

TEST(ConfigTest, ConfigureLoggingSetsRootLevel) {
  auto root = logging::getRootLogger();
  const logging::Level before = root.getLevel();

  Config config;
  config.logLevel = logging::Level::WARNING;
  ASSERT_TRUE(config.configureLogging(false).isOk());
  EXPECT_EQ(root.getLevel(), logging::Level::WARNING);

  ASSERT_TRUE(config.configureLogging(true).isOk());
  EXPECT_EQ(root.getLevel(), logging::Level::DEBUG);

  root.setLevel(before);
}

TEST(ConfigTest, ErrorNamesOffendingKey) {
  auto result = Config::fromJson(nlohmann::json::parse(R"({"difficulty": 99})"));
  ASSERT_TRUE(result.isError());
  EXPECT_NE(result.error().message.find("difficulty"), std::string::npos);
}

TEST(ConfigTest, LoadFromFile) {
  const std::string path = "vote_ledger_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"difficulty": 3, "logLevel": "WARNING"})";
  }
  auto result = Config::load(path);
  std::remove(path.c_str());

  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result->difficulty, 3u);
  EXPECT_EQ(result->logLevel, logging::Level::WARNING);
}

TEST(ConfigTest, LoadMissingFile) {
  auto result = Config::load("no-such-vote-ledger-config.json");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Config::E_CONFIG_FILE);
}

TEST(ConfigTest, ToJsonReadsBack) {
  Config config;
  config.difficulty = 5;
  config.shareTotal = 9;
  config.shareThreshold = 6;
  auto result = Config::fromJson(config.toJson());
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result->difficulty, 5u);
  EXPECT_EQ(result->shareTotal, 9);
  EXPECT_EQ(result->shareThreshold, 6);
}

} // namespace vl
