#include "Utilities.h"
#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

namespace vl {
namespace utl {

// Time formatting tests
TEST(TimeFormatTest, IsoTimestampOfKnownInstant) {
  EXPECT_EQ(formatIsoTimestamp(1700000000000), "2023-11-14T22:13:20.000Z");
  EXPECT_EQ(formatIsoTimestamp(1700000000123), "2023-11-14T22:13:20.123Z");
  EXPECT_EQ(formatIsoTimestamp(0), "1970-01-01T00:00:00.000Z");
}

TEST(TimeFormatTest, IsoDateOfKnownInstant) {
  EXPECT_EQ(formatIsoDate(1700000000000), "2023-11-14");
}

TEST(TimeFormatTest, CurrentTimeIsAfter2023) {
  EXPECT_GT(getCurrentTimeMs(), 1700000000000);
}

// Number parsing tests
TEST(ParseTest, ParseUInt64RejectsNegative) {
  uint64_t value = 0;
  EXPECT_TRUE(parseUInt64("18446744073709551615", value));
  EXPECT_EQ(value, UINT64_MAX);
  EXPECT_FALSE(parseUInt64("-1", value));
  EXPECT_FALSE(parseUInt64("18446744073709551616", value));
  EXPECT_FALSE(parseUInt64("12abc", value));
  EXPECT_FALSE(parseUInt64("", value));
}

// Hex tests
TEST(HexTest, EncodeString) {
  EXPECT_EQ(hexEncode(std::string("\x00\xff\x10", 3)), "00ff10");
  EXPECT_EQ(hexEncode(std::string()), "");
}

TEST(HexTest, EncodeBytes) {
  std::vector<uint8_t> bytes = {0xde, 0xad, 0xbe, 0xef};
  EXPECT_EQ(hexEncode(bytes), "deadbeef");
}

TEST(HexTest, DecodeAcceptsBothCases) {
  std::vector<uint8_t> out;
  EXPECT_TRUE(hexDecode("DeadBEEF", out));
  EXPECT_EQ(out, (std::vector<uint8_t>{0xde, 0xad, 0xbe, 0xef}));
}

TEST(HexTest, DecodeRejectsInvalidInput) {
  std::vector<uint8_t> out = {1, 2};
  EXPECT_FALSE(hexDecode("abc", out));
  EXPECT_FALSE(hexDecode("zz", out));
  EXPECT_FALSE(hexDecode("0g", out));
  EXPECT_EQ(out, (std::vector<uint8_t>{1, 2}));
}

TEST(HexTest, DecodeInvertsEncode) {
  std::vector<uint8_t> out;
  EXPECT_TRUE(hexDecode(hexEncode(std::string("hello")), out));
  EXPECT_EQ(std::string(out.begin(), out.end()), "hello");
}

// File tests
TEST(FileTest, LoadJsonFileMissing) {
  auto result = loadJsonFile("does-not-exist-vote-ledger.json");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 1);
}

TEST(FileTest, LoadJsonFileParsesContent) {
  const std::string path = "vote_ledger_test_config.json";
  {
    std::ofstream out(path);
    out << R"({"difficulty": 3})";
  }
  auto result = loadJsonFile(path);
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value()["difficulty"].get<int>(), 3);
  std::remove(path.c_str());
}

TEST(FileTest, LoadJsonFileRejectsMalformed) {
  const std::string path = "vote_ledger_test_bad.json";
  {
    std::ofstream out(path);
    out << "{not json";
  }
  auto result = loadJsonFile(path);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 3);
  std::remove(path.c_str());
}

TEST(FileTest, WriteToNewFileRefusesExisting) {
  std::filesystem::path dir =
      std::filesystem::temp_directory_path() / "vote_ledger_write_test";
  std::filesystem::remove_all(dir);
  std::string path = (dir / "nested" / "out.txt").string();

  auto first = writeToNewFile(path, "content");
  ASSERT_TRUE(first.isOk()) << first.error().message;

  std::ifstream in(path);
  std::string content;
  std::getline(in, content);
  EXPECT_EQ(content, "content");

  auto second = writeToNewFile(path, "other");
  ASSERT_TRUE(second.isError());
  EXPECT_EQ(second.error().code, 1);

  std::filesystem::remove_all(dir);
}

} // namespace utl
} // namespace vl
