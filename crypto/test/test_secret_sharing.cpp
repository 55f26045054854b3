#include "SecretSharing.h"
#include "Random.h"
#include <gtest/gtest.h>

#include <algorithm>

namespace vl {
namespace crypto {

namespace {

// All index combinations of size k out of n
std::vector<std::vector<size_t>> combinations(size_t n, size_t k) {
  std::vector<std::vector<size_t>> result;
  std::vector<bool> mask(n, false);
  std::fill(mask.begin(), mask.begin() + static_cast<long>(k), true);
  do {
    std::vector<size_t> pick;
    for (size_t i = 0; i < n; ++i) {
      if (mask[i]) {
        pick.push_back(i);
      }
    }
    result.push_back(pick);
  } while (std::prev_permutation(mask.begin(), mask.end()));
  return result;
}

std::vector<SecretSharing::Share>
pickShares(const std::vector<SecretSharing::Share> &shares,
       const std::vector<size_t> &indices) {
  std::vector<SecretSharing::Share> picked;
  for (size_t i : indices) {
    picked.push_back(shares[i]);
  }
  return picked;
}

} // namespace

class SecretSharingTest : public ::testing::Test {
protected:
  SecretSharing sharing_;
};

TEST_F(SecretSharingTest, SplitProducesSequentialShares) {
  std::vector<uint8_t> secret = randomBytes(32);
  auto result = sharing_.split(secret, 5, 3);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  ASSERT_EQ(result->size(), 5u);
  for (size_t i = 0; i < 5; ++i) {
    EXPECT_EQ(result.value()[i].x, i + 1);
    EXPECT_EQ(result.value()[i].y.size(), 32u);
  }
}

TEST_F(SecretSharingTest, AnyThresholdSubsetRecoversSecret) {
  std::vector<uint8_t> secret = randomBytes(32);
  auto shares = sharing_.split(secret, 5, 3);
  ASSERT_TRUE(shares.isOk());

  for (size_t k = 3; k <= 5; ++k) {
    for (const auto &pick : combinations(5, k)) {
      auto combined = sharing_.combine(pickShares(shares.value(), pick));
      ASSERT_TRUE(combined.isOk()) << combined.error().message;
      EXPECT_EQ(combined.value(), secret);
    }
  }
}

TEST_F(SecretSharingTest, OrderOfSharesDoesNotMatter) {
  std::vector<uint8_t> secret = {0x00, 0x01, 0xfe, 0xff};
  auto shares = sharing_.split(secret, 4, 2);
  ASSERT_TRUE(shares.isOk());

  auto picked = pickShares(shares.value(), {3, 0});
  auto combined = sharing_.combine(picked);
  ASSERT_TRUE(combined.isOk());
  EXPECT_EQ(combined.value(), secret);
}

TEST_F(SecretSharingTest, BelowThresholdDoesNotRecoverSecret) {
  std::vector<uint8_t> secret = randomBytes(32);
  auto shares = sharing_.split(secret, 5, 3);
  ASSERT_TRUE(shares.isOk());

  for (const auto &pick : combinations(5, 2)) {
    auto combined = sharing_.combine(pickShares(shares.value(), pick));
    ASSERT_TRUE(combined.isOk());
    EXPECT_NE(combined.value(), secret);
  }
}

TEST_F(SecretSharingTest, EmptySecretSplitsToEmptyShares) {
  auto shares = sharing_.split({}, 3, 2);
  ASSERT_TRUE(shares.isOk());
  for (const auto &share : shares.value()) {
    EXPECT_TRUE(share.y.empty());
  }
  auto combined = sharing_.combine(pickShares(shares.value(), {0, 2}));
  ASSERT_TRUE(combined.isOk());
  EXPECT_TRUE(combined->empty());
}

TEST_F(SecretSharingTest, MaximumShareCount) {
  std::vector<uint8_t> secret = {0x42, 0x17};
  auto shares = sharing_.split(secret, 255, 2);
  ASSERT_TRUE(shares.isOk());
  EXPECT_EQ(shares.value().back().x, 255);

  auto combined = sharing_.combine(pickShares(shares.value(), {0, 254}));
  ASSERT_TRUE(combined.isOk());
  EXPECT_EQ(combined.value(), secret);
}

TEST_F(SecretSharingTest, InvalidThresholdIsRejected) {
  std::vector<uint8_t> secret = {1, 2, 3};
  auto tooLow = sharing_.split(secret, 5, 1);
  ASSERT_TRUE(tooLow.isError());
  EXPECT_EQ(tooLow.error().code, SecretSharing::E_INVALID_THRESHOLD);

  auto aboveTotal = sharing_.split(secret, 3, 4);
  ASSERT_TRUE(aboveTotal.isError());
  EXPECT_EQ(aboveTotal.error().code, SecretSharing::E_INVALID_THRESHOLD);

  auto tooMany = sharing_.split(secret, 256, 3);
  ASSERT_TRUE(tooMany.isError());
  EXPECT_EQ(tooMany.error().code, SecretSharing::E_INVALID_THRESHOLD);
}

TEST_F(SecretSharingTest, CombineNeedsTwoShares) {
  auto none = sharing_.combine({});
  ASSERT_TRUE(none.isError());
  EXPECT_EQ(none.error().code, SecretSharing::E_INSUFFICIENT_SHARES);

  SecretSharing::Share one{1, {0xaa}};
  auto single = sharing_.combine({one});
  ASSERT_TRUE(single.isError());
  EXPECT_EQ(single.error().code, SecretSharing::E_INSUFFICIENT_SHARES);
}

TEST_F(SecretSharingTest, CombineRejectsMalformedShares) {
  SecretSharing::Share a{1, {0x01, 0x02}};
  SecretSharing::Share b{2, {0x03, 0x04}};
  SecretSharing::Share zero{0, {0x05, 0x06}};
  SecretSharing::Share duplicate{1, {0x07, 0x08}};
  SecretSharing::Share shortShare{3, {0x09}};

  auto withZero = sharing_.combine({a, zero});
  ASSERT_TRUE(withZero.isError());
  EXPECT_EQ(withZero.error().code, SecretSharing::E_INVALID_SHARE);

  auto withDuplicate = sharing_.combine({a, b, duplicate});
  ASSERT_TRUE(withDuplicate.isError());
  EXPECT_EQ(withDuplicate.error().code, SecretSharing::E_INVALID_SHARE);

  auto withShort = sharing_.combine({a, shortShare});
  ASSERT_TRUE(withShort.isError());
  EXPECT_EQ(withShort.error().code, SecretSharing::E_INVALID_SHARE);
}

TEST(ShardCodecTest, EncodeUsesTwoDigitId) {
  SecretSharing::Share share{3, {0x9f, 0x1c}};
  EXPECT_EQ(SecretSharing::encodeShare(share), "SHARD-03:9f1c");

  SecretSharing::Share big{200, {0x00}};
  EXPECT_EQ(SecretSharing::encodeShare(big), "SHARD-200:00");
}

TEST(ShardCodecTest, DecodeInvertsEncode) {
  SecretSharing::Share share{7, {0xde, 0xad, 0xbe, 0xef}};
  auto decoded = SecretSharing::decodeShare(SecretSharing::encodeShare(share));
  ASSERT_TRUE(decoded.isOk()) << decoded.error().message;
  EXPECT_EQ(decoded.value(), share);
}

TEST(ShardCodecTest, DecodeAcceptsCaseVariants) {
  auto decoded = SecretSharing::decodeShare("shard-3:ABCD");
  ASSERT_TRUE(decoded.isOk());
  EXPECT_EQ(decoded->x, 3);
  EXPECT_EQ(decoded->y, (std::vector<uint8_t>{0xab, 0xcd}));
}

TEST(ShardCodecTest, DecodeRejectsMalformedText) {
  const std::vector<std::string> bad = {
      "",
      "SHARD-",
      "SHARE-01:abcd",
      "SHARD-01abcd",
      "SHARD-:abcd",
      "SHARD-x1:abcd",
      "SHARD-00:abcd",
      "SHARD-256:abcd",
      "SHARD-01:",
      "SHARD-01:abc",
      "SHARD-01:zz",
  };
  for (const auto &text : bad) {
    auto decoded = SecretSharing::decodeShare(text);
    ASSERT_TRUE(decoded.isError()) << "accepted: " << text;
    EXPECT_EQ(decoded.error().code, SecretSharing::E_INVALID_SHARE_FORMAT)
        << text;
  }
}

TEST_F(SecretSharingTest, ShardsRecoverKeyMaterial) {
  std::vector<uint8_t> key = randomBytes(32);
  auto shards = sharing_.splitToShards(key, 5, 3);
  ASSERT_TRUE(shards.isOk());
  ASSERT_EQ(shards->size(), 5u);
  EXPECT_EQ(shards.value()[0].rfind("SHARD-01:", 0), 0u);

  std::vector<std::string> picked = {shards.value()[4], shards.value()[1],
                                     shards.value()[2]};
  auto recovered = sharing_.combineShards(picked);
  ASSERT_TRUE(recovered.isOk()) << recovered.error().message;
  EXPECT_EQ(recovered.value(), key);
}

TEST_F(SecretSharingTest, CombineShardsReportsFormatError) {
  auto recovered = sharing_.combineShards({"SHARD-01:abcd", "garbage"});
  ASSERT_TRUE(recovered.isError());
  EXPECT_EQ(recovered.error().code, SecretSharing::E_INVALID_SHARE_FORMAT);
}

TEST_F(SecretSharingTest, SplitToShardsPropagatesThresholdError) {
  auto shards = sharing_.splitToShards({1}, 2, 3);
  ASSERT_TRUE(shards.isError());
  EXPECT_EQ(shards.error().code, SecretSharing::E_INVALID_THRESHOLD);
}

} // namespace crypto
} // namespace vl
