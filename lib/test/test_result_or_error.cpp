#include "ResultOrError.hpp"
#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace {

struct TestError : vl::RoeErrorBase {
  using vl::RoeErrorBase::RoeErrorBase;
};

template <typename T> using TestRoe = vl::ResultOrError<T, TestError>;

TestRoe<int> parsePositive(int value) {
  if (value <= 0) {
    return TestError(7, "not positive");
  }
  return value;
}

TestRoe<void> checkEven(int value) {
  if (value % 2 != 0) {
    return TestError(3, "odd");
  }
  return {};
}

} // namespace

TEST(ResultOrErrorTest, HoldsValue) {
  auto result = parsePositive(5);
  EXPECT_TRUE(result.isOk());
  EXPECT_FALSE(result.isError());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result.value(), 5);
  EXPECT_EQ(*result, 5);
  EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultOrErrorTest, HoldsError) {
  auto result = parsePositive(-1);
  EXPECT_FALSE(result);
  EXPECT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 7);
  EXPECT_EQ(result.error().message, "not positive");
  EXPECT_EQ(result.valueOr(42), 42);
  EXPECT_THROW(result.value(), std::runtime_error);
}

TEST(ResultOrErrorTest, StaticErrorFactory) {
  auto result = TestRoe<std::string>::error(TestError(1, "boom"));
  EXPECT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 1);
}

TEST(ResultOrErrorTest, ArrowAccessesMembers) {
  TestRoe<std::string> result(std::string("ledger"));
  EXPECT_EQ(result->size(), 6u);
}

TEST(ResultOrErrorTest, VoidSpecialization) {
  EXPECT_TRUE(checkEven(4).isOk());
  auto result = checkEven(3);
  EXPECT_TRUE(result.isError());
  EXPECT_EQ(result.error().message, "odd");
}

TEST(ResultOrErrorTest, MessageOnlyErrorHasDefaultCode) {
  TestError err("plain message");
  EXPECT_EQ(err.code, -1);

  std::ostringstream oss;
  oss << TestError(4, "bad share");
  EXPECT_EQ(oss.str(), "Error(4): bad share");
}
