#include "ResultOrError.hpp"
#include <gtest/gtest.h>

#include <string>

namespace {

struct TestError : dpos::RoeErrorBase {
  using dpos::RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = dpos::ResultOrError<T, TestError>;

Roe<int> parsePositive(int value) {
  if (value <= 0) {
    return TestError(3, "not positive");
  }
  return value;
}

Roe<void> check(bool ok) {
  if (!ok) {
    return TestError(5, "failed");
  }
  return {};
}

} // namespace

TEST(ResultOrErrorTest, HoldsValue) {
  auto result = parsePositive(4);
  ASSERT_TRUE(result.isOk());
  EXPECT_FALSE(result.isError());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result.value(), 4);
  EXPECT_EQ(*result, 4);
}

TEST(ResultOrErrorTest, HoldsError) {
  auto result = parsePositive(-1);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 3);
  EXPECT_EQ(result.error().message, "not positive");
  EXPECT_EQ(result.valueOr(9), 9);
}

TEST(ResultOrErrorTest, AccessingWrongAlternativeThrows) {
  auto bad = parsePositive(0);
  EXPECT_THROW(bad.value(), std::runtime_error);

  auto good = parsePositive(1);
  EXPECT_THROW(good.error(), std::runtime_error);
}

TEST(ResultOrErrorTest, ArrowReachesMembers) {
  Roe<std::string> result = std::string("ledger");
  EXPECT_EQ(result->size(), 6u);
}

TEST(ResultOrErrorTest, VoidDefaultsToSuccess) {
  EXPECT_TRUE(check(true).isOk());
  auto failed = check(false);
  ASSERT_TRUE(failed.isError());
  EXPECT_EQ(failed.error().code, 5);
}

TEST(ResultOrErrorTest, MessageOnlyErrorHasDefaultCode) {
  TestError error("plain");
  EXPECT_EQ(error.code, -1);
  EXPECT_EQ(error.message, "plain");
}
