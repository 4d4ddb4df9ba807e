#include "ResultOrError.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

struct AppError : tally::RoeErrorBase {
  using tally::RoeErrorBase::RoeErrorBase;
};

template <typename T> using AppRoe = tally::ResultOrError<T, AppError>;

AppRoe<int> divide(int a, int b) {
  if (b == 0) {
    return AppError(1, "Division by zero");
  }
  return a / b;
}

AppRoe<void> validatePositive(int value) {
  if (value <= 0) {
    return AppError(2, "Value must be positive");
  }
  return {};
}

} // namespace

TEST(ResultOrErrorTest, HoldsValue) {
  auto result = divide(10, 2);
  ASSERT_TRUE(result.isOk());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result.value(), 5);
  EXPECT_EQ(*result, 5);
}

TEST(ResultOrErrorTest, HoldsError) {
  auto result = divide(10, 0);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 1);
  EXPECT_EQ(result.error().message, "Division by zero");
  EXPECT_EQ(result.valueOr(-1), -1);
  EXPECT_THROW(result.value(), std::runtime_error);
}

TEST(ResultOrErrorTest, VoidSpecialization) {
  EXPECT_TRUE(validatePositive(3).isOk());
  auto result = validatePositive(-3);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 2);
  EXPECT_THROW(validatePositive(1).error(), std::runtime_error);
}

TEST(ResultOrErrorTest, CopyAndMovePreserveState) {
  AppRoe<std::string> ok(std::string("value"));
  AppRoe<std::string> err(AppError(7, "bad"));

  AppRoe<std::string> okCopy = ok;
  AppRoe<std::string> errMoved = std::move(err);
  EXPECT_EQ(okCopy.value(), "value");
  EXPECT_EQ(errMoved.error().code, 7);

  okCopy = errMoved;
  ASSERT_TRUE(okCopy.isError());
  EXPECT_EQ(okCopy.error().message, "bad");
}
