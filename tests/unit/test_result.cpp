/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 * @author CodeVerdict contributors
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace code_verdict;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorCode::Sandbox, "fork failed"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Sandbox);
    EXPECT_EQ(r.error().message, "fork failed");
}

TEST(ResultTest, MessageOnlyErrorIsInternal) {
    Result<int> r = Error{"something went wrong"};
    EXPECT_EQ(r.error().code, ErrorCode::Internal);
}

TEST(ResultTest, DescribeIncludesCode) {
    Error err{ErrorCode::Config, "bad value"};
    EXPECT_EQ(err.describe(), "config: bad value");
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{"fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> failure = Error{"fail"};
    EXPECT_THROW((void)failure.value(), std::runtime_error);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{ErrorCode::Io, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
    EXPECT_EQ(doubled.error().code, ErrorCode::Io);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 5;
    auto halved = r.and_then([](int v) -> Result<int> {
        if (v % 2 != 0) return Error{ErrorCode::Internal, "odd"};
        return v / 2;
    });
    ASSERT_FALSE(halved.has_value());
    EXPECT_EQ(halved.error().message, "odd");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> failed = Error{ErrorCode::Cancelled, "stopped"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::Cancelled);
}
