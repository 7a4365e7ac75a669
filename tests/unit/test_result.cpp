/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace archetype;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorCarriesCode) {
    Result<int> r = Error{ErrorCode::NotFound, "Model not found: abc"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(r.error().message, "Model not found: abc");
}

TEST(ResultTest, MessageOnlyErrorIsInternal) {
    Result<int> r = Error{"boom"};
    EXPECT_EQ(r.error().code, ErrorCode::Internal);
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{ErrorCode::InvalidState, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().code, ErrorCode::InvalidState);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 4;
    auto half = r.and_then([](int v) -> Result<int> {
        if (v % 2 != 0) return Error{ErrorCode::InvalidArgument, "odd"};
        return v / 2;
    });
    ASSERT_TRUE(half.has_value());
    EXPECT_EQ(*half, 2);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error{ErrorCode::Io, "disk"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::Io);
}

TEST(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(to_string(ErrorCode::PreferenceUnsatisfiable), "PreferenceUnsatisfiable");
    EXPECT_EQ(to_string(ErrorCode::UnsupportedFormat), "UnsupportedFormat");
}
