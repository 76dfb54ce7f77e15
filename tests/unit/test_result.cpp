/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the error vocabulary.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace edge_sentinel;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorCode::Io, "disk on fire"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Io);
    EXPECT_EQ(r.error().message, "disk on fire");
}

TEST(ResultTest, MessageOnlyErrorIsInternal) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Internal);
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

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{ErrorCode::Timeout, "slow"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().code, ErrorCode::Timeout);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 10;
    auto chained = r.and_then([](int v) -> Result<std::string> {
        if (v > 5) return std::to_string(v);
        return Error{ErrorCode::Parse, "too small"};
    });
    ASSERT_TRUE(chained.has_value());
    EXPECT_EQ(*chained, "10");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error{ErrorCode::Spawn, "no such file"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::Spawn);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>(ErrorCode::NotFound, "missing");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST(ResultTest, AccessingWrongAlternativeThrows) {
    Result<int> failure = Error{"fail"};
    EXPECT_THROW((void)failure.value(), std::runtime_error);
    Result<int> success = 3;
    EXPECT_THROW((void)success.error(), std::runtime_error);
}

TEST(ErrorCodeTest, TransientClassification) {
    EXPECT_TRUE(is_transient(ErrorCode::Connection));
    EXPECT_TRUE(is_transient(ErrorCode::Timeout));
    EXPECT_TRUE(is_transient(ErrorCode::Io));
    EXPECT_FALSE(is_transient(ErrorCode::CircuitOpen));
    EXPECT_FALSE(is_transient(ErrorCode::Parse));
    EXPECT_FALSE(is_transient(ErrorCode::Internal));
}

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(to_string(ErrorCode::DuplicateName), "duplicate_name");
    EXPECT_EQ(to_string(ErrorCode::CircuitOpen), "circuit_open");
}
