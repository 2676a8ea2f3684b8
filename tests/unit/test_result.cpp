/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace statsd_emitter;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorKind::Write, "something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Write);
    EXPECT_EQ(r.error().message, "something went wrong");
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{ErrorKind::Closed, "closed"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> failed = Error{ErrorKind::Transport, "unreachable"};
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(failed));
    EXPECT_EQ(failed.error().kind, ErrorKind::Transport);
    EXPECT_THROW((void)ok.error(), std::runtime_error);
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> r = std::make_unique<int>(7);
    ASSERT_TRUE(r.has_value());
    auto owned = std::move(r).value();
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{ErrorKind::Config, "fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapOnError) {
    Result<int> r = Error{ErrorKind::Write, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
}

TEST(ResultTest, ErrorKindNames) {
    EXPECT_EQ(to_string(ErrorKind::Transport), "transport");
    EXPECT_EQ(to_string(ErrorKind::Closed), "closed");
}
