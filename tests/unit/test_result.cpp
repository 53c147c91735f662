/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace async_responder;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().kind, ErrorKind::Internal);
}

TEST(ResultTest, ErrorKindPreserved) {
    auto r = make_error<std::string>(ErrorKind::Interrupted, "Task interrupted");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Interrupted);
    EXPECT_EQ(r.error().what(), "Task interrupted");
    EXPECT_EQ(to_string(r.error().kind), "interrupted");
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
    Result<int> r = Error{ErrorKind::TaskError, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
    EXPECT_EQ(doubled.error().kind, ErrorKind::TaskError);
}

TEST(ResultTest, AndThenShortCircuits) {
    Result<int> r = Error{"first"};
    bool called = false;
    auto chained = r.and_then([&called](int v) -> Result<int> {
        called = true;
        return v + 1;
    });
    EXPECT_FALSE(called);
    ASSERT_FALSE(chained.has_value());
    EXPECT_EQ(chained.error().message, "first");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> failed = Error{ErrorKind::Rejected, "full"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, ErrorKind::Rejected);
}
