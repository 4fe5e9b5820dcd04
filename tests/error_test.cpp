/**
 * @file error_test.cpp
 * @brief Result / Error 与错误处理宏
 */

#include <gtest/gtest.h>

#include "core/error.h"

using namespace glide;

namespace {

Result<int> parse_positive(int v) {
    GLIDE_ENSURE(v > 0, ErrorCode::INVALID_REQUEST, "must be positive");
    return Ok(v);
}

Result<int> doubled(int v) {
    GLIDE_TRY_UNWRAP(x, parse_positive(v));
    return Ok(x * 2);
}

Result<void> check_both(int a, int b) {
    GLIDE_TRY(parse_positive(a));
    GLIDE_TRY(parse_positive(b));
    return Ok();
}

} // namespace

TEST(ErrorTest, OkCarriesValue) {
    auto r = doubled(21);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value(), 42);
}

TEST(ErrorTest, EnsurePropagatesThroughUnwrap) {
    auto r = doubled(-1);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(r.error().message(), "must be positive");
    EXPECT_GT(r.error().line(), 0);
}

TEST(ErrorTest, TryStopsAtFirstFailure) {
    EXPECT_TRUE(check_both(1, 2).ok());
    auto r = check_both(1, 0);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::INVALID_REQUEST);
}

TEST(ErrorTest, ToStringIncludesCodeAndContext) {
    Error e(ErrorCode::CONFIG_PARSE_ERROR, "bad line");
    e.with_context("engine.conf");
    std::string s = e.to_string();
    EXPECT_NE(s.find("CONFIG_PARSE_ERROR"), std::string::npos);
    EXPECT_NE(s.find("bad line"), std::string::npos);
    EXPECT_NE(s.find("engine.conf"), std::string::npos);
}

TEST(ErrorTest, InfrastructureCodes) {
    EXPECT_TRUE(is_infrastructure_error(ErrorCode::SANDBOX_FAILURE));
    EXPECT_TRUE(is_infrastructure_error(ErrorCode::EXEC_FAILED));
    EXPECT_FALSE(is_infrastructure_error(ErrorCode::UNSUPPORTED_LANGUAGE));
    EXPECT_FALSE(is_infrastructure_error(ErrorCode::TIMEOUT));
}

TEST(ErrorTest, UnwrapThrowsOnError) {
    auto r = Err<int>(ErrorCode::TIMEOUT, "slow");
    EXPECT_THROW(r.unwrap(), std::runtime_error);
    EXPECT_EQ(r.value_or(7), 7);
}
