//
// Created by gregorian-rayne on 10/2/26.
//

#include "cta/error.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace cta
{
    TEST(ErrorTest, BasicConstruction) {
        const Error error(ErrorCode::InvalidArgument, "invalid value");

        EXPECT_EQ(error.code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(error.message(), "invalid value");
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, ConstructionWithContext) {
        const Error error(ErrorCode::NotFound, "file not found", "/path/to/file");

        EXPECT_EQ(error.code(), ErrorCode::NotFound);
        EXPECT_TRUE(error.has_context());
        EXPECT_EQ(error.context().value(), "/path/to/file");
    }

    TEST(ErrorTest, RepositoryErrorFactory) {
        const auto error = Error::repository_error("Not a git repository", "/tmp/nowhere");
        EXPECT_EQ(error.code(), ErrorCode::RepositoryError);
        EXPECT_EQ(error.context().value(), "/tmp/nowhere");
    }

    TEST(ErrorTest, TrackerErrorFactory) {
        const auto error = Error::tracker_error("GitHub API returned HTTP 403", "page 2");
        EXPECT_EQ(error.code(), ErrorCode::TrackerError);
        EXPECT_EQ(error.context().value(), "page 2");
    }

    TEST(ErrorTest, ConfigErrorFactory) {
        const auto error = Error::config_error("missing field", "tracker.owner");
        EXPECT_EQ(error.code(), ErrorCode::ConfigError);
    }

    TEST(ErrorTest, WithContext) {
        const auto error = Error::parse_error("Truncated commit record");
        const auto with_ctx = error.with_context("commit abc123");

        EXPECT_EQ(with_ctx.context().value(), "commit abc123");

        const auto more_ctx = with_ctx.with_context("HEAD");
        EXPECT_EQ(more_ctx.context().value(), "commit abc123; HEAD");
    }

    TEST(ErrorTest, ToString) {
        const auto error = Error::parse_error("invalid syntax");
        EXPECT_EQ(error.to_string(), "[ParseError] invalid syntax");

        const auto with_ctx = Error::io_error("open failed", "/tmp/cache.json");
        EXPECT_EQ(with_ctx.to_string(), "[IoError] open failed (context: /tmp/cache.json)");
    }

    TEST(ErrorTest, StreamOutput) {
        const auto error = Error::tracker_error("rate limited", "page 3");
        std::ostringstream oss;
        oss << error;
        EXPECT_EQ(oss.str(), "[TrackerError] rate limited (context: page 3)");
    }

    TEST(ErrorTest, ErrorCodeToString) {
        EXPECT_STREQ(error_code_to_string(ErrorCode::None), "None");
        EXPECT_STREQ(error_code_to_string(ErrorCode::InvalidArgument), "InvalidArgument");
        EXPECT_STREQ(error_code_to_string(ErrorCode::NotFound), "NotFound");
        EXPECT_STREQ(error_code_to_string(ErrorCode::ParseError), "ParseError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::IoError), "IoError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::ConfigError), "ConfigError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::RepositoryError), "RepositoryError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::TrackerError), "TrackerError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::InternalError), "InternalError");
    }

    TEST(ErrorTest, Equality) {
        const auto e1 = Error::not_found("missing", "key");
        const auto e2 = Error::not_found("missing", "key");
        const auto e3 = Error::not_found("missing", "other");
        const auto e4 = Error::io_error("missing", "key");

        EXPECT_EQ(e1, e2);
        EXPECT_NE(e1, e3);
        EXPECT_NE(e1, e4);
    }

}  // namespace cta
