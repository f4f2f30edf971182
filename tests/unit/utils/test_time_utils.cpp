//
// Created by gregorian-rayne on 10/3/26.
//

#include <gtest/gtest.h>
#include "cta/utils/time_utils.hpp"

using namespace cta;
using namespace cta::time_utils;
using namespace std::chrono;

namespace {

    Timestamp at(const long long unix_seconds) {
        return Timestamp{seconds{unix_seconds}};
    }

}  // namespace

TEST(TimeUtilsTest, FormatRfc3339) {
    EXPECT_EQ(format_rfc3339(at(0)), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_rfc3339(at(1705314600)), "2024-01-15T10:30:00Z");
}

TEST(TimeUtilsTest, FormatDropsSubsecondPrecision) {
    const Timestamp ts = at(1705314600) + milliseconds{750};
    EXPECT_EQ(format_rfc3339(ts), "2024-01-15T10:30:00Z");
}

TEST(TimeUtilsTest, ParseUtc) {
    const auto ts = parse_rfc3339("2024-01-15T10:30:00Z");

    ASSERT_TRUE(ts.is_ok());
    EXPECT_EQ(ts.value(), at(1705314600));
}

TEST(TimeUtilsTest, ParseWithOffsetAndFraction) {
    const auto plus = parse_rfc3339("2024-01-15T12:30:00.123456+02:00");
    ASSERT_TRUE(plus.is_ok());
    EXPECT_EQ(plus.value(), at(1705314600));

    const auto minus = parse_rfc3339("2024-01-15T05:30:00-05:00");
    ASSERT_TRUE(minus.is_ok());
    EXPECT_EQ(minus.value(), at(1705314600));
}

TEST(TimeUtilsTest, ParseRejectsMalformed) {
    EXPECT_TRUE(parse_rfc3339("").is_err());
    EXPECT_TRUE(parse_rfc3339("2024-01-15").is_err());
    EXPECT_TRUE(parse_rfc3339("2024-01-15T10:30:00").is_err());
    EXPECT_TRUE(parse_rfc3339("2024-01-15T25:30:00Z").is_err());
    EXPECT_TRUE(parse_rfc3339("2024-02-30T10:30:00Z").is_err());
    EXPECT_TRUE(parse_rfc3339("2024-01-15T10:30:00Zjunk").is_err());
    EXPECT_EQ(parse_rfc3339("garbage garbage garbage").error().code(), ErrorCode::ParseError);
}

TEST(TimeUtilsTest, FormatRoundTrip) {
    const Timestamp ts = at(1700000000);
    const auto parsed = parse_rfc3339(format_rfc3339(ts));

    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), ts);
}

TEST(TimeUtilsTest, FormatAge) {
    EXPECT_EQ(format_age(seconds{0}), "0 seconds");
    EXPECT_EQ(format_age(seconds{1}), "1 second");
    EXPECT_EQ(format_age(seconds{59}), "59 seconds");
    EXPECT_EQ(format_age(minutes{1}), "1 minute");
    EXPECT_EQ(format_age(minutes{45}), "45 minutes");
    EXPECT_EQ(format_age(hours{3}), "3 hours");
    EXPECT_EQ(format_age(hours{49}), "2 days");
    EXPECT_EQ(format_age(seconds{-30}), "0 seconds");
}
