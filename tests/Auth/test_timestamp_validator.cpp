/**
 * @file test_timestamp_validator.cpp
 * @brief Unit tests for signature timestamp parsing and replay windows
 * @author Hookwarden Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Hookwarden. All rights reserved.
 */

#include <Hookwarden/Auth/TimestampValidator.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Hookwarden;
using namespace Hookwarden::Auth;
using namespace Hookwarden::Testing;

namespace {

constexpr int64_t kReference = 1700000000;  // 2023-11-14T22:13:20Z

SystemClock::time_point at(int64_t epochSeconds) {
    return SystemClock::time_point(Seconds(epochSeconds));
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(TimestampParse, UnixSeconds) {
    TimestampValidator validator;

    auto parsed = validator.parse("1700000000");
    ASSERT_TRUE(parsed.isSuccess());
    EXPECT_EQ(parsed.value().epochSeconds, kReference);
    EXPECT_FALSE(parsed.value().fromIso8601);
}

TEST(TimestampParse, MalformedUnixForms) {
    TimestampValidator validator;

    for (const char* text : {"-5", "007", "12.5", "+100", "1e9", "17000000x", "",
                             "99999999999999999999"}) {
        auto parsed = validator.parse(text);
        ASSERT_RESULT_ERROR(parsed, ErrorCode::InvalidTimestamp);
    }
}

TEST(TimestampParse, Iso8601Utc) {
    TimestampValidator validator;

    for (const char* text : {"2023-11-14T22:13:20Z", "2023-11-14T22:13:20+00:00",
                             "2023-11-14T22:13:20+0000", "2023-11-14 22:13:20 +0000",
                             "2023-11-14T22:13:20.123Z"}) {
        auto parsed = validator.parse(text);
        ASSERT_TRUE(parsed.isSuccess()) << text;
        EXPECT_EQ(parsed.value().epochSeconds, kReference) << text;
        EXPECT_TRUE(parsed.value().fromIso8601);
        EXPECT_TRUE(parsed.value().utc);
    }
}

TEST(TimestampParse, NonUtcOffsetsAreRejected) {
    TimestampValidator validator;

    for (const char* text : {"2023-11-14T22:13:20", "2023-11-14T23:13:20+01:00",
                             "2023-11-14T17:13:20-05:00", "2023-11-14T22:13:20z"}) {
        EXPECT_TRUE(validator.parse(text).isFailure()) << text;
    }
}

TEST(TimestampParse, CalendarIsChecked) {
    TimestampValidator validator;

    EXPECT_TRUE(validator.parse("2024-02-29T00:00:00Z").isSuccess());
    EXPECT_TRUE(validator.parse("2023-02-29T00:00:00Z").isFailure());
    EXPECT_TRUE(validator.parse("2023-13-01T00:00:00Z").isFailure());
    EXPECT_TRUE(validator.parse("2023-11-14T24:00:00Z").isFailure());
    EXPECT_TRUE(validator.parse("2023-11-14T22:13:20.Z").isFailure());
}

TEST(TimestampParse, WhitespaceAndControlCharactersAreRejected) {
    CapturingLogger log;
    TimestampValidator validator(&log.logger());

    EXPECT_TRUE(validator.parse(" 1700000000").isFailure());
    EXPECT_TRUE(validator.parse("1700000000\n").isFailure());
    EXPECT_TRUE(validator.parse("1700000000\x01").isFailure());
    EXPECT_TRUE(log.contains(Core::LogLevel::Warning, "Auth::TimestampValidator"));
}

// ============================================================================
// Tolerance
// ============================================================================

TEST(TimestampTolerance, BoundaryIsInclusive) {
    TimestampValidator validator;

    EXPECT_TRUE(validator.isWithinTolerance("1700000000", 300, at(kReference + 300)));
    EXPECT_FALSE(validator.isWithinTolerance("1700000000", 300, at(kReference + 301)));
    EXPECT_FALSE(validator.isWithinTolerance("1700000000", 299, at(kReference + 300)));
}

TEST(TimestampTolerance, FutureTimestampsUseTheSameWindow) {
    TimestampValidator validator;

    EXPECT_TRUE(validator.isWithinTolerance("1700000300", 300, at(kReference)));
    EXPECT_FALSE(validator.isWithinTolerance("1700000301", 300, at(kReference)));
}

TEST(TimestampTolerance, ZeroToleranceRequiresExactSecond) {
    TimestampValidator validator;

    EXPECT_TRUE(validator.isWithinTolerance("2023-11-14T22:13:20Z", 0, at(kReference)));
    EXPECT_FALSE(validator.isWithinTolerance("2023-11-14T22:13:20Z", 0, at(kReference + 1)));
}

TEST(TimestampTolerance, EpochAndNegativeToleranceNeverPass) {
    TimestampValidator validator;

    EXPECT_TRUE(validator.parse("0").isSuccess());
    EXPECT_FALSE(validator.isWithinTolerance("0", 300, at(100)));
    EXPECT_FALSE(validator.isWithinTolerance("1700000000", -1, at(kReference)));
}

TEST(TimestampTolerance, HugeValuesDoNotOverflow) {
    TimestampValidator validator;

    EXPECT_FALSE(validator.isWithinTolerance("9223372036854775807", 300, at(kReference)));
}

TEST(TimestampTolerance, SystemClock) {
    TimestampValidator validator;

    const auto now = std::chrono::duration_cast<Seconds>(SystemClock::now().time_since_epoch()).count();
    EXPECT_TRUE(validator.isValid(std::to_string(now), 60));
    EXPECT_FALSE(validator.isValid(std::to_string(now - 3600), 60));
}
