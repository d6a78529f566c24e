#include <chrono>
#include <stdexcept>

#include <gtest/gtest.h>

#include "f1ar/session_time.hpp"

namespace f1ar {

TEST(SessionTimeTest, StructuredAndRawReduceToSameSeconds) {
    // Both duration encodings of 83.456 s must give bit-identical seconds.
    const SessionDuration structured = StructuredDuration(std::chrono::milliseconds(83456));
    const SessionDuration raw = RawDuration{83456000000, 1000000000};

    EXPECT_EQ(to_seconds(structured), to_seconds(raw));
    EXPECT_DOUBLE_EQ(to_seconds(structured), 83.456);
}

TEST(SessionTimeTest, RawDurationHonoursTickRate) {
    // Microsecond ticks convert with their own rate.
    const SessionDuration raw = RawDuration{1500000, 1000000};
    EXPECT_DOUBLE_EQ(to_seconds(raw), 1.5);
}

TEST(SessionTimeTest, RejectsNonPositiveTickRate) {
    // A zero tick rate cannot be converted.
    const SessionDuration raw = RawDuration{10, 0};
    EXPECT_THROW(to_seconds(raw), std::invalid_argument);
}

TEST(SessionTimeTest, ParsesTimedeltaText) {
    // Day-prefixed clock text parses to a structured duration.
    const auto parsed = parse_session_duration("0 days 01:02:03.250000");
    ASSERT_TRUE(std::holds_alternative<StructuredDuration>(parsed));
    EXPECT_DOUBLE_EQ(to_seconds(parsed), 3723.25);

    const auto with_day = parse_session_duration("1 days 00:00:01");
    EXPECT_DOUBLE_EQ(to_seconds(with_day), 86401.0);
}

TEST(SessionTimeTest, ParsesIntegerAsRawNanoseconds) {
    // A bare integer is a raw nanosecond count.
    const auto parsed = parse_session_duration(" 12000000000 ");
    ASSERT_TRUE(std::holds_alternative<RawDuration>(parsed));
    EXPECT_DOUBLE_EQ(to_seconds(parsed), 12.0);
}

TEST(SessionTimeTest, TextAndIntegerForSameInstantAgree) {
    // Clock text and nanosecond integer of one instant reduce identically.
    EXPECT_EQ(to_seconds(parse_session_duration("00:00:12.345678901")),
              to_seconds(parse_session_duration("12345678901")));
}

TEST(SessionTimeTest, RejectsMalformedText) {
    // Garbage and partial clock text are rejected.
    EXPECT_THROW(parse_session_duration(""), std::invalid_argument);
    EXPECT_THROW(parse_session_duration("soon"), std::invalid_argument);
    EXPECT_THROW(parse_session_duration("12:30"), std::invalid_argument);
    EXPECT_THROW(parse_session_duration("00:0x:10"), std::invalid_argument);
}

TEST(SessionTimeTest, NegativeDaysOffsetByClock) {
    // A negative day count plus a positive clock part is a small negative time.
    EXPECT_DOUBLE_EQ(to_seconds(parse_session_duration("-1 days +23:59:59.500000")), -0.5);
    EXPECT_DOUBLE_EQ(to_seconds(parse_session_duration("-1 days 00:00:00")), -86400.0);
    EXPECT_DOUBLE_EQ(to_seconds(parse_session_duration("-00:00:02")), -2.0);
}

TEST(SessionTimeTest, RejectsValuesOutsideInt64Nanoseconds) {
    // Oversized but well-formed cells are rejected instead of wrapping around.
    EXPECT_THROW(parse_session_duration("99999999999999 days 00:00:00"), std::invalid_argument);
    EXPECT_THROW(parse_session_duration("9999999999:00:00"), std::invalid_argument);
    EXPECT_THROW(parse_session_duration("00:00:99999999999999999999"), std::invalid_argument);
    EXPECT_THROW(parse_session_duration("99999999999999999999"), std::invalid_argument);

    EXPECT_DOUBLE_EQ(to_seconds(parse_session_duration("100000 days 00:00:00")), 8640000000.0);
}

} // namespace f1ar
