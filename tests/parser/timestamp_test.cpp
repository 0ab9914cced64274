#include "als/parser/timestamp.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace als::parser;
using std::chrono::milliseconds;
using std::chrono::seconds;
using std::chrono::system_clock;

namespace {

// 2024-01-15T10:30:00Z
const Timestamp kBase = system_clock::from_time_t(1705314600);

} // namespace

TEST(TimestampTest, ParsesUtcVariants) {
    EXPECT_EQ(parse_timestamp("2024-01-15T10:30:00Z"), kBase);
    EXPECT_EQ(parse_timestamp("2024-01-15T10:30:00.123Z"), kBase + milliseconds(123));
    EXPECT_EQ(parse_timestamp("2024-01-15T10:30:00.5Z"), kBase + milliseconds(500));
}

TEST(TimestampTest, AppliesOffsets) {
    EXPECT_EQ(parse_timestamp("2024-01-15T12:30:00+02:00"), kBase);
    EXPECT_EQ(parse_timestamp("2024-01-15T05:30:00.250-05:00"), kBase + milliseconds(250));
}

TEST(TimestampTest, SpaceSeparatedIsUtc) {
    EXPECT_EQ(parse_timestamp("2024-01-15 10:30:00"), kBase);
}

TEST(TimestampTest, LeapDay) {
    EXPECT_FALSE(is_zero(parse_timestamp("2024-02-29T00:00:00Z")));
    EXPECT_TRUE(is_zero(parse_timestamp("2023-02-29T00:00:00Z")));
}

TEST(TimestampTest, UnparseableIsZero) {
    EXPECT_TRUE(is_zero(parse_timestamp("")));
    EXPECT_TRUE(is_zero(parse_timestamp("not a time")));
    EXPECT_TRUE(is_zero(parse_timestamp("2024-13-01T00:00:00Z")));
    EXPECT_TRUE(is_zero(parse_timestamp("2024-01-15T10:30:00")));
    EXPECT_TRUE(is_zero(parse_timestamp("2024-01-15T10:30:00Zjunk")));
    EXPECT_TRUE(is_zero(parse_timestamp("2024-01-15T25:00:00Z")));
}

TEST(TimestampTest, RejectsNarrowFieldsAndBadTails) {
    EXPECT_TRUE(is_zero(parse_timestamp("2024-1-15T10:30:00Z")));
    EXPECT_TRUE(is_zero(parse_timestamp("2024-01-15T10:30:0Z")));
    EXPECT_TRUE(is_zero(parse_timestamp("2024-01-15T10:30:00.Z")));
    EXPECT_TRUE(is_zero(parse_timestamp("2024-01-15T10:30:00.1234567890Z")));
    EXPECT_TRUE(is_zero(parse_timestamp("2024-01-15T10:30:00+0200")));
    EXPECT_TRUE(is_zero(parse_timestamp("2024-01-15T10:30:00+24:00")));
    EXPECT_TRUE(is_zero(parse_timestamp("2024-01-15 10:30:00Z")));
}

TEST(TimestampTest, KeepsNanoseconds) {
    const auto ts = parse_timestamp("2024-01-15T10:30:00.123456789Z");
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::nanoseconds>(ts - kBase).count(), 123456789);
    EXPECT_EQ(format_timestamp(ts), "2024-01-15T10:30:00.123456789Z");
}

TEST(TimestampTest, FormatTrimsFraction) {
    EXPECT_EQ(format_timestamp(kBase), "2024-01-15T10:30:00Z");
    EXPECT_EQ(format_timestamp(kBase + milliseconds(500)), "2024-01-15T10:30:00.5Z");
    EXPECT_EQ(format_timestamp(Timestamp{}), "");
}

TEST(TimestampTest, FormatIsUtcForOffsetInput) {
    EXPECT_EQ(format_timestamp(parse_timestamp("2024-01-15T12:30:00.123+02:00")),
              "2024-01-15T10:30:00.123Z");
}

TEST(TimestampTest, FormatAfterMidnightRollover) {
    EXPECT_EQ(format_timestamp(parse_timestamp("2024-01-01T01:00:00+02:00")),
              "2023-12-31T23:00:00Z");
    EXPECT_EQ(format_timestamp(kBase + seconds(86400)), "2024-01-16T10:30:00Z");
}
