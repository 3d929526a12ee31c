#include <gtest/gtest.h>

#include "test_util.hpp"
#include "track/timestamp.hpp"

using track::Clock;

class TimestampTest : public ::testing::Test {
protected:
  void SetUp() override { track_test::use_utc(); }
};

TEST_F(TimestampTest, FormatsWithZoneAbbreviation) {
  EXPECT_EQ(track::format_timestamp(Clock::from_time_t(track_test::kJan1)),
            "2024-01-01 10:00:00 UTC");
}

TEST_F(TimestampTest, ParsesUtcAndGmt) {
  Clock::time_point t;
  ASSERT_TRUE(track::parse_timestamp("2024-01-01 10:00:00 UTC", t));
  EXPECT_EQ(Clock::to_time_t(t), track_test::kJan1);

  ASSERT_TRUE(track::parse_timestamp("2024-01-01 10:00:00 GMT", t));
  EXPECT_EQ(Clock::to_time_t(t), track_test::kJan1);
}

TEST_F(TimestampTest, ParsesNumericOffsets) {
  Clock::time_point t;
  ASSERT_TRUE(track::parse_timestamp("2024-01-01 11:00:00 +01", t));
  EXPECT_EQ(Clock::to_time_t(t), track_test::kJan1);

  ASSERT_TRUE(track::parse_timestamp("2024-01-01 05:30:00 -0430", t));
  EXPECT_EQ(Clock::to_time_t(t), track_test::kJan1);
}

TEST_F(TimestampTest, RoundTripsToTheSecond) {
  const auto now = Clock::now();
  Clock::time_point back;
  ASSERT_TRUE(track::parse_timestamp(track::format_timestamp(now), back));
  EXPECT_EQ(Clock::to_time_t(back), Clock::to_time_t(now));
}

TEST_F(TimestampTest, RejectsMalformedText) {
  Clock::time_point t;
  EXPECT_FALSE(track::parse_timestamp("", t));
  EXPECT_FALSE(track::parse_timestamp("yesterday", t));
  EXPECT_FALSE(track::parse_timestamp("2024-01-01 10:00:00", t));
  EXPECT_FALSE(track::parse_timestamp("2024-01-01 10:00:00 UTC extra", t));
}

TEST_F(TimestampTest, CurrentTimestampUsesInjectedClock) {
  auto clock = track_test::stepping_clock(track_test::kJan1, std::chrono::seconds{60});
  EXPECT_EQ(track::current_timestamp(clock), "2024-01-01 10:00:00 UTC");
  EXPECT_EQ(track::current_timestamp(clock), "2024-01-01 10:01:00 UTC");
}
