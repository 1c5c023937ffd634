#include <gtest/gtest.h>
#include <stdexcept>
#include "strategy/window_clock.hpp"

using namespace tarb;
using namespace tarb::window_clock;

// 2023-11-14 22:13:20 UTC, 17:13:20 EST
constexpr int64_t NOV_2023 = 1700000000;

TEST(WindowClockTest, PeriodStart_FloorsToEasternQuarterHour) {
    EXPECT_EQ(period_start(NOV_2023, 15), 1699999200);
    EXPECT_EQ(period_start(NOV_2023, Granularity::FIFTEEN_MIN), 1699999200);
}

TEST(WindowClockTest, PeriodStart_FloorsToFiveMinutes) {
    EXPECT_EQ(period_start(NOV_2023, 5), 1699999800);
    EXPECT_EQ(period_start(NOV_2023, Granularity::FIVE_MIN), 1699999800);
}

TEST(WindowClockTest, PeriodStart_IsIdempotent) {
    for (int g : {5, 15}) {
        int64_t start = period_start(NOV_2023, g);
        EXPECT_EQ(period_start(start, g), start);
        EXPECT_EQ(period_start(start + g * 60 - 1, g), start);
        EXPECT_EQ(period_start(start + g * 60, g), start + g * 60);
    }
}

TEST(WindowClockTest, PeriodEnd_AddsGranularity) {
    EXPECT_EQ(period_end(1699999200, Granularity::FIFTEEN_MIN), 1700000100);
    EXPECT_EQ(period_end(1699999800, Granularity::FIVE_MIN), 1700000100);
}

TEST(WindowClockTest, PeriodStart_RejectsGranularityNotDividingHour) {
    EXPECT_THROW(period_start(NOV_2023, 7), std::invalid_argument);
    EXPECT_THROW(period_start(NOV_2023, 0), std::invalid_argument);
}

TEST(WindowClockTest, EasternOffset_SpringForward2024) {
    // 2024-03-10 02:00 EST == 07:00 UTC
    EXPECT_EQ(eastern_utc_offset_seconds(1710053999), -5 * 3600);
    EXPECT_EQ(eastern_utc_offset_seconds(1710054000), -4 * 3600);
}

TEST(WindowClockTest, EasternOffset_FallBack2024) {
    // 2024-11-03 02:00 EDT == 06:00 UTC
    EXPECT_EQ(eastern_utc_offset_seconds(1730613599), -4 * 3600);
    EXPECT_EQ(eastern_utc_offset_seconds(1730613600), -5 * 3600);
}

TEST(WindowClockTest, PeriodStart_AcrossFallBackHour) {
    // 01:59:59 EDT belongs to the 01:45 EDT period
    EXPECT_EQ(period_start(1730613599, 15), 1730612700);
    // 01:05:05 EST (second 01:00 hour) belongs to the 01:00 EST period
    EXPECT_EQ(period_start(1730613905, 15), 1730613600);
}

TEST(WindowClockTest, PeriodStart_SummerUsesDaylightOffset) {
    // 2024-07-01 12:07:30 UTC == 08:07:30 EDT
    const int64_t t = 1719835650;
    EXPECT_EQ(period_start(t, 15), 1719835200);
    EXPECT_EQ(period_start(t, 5), 1719835500);
}

TEST(WindowClockTest, IsOverlap_LastFiveMinutesOnly) {
    const int64_t p15 = 1699999200;
    EXPECT_FALSE(is_overlap(p15, p15));
    EXPECT_FALSE(is_overlap(p15 + 599, p15));
    EXPECT_TRUE(is_overlap(p15 + 600, p15));
    EXPECT_TRUE(is_overlap(p15 + 899, p15));
    EXPECT_FALSE(is_overlap(p15 + 900, p15));
}

TEST(WindowClockTest, OverlapFiveMinutePeriodEndsWithQuarterHour) {
    const int64_t p15 = period_start(NOV_2023, 15);
    for (int64_t t = p15 + OVERLAP_BEGIN_SECS; t < p15 + OVERLAP_END_SECS; t += 37) {
        int64_t p5 = period_start(t, 5);
        EXPECT_EQ(period_end(p5, 5), period_end(p15, 15));
    }
}
