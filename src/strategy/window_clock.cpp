#include "strategy/window_clock.hpp"
#include <ctime>
#include <stdexcept>

namespace tarb {
namespace window_clock {

namespace {

constexpr int64_t EST_OFFSET = -5 * 3600;
constexpr int64_t EDT_OFFSET = -4 * 3600;

// Day of month of the n-th Sunday of (year, month0)
int nth_sunday(int year, int month0, int n) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month0;
    tm.tm_mday = 1;
    tm.tm_hour = 12;
    std::time_t t = timegm(&tm);
    std::tm first{};
    gmtime_r(&t, &first);
    int first_sunday = 1 + (7 - first.tm_wday) % 7;
    return first_sunday + 7 * (n - 1);
}

int64_t utc_epoch(int year, int month0, int mday, int hour) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month0;
    tm.tm_mday = mday;
    tm.tm_hour = hour;
    return static_cast<int64_t>(timegm(&tm));
}

} // namespace

int64_t eastern_utc_offset_seconds(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm utc{};
    gmtime_r(&t, &utc);
    int year = utc.tm_year + 1900;

    // 02:00 EST is 07:00 UTC; 02:00 EDT is 06:00 UTC
    int64_t dst_begin = utc_epoch(year, 2, nth_sunday(year, 2, 2), 7);
    int64_t dst_end = utc_epoch(year, 10, nth_sunday(year, 10, 1), 6);

    if (epoch_seconds >= dst_begin && epoch_seconds < dst_end) {
        return EDT_OFFSET;
    }
    return EST_OFFSET;
}

int64_t period_start(int64_t epoch_seconds, int granularity_minutes) {
    if (granularity_minutes <= 0 || 60 % granularity_minutes != 0) {
        throw std::invalid_argument("granularity must divide an hour");
    }

    // Transitions fall on whole hours and periods never cross an hour, so
    // the offset at the instant is also the offset at its period start.
    int64_t offset = eastern_utc_offset_seconds(epoch_seconds);
    int64_t local = epoch_seconds + offset;
    int64_t step = static_cast<int64_t>(granularity_minutes) * 60;

    int64_t floored = local - (((local % step) + step) % step);
    return floored - offset;
}

int64_t period_start(int64_t epoch_seconds, Granularity g) {
    return period_start(epoch_seconds, granularity_minutes(g));
}

} // namespace window_clock
} // namespace tarb
