#pragma once

#include <cstdint>
#include "common/types.hpp"

namespace tarb {
namespace window_clock {

// Overlap window inside a 15m period: [10:00, 15:00) after its start
constexpr int64_t OVERLAP_BEGIN_SECS = 600;
constexpr int64_t OVERLAP_END_SECS = 900;

/**
 * US Eastern offset from UTC at the given instant: -18000 (EST) or
 * -14400 (EDT). DST runs from the second Sunday of March 02:00 local to
 * the first Sunday of November 02:00 local.
 */
int64_t eastern_utc_offset_seconds(int64_t epoch_seconds);

/**
 * Start (epoch seconds) of the Eastern-time period containing the instant.
 * Minute-of-hour is floored to a multiple of the granularity and seconds
 * are zeroed. Idempotent: period_start(period_start(t, g), g) == period_start(t, g).
 */
int64_t period_start(int64_t epoch_seconds, int granularity_minutes);
int64_t period_start(int64_t epoch_seconds, Granularity g);

inline int64_t period_end(int64_t start, int granularity_minutes) {
    return start + static_cast<int64_t>(granularity_minutes) * 60;
}

inline int64_t period_end(int64_t start, Granularity g) {
    return period_end(start, granularity_minutes(g));
}

/**
 * True during the last five minutes of the 15m period, where a single
 * 5m period ends at the same instant as the 15m one.
 */
inline bool is_overlap(int64_t now, int64_t period15_start) {
    int64_t elapsed = now - period15_start;
    return elapsed >= OVERLAP_BEGIN_SECS && elapsed < OVERLAP_END_SECS;
}

} // namespace window_clock
} // namespace tarb
