#pragma once

#include <string>
#include <cstdint>
#include "common/types.hpp"

namespace tarb {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string (UTC, millisecond precision).
 */
std::string to_iso8601(WallClock t);
std::string to_iso8601_seconds(int64_t epoch_seconds);

/**
 * Current epoch seconds from the system clock.
 */
int64_t epoch_seconds();

/**
 * Format a duration for log lines ("850ms", "12.3s", "4m05s").
 */
std::string format_duration(Duration d);

} // namespace time_utils
} // namespace tarb
