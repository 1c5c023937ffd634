#pragma once

#include <atomic>
#include <cstdint>
#include <thread>
#include "common/types.hpp"
#include "utils/time_utils.hpp"

namespace tarb {

/**
 * Time source for everything that polls or sleeps. The state machine and
 * the resolution coordinator only ever read time through this interface,
 * which lets tests drive a whole trading round without real waits.
 */
class Clock {
public:
    virtual ~Clock() = default;

    // Wall-clock epoch seconds (period arithmetic)
    virtual int64_t epoch_seconds() const = 0;

    // Monotonic time (cooldowns, latency)
    virtual Timestamp steady_now() const = 0;

    virtual void sleep_for(Duration d) = 0;
};

class SystemClock : public Clock {
public:
    int64_t epoch_seconds() const override { return time_utils::epoch_seconds(); }
    Timestamp steady_now() const override { return now(); }
    void sleep_for(Duration d) override { std::this_thread::sleep_for(d); }
};

/**
 * Sleep in slices of at most one second so a raised shutdown flag cuts
 * long waits short. Returns false if shutdown was requested.
 */
inline bool sleep_unless_stopped(Clock& clock, Duration d, const std::atomic<bool>& shutdown) {
    const Duration slice = std::chrono::seconds(1);
    while (d > Duration::zero()) {
        if (shutdown.load()) return false;
        Duration step = d < slice ? d : slice;
        clock.sleep_for(step);
        d -= step;
    }
    return !shutdown.load();
}

} // namespace tarb
