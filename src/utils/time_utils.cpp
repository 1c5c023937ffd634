#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace tarb {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::string to_iso8601_seconds(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

int64_t epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string format_duration(Duration d) {
    int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();

    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << (ms / 1000.0) << "s";
        return ss.str();
    }

    int64_t min = ms / 60000;
    int64_t sec = (ms % 60000) / 1000;
    std::ostringstream ss;
    ss << min << "m" << std::setfill('0') << std::setw(2) << sec << "s";
    return ss.str();
}

} // namespace time_utils
} // namespace tarb
