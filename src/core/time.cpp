#include "upl/core/time.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace upl::core {

std::string to_iso8601(TimePoint time) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? millis + 1000 : millis)
        << 'Z';
    return oss.str();
}

std::int64_t to_unix_millis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint from_unix_millis(std::int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

double seconds_between(TimePoint from, TimePoint to) {
    const double seconds = std::chrono::duration<double>(to - from).count();
    return std::round(seconds * 100.0) / 100.0;
}

} // namespace upl::core
