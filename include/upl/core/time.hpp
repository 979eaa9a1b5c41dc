#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace upl::core {

using TimePoint = std::chrono::system_clock::time_point;

/// Injectable time source; stages take one so tests can move time forward.
using Clock = std::function<TimePoint()>;

inline Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

std::string to_iso8601(TimePoint time);

std::int64_t to_unix_millis(TimePoint time);

TimePoint from_unix_millis(std::int64_t millis);

/// Seconds between two points, rounded to two decimals.
double seconds_between(TimePoint from, TimePoint to);

} // namespace upl::core
