#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace stockroom::util {

/*
  Time utilities. Every timestamp in the system comes from Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixMillis(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t ms);

// UTC, e.g. 2024-05-01T12:30:00.250Z
std::string ToIso8601(TimePoint tp);

TimePoint DaysBefore(TimePoint tp, int days);

} // namespace stockroom::util
