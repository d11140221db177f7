#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace stockroom::util {

// Millisecond resolution so every backend stores the same instant.
TimePoint Now() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(std::int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string ToIso8601(TimePoint tp) {
  const auto        ms     = ToUnixMillis(tp);
  const std::time_t secs   = static_cast<std::time_t>(ms / 1000);
  const auto        millis = ms % 1000;

  std::tm utc{};
  gmtime_r(&secs, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

TimePoint DaysBefore(TimePoint tp, int days) {
  return tp - std::chrono::hours(24) * days;
}

} // namespace stockroom::util
