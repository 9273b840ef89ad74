#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "ulid/common.hpp"

namespace ulid::util {

// Millisecond UTC time. int64 milliseconds cover the whole 48-bit ULID
// range, unlike system_clock's nanosecond ticks.
using TimePoint = std::chrono::sys_time<std::chrono::milliseconds>;

// Time utilities for RFC3339 formatting and parsing
class Time {
 public:
  // Format time as RFC3339 string with millisecond precision, UTC.
  // Years past 9999 are written with five digits.
  static std::string toRfc3339(TimePoint time);

  // Parse RFC3339 string to time_point. Fractions beyond milliseconds are
  // truncated; a missing zone means UTC. Dates that do not exist, leap
  // seconds and out-of-range offsets are kParseError.
  static Result<TimePoint> fromRfc3339(const std::string& str);

  // Milliseconds since the Unix epoch
  static std::int64_t toMilliseconds(TimePoint time);
  static TimePoint fromMilliseconds(std::uint64_t milliseconds);
};

}  // namespace ulid::util
