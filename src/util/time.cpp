#include "ulid/util/time.hpp"

#include <iomanip>
#include <regex>
#include <sstream>

namespace ulid::util {

std::string Time::toRfc3339(TimePoint time) {
  auto day = std::chrono::floor<std::chrono::days>(time);
  std::chrono::year_month_day date{day};
  std::chrono::hh_mm_ss<std::chrono::milliseconds> clock_time{time - day};

  std::ostringstream oss;
  oss << std::setfill('0')
      << std::setw(4) << static_cast<int>(date.year()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.day()) << 'T'
      << std::setw(2) << clock_time.hours().count() << ':'
      << std::setw(2) << clock_time.minutes().count() << ':'
      << std::setw(2) << clock_time.seconds().count() << '.'
      << std::setw(3) << clock_time.subseconds().count() << 'Z';

  return oss.str();
}

Result<TimePoint> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4,5})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?(Z|z|[+-]\d{2}:\d{2})?)");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  std::chrono::year_month_day date{
      std::chrono::year{std::stoi(match[1])},
      std::chrono::month{static_cast<unsigned>(std::stoi(match[2]))},
      std::chrono::day{static_cast<unsigned>(std::stoi(match[3]))}};
  int hour = std::stoi(match[4]);
  int minute = std::stoi(match[5]);
  int second = std::stoi(match[6]);

  if (!date.ok() || hour > 23 || minute > 59 || second > 59) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  TimePoint time_point = std::chrono::sys_days{date};
  time_point += std::chrono::hours(hour) + std::chrono::minutes(minute) +
                std::chrono::seconds(second);

  // Add milliseconds if present
  if (match[7].matched) {
    std::string fraction = match[7].str();
    fraction.resize(3, '0');
    time_point += std::chrono::milliseconds(std::stoi(fraction));
  }

  // Normalize a numeric offset back to UTC
  if (match[8].matched && match[8].length() == 6) {
    std::string offset = match[8].str();
    int hours = std::stoi(offset.substr(1, 2));
    int minutes = std::stoi(offset.substr(4, 2));
    if (hours > 23 || minutes > 59) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Invalid UTC offset: " + str));
    }
    auto shift = std::chrono::hours(hours) + std::chrono::minutes(minutes);
    time_point = offset[0] == '+' ? time_point - shift : time_point + shift;
  }

  return time_point;
}

std::int64_t Time::toMilliseconds(TimePoint time) {
  return time.time_since_epoch().count();
}

TimePoint Time::fromMilliseconds(std::uint64_t milliseconds) {
  return TimePoint{std::chrono::milliseconds(static_cast<std::int64_t>(milliseconds))};
}

}  // namespace ulid::util
