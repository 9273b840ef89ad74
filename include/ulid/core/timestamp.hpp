#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include "ulid/codec/base32.hpp"
#include "ulid/common.hpp"
#include "ulid/core/uint128.hpp"
#include "ulid/util/time.hpp"

namespace ulid::core {

// 48-bit millisecond Unix time, the first 6 bytes of a ULID
class Timestamp {
 public:
  using Bytes = codec::TimestampBytes;

  // Largest representable value, in milliseconds (year 10889)
  static constexpr std::uint64_t kMaxMilliseconds = (std::uint64_t{1} << 48) - 1;

  // Exactly 6 big-endian bytes
  static Result<Timestamp> fromBytes(std::span<const std::uint8_t> bytes);

  static Result<Timestamp> fromMilliseconds(std::uint64_t milliseconds);

  // Seconds are scaled to milliseconds and truncated. Negative, NaN and
  // infinite values are kRangeOverflow.
  template <Integer T>
  static Result<Timestamp> fromSeconds(T seconds) {
    if constexpr (std::is_unsigned_v<T>) {
      if (seconds > static_cast<std::make_unsigned_t<std::int64_t>>(
                        std::numeric_limits<std::int64_t>::max())) {
        return makeErrorResult<Timestamp>(ErrorCode::kRangeOverflow,
                                          "Expects timestamp to be 48 bits");
      }
    }
    return fromWholeSeconds(static_cast<std::int64_t>(seconds));
  }
  template <std::integral T>
    requires(!Integer<T>)
  static Result<Timestamp> fromSeconds(T) = delete;
  static Result<Timestamp> fromSeconds(double seconds);

  // Pre-epoch times are kRangeOverflow. Finer clock ticks are floored to
  // whole milliseconds.
  static Result<Timestamp> fromTimePoint(util::TimePoint time);

  template <typename Duration>
    requires(!std::same_as<Duration, std::chrono::milliseconds>)
  static Result<Timestamp> fromTimePoint(std::chrono::sys_time<Duration> time) {
    return fromTimePoint(std::chrono::floor<std::chrono::milliseconds>(time));
  }

  // 10 character Base32 text
  static Result<Timestamp> fromString(std::string_view str);

  // RFC3339 calendar text, e.g. 2023-11-14T22:13:20.000Z
  static Result<Timestamp> fromRfc3339(const std::string& str);

  // Default constructor is the epoch
  Timestamp() = default;
  explicit Timestamp(const Bytes& bytes) noexcept : bytes_(bytes) {}

  const Bytes& bytes() const noexcept { return bytes_; }

  std::uint64_t milliseconds() const noexcept;
  double seconds() const noexcept;
  util::TimePoint timePoint() const;
  std::string toRfc3339() const;
  std::string toString() const;

  // Comparison operators
  bool operator==(const Timestamp& other) const noexcept;
  bool operator!=(const Timestamp& other) const noexcept;
  bool operator<(const Timestamp& other) const noexcept;
  bool operator<=(const Timestamp& other) const noexcept;
  bool operator>(const Timestamp& other) const noexcept;
  bool operator>=(const Timestamp& other) const noexcept;

  struct Hash {
    std::size_t operator()(const Timestamp& timestamp) const noexcept;
  };

 private:
  static Result<Timestamp> fromWholeSeconds(std::int64_t seconds);

  Bytes bytes_{};
};

}  // namespace ulid::core

namespace std {
template <>
struct hash<ulid::core::Timestamp> : ulid::core::Timestamp::Hash {};
}  // namespace std
