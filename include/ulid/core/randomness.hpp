#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include "ulid/codec/base32.hpp"
#include "ulid/common.hpp"
#include "ulid/core/uint128.hpp"

namespace ulid::core {

// 80 opaque bits, the last 10 bytes of a ULID
class Randomness {
 public:
  using Bytes = codec::RandomnessBytes;

  // 2^80 - 1
  static constexpr Uint128 kMaxValue = maxValueForBytes(codec::kRandomnessSize);

  // Exactly 10 bytes
  static Result<Randomness> fromBytes(std::span<const std::uint8_t> bytes);

  // Big-endian rendering of a non-negative integer below 2^80
  static Result<Randomness> fromInt(Uint128 value);

  template <Integer T>
  static Result<Randomness> fromInt(T value) {
    if constexpr (std::is_signed_v<T>) {
      if (value < 0) {
        return makeErrorResult<Randomness>(
            ErrorCode::kRangeOverflow,
            "Expects positive integer; got " + std::to_string(value));
      }
    }
    return fromInt(static_cast<Uint128>(value));
  }
  template <std::integral T>
    requires(!Integer<T>)
  static Result<Randomness> fromInt(T) = delete;

  // Truncated towards zero, then as fromInt
  static Result<Randomness> fromDouble(double value);

  // 16 character Base32 text
  static Result<Randomness> fromString(std::string_view str);

  Randomness() = default;
  explicit Randomness(const Bytes& bytes) noexcept : bytes_(bytes) {}

  const Bytes& bytes() const noexcept { return bytes_; }

  Uint128 toInt() const noexcept;
  std::string toString() const;
  std::string toHex() const;

  // Comparison operators
  bool operator==(const Randomness& other) const noexcept;
  bool operator!=(const Randomness& other) const noexcept;
  bool operator<(const Randomness& other) const noexcept;
  bool operator<=(const Randomness& other) const noexcept;
  bool operator>(const Randomness& other) const noexcept;
  bool operator>=(const Randomness& other) const noexcept;

  struct Hash {
    std::size_t operator()(const Randomness& randomness) const noexcept;
  };

 private:
  Bytes bytes_{};
};

}  // namespace ulid::core

namespace std {
template <>
struct hash<ulid::core::Randomness> : ulid::core::Randomness::Hash {};
}  // namespace std
