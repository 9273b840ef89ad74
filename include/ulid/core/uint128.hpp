#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include "ulid/common.hpp"

namespace ulid::core {

// Unsigned 128-bit integer (GCC/Clang builtin)
__extension__ typedef unsigned __int128 Uint128;

// Integral types that carry a number: bool and the character types are not
template <typename T>
concept Integer = std::integral<T> &&
    !std::same_as<std::remove_cv_t<T>, bool> &&
    !std::same_as<std::remove_cv_t<T>, char> &&
    !std::same_as<std::remove_cv_t<T>, wchar_t> &&
    !std::same_as<std::remove_cv_t<T>, char8_t> &&
    !std::same_as<std::remove_cv_t<T>, char16_t> &&
    !std::same_as<std::remove_cv_t<T>, char32_t>;

// Largest value representable in the given number of bytes
constexpr Uint128 maxValueForBytes(std::size_t byte_count) {
  return byte_count >= 16 ? ~Uint128{0} : (Uint128{1} << (byte_count * 8)) - 1;
}

// Big-endian bytes to integer
Uint128 fromBigEndian(std::span<const std::uint8_t> bytes) noexcept;

// Integer to big-endian bytes of the given width; kRangeOverflow when the
// value needs more bytes than that
template <std::size_t N>
Result<std::array<std::uint8_t, N>> toBigEndian(Uint128 value) {
  static_assert(N <= 16, "Uint128 holds at most 16 bytes");
  if (value > maxValueForBytes(N)) {
    return makeErrorResult<std::array<std::uint8_t, N>>(
        ErrorCode::kRangeOverflow,
        "Expects integer to fit in " + std::to_string(N) + " bytes");
  }

  std::array<std::uint8_t, N> bytes{};
  for (std::size_t i = N; i-- > 0;) {
    bytes[i] = static_cast<std::uint8_t>(value & 0xFF);
    value >>= 8;
  }
  return bytes;
}

// Decimal rendering
std::string toDecimalString(Uint128 value);

// Parse a decimal integer of any size. A leading '-' is accepted only for
// zero; negative values and values above 2^128-1 are kRangeOverflow, any
// non-digit is kMalformedText.
Result<Uint128> parseDecimal(std::string_view text);

// Lower-case hex rendering, zero padded to the given number of bytes
std::string toHexString(std::span<const std::uint8_t> bytes);

// Parse exactly bytes.size() * 2 hex digits into bytes
Result<void> parseHex(std::string_view text, std::span<std::uint8_t> bytes);

}  // namespace ulid::core
