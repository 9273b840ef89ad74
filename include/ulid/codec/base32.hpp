#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ulid/common.hpp"

namespace ulid::codec {

// Crockford's Base32 alphabet. Excludes I, L, O and U; decoding is
// case-insensitive, encoding always emits upper case. No padding.
inline constexpr std::string_view kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// Binary widths in bytes
inline constexpr std::size_t kTimestampSize = 6;
inline constexpr std::size_t kRandomnessSize = 10;
inline constexpr std::size_t kUlidSize = 16;

// Text widths in characters
inline constexpr std::size_t kTimestampLength = 10;
inline constexpr std::size_t kRandomnessLength = 16;
inline constexpr std::size_t kUlidLength = 26;

using TimestampBytes = std::array<std::uint8_t, kTimestampSize>;
using RandomnessBytes = std::array<std::uint8_t, kRandomnessSize>;
using UlidBytes = std::array<std::uint8_t, kUlidSize>;

// Fixed-width encoders. The buffer is read as one big-endian integer and
// emitted 5 bits at a time from the most significant end; the 2 spare
// capacity bits of the 10 and 26 character forms are always zero.
std::string encodeTimestamp(const TimestampBytes& bytes);
std::string encodeRandomness(const RandomnessBytes& bytes);
std::string encodeUlid(const UlidBytes& bytes);

// Encode a 6, 10 or 16 byte buffer; any other width is kWidthMismatch
Result<std::string> encode(std::span<const std::uint8_t> bytes);

// Fixed-width decoders. Fail with kMalformedText on a wrong length, a
// character outside the alphabet, or non-zero spare capacity bits.
Result<TimestampBytes> decodeTimestamp(std::string_view text);
Result<RandomnessBytes> decodeRandomness(std::string_view text);
Result<UlidBytes> decodeUlid(std::string_view text);

// Decode a 10, 16 or 26 character string into 6, 10 or 16 bytes
Result<std::vector<std::uint8_t>> decode(std::string_view text);

// 5-bit value of a Base32 character, or -1 when not in the alphabet
int decodeChar(char c) noexcept;

// Check text is a decodable 26 character ULID
bool isValidUlid(std::string_view text) noexcept;

}  // namespace ulid::codec
