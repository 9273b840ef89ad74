#include "ulid/codec/base32.hpp"

#include <algorithm>

#include "ulid/util/log.hpp"

namespace ulid::codec {

namespace {

constexpr std::size_t kBitsPerChar = 5;

std::size_t textLengthFor(std::size_t byte_count) {
  return (byte_count * 8 + kBitsPerChar - 1) / kBitsPerChar;
}

// Leading capacity bits that carry no payload
std::size_t spareBits(std::size_t byte_count) {
  return textLengthFor(byte_count) * kBitsPerChar - byte_count * 8;
}

std::string encodeBuffer(std::span<const std::uint8_t> bytes) {
  const std::size_t length = textLengthFor(bytes.size());
  const std::size_t spare = spareBits(bytes.size());
  std::string result(length, '0');

  for (std::size_t i = 0; i < length; ++i) {
    unsigned value = 0;
    for (std::size_t b = 0; b < kBitsPerChar; ++b) {
      std::size_t stream_pos = i * kBitsPerChar + b;
      unsigned bit = 0;
      if (stream_pos >= spare) {
        std::size_t pos = stream_pos - spare;
        bit = (bytes[pos / 8] >> (7 - pos % 8)) & 1u;
      }
      value = (value << 1) | bit;
    }
    result[i] = kAlphabet[value];
  }

  return result;
}

Result<void> decodeBuffer(std::string_view text, std::span<std::uint8_t> out,
                          std::string_view what) {
  const std::size_t expected = textLengthFor(out.size());
  if (text.size() != expected) {
    auto message = "Expected " + std::to_string(expected) + " characters for " +
                   std::string(what) + "; got " + std::to_string(text.size());
    util::logger()->debug("Base32 decode failed: {}", message);
    return makeErrorResult<void>(ErrorCode::kMalformedText, message);
  }

  std::fill(out.begin(), out.end(), std::uint8_t{0});
  const std::size_t spare = spareBits(out.size());

  for (std::size_t i = 0; i < text.size(); ++i) {
    int value = decodeChar(text[i]);
    if (value < 0) {
      auto message = "Invalid character '" + std::string(1, text[i]) + "' at position " +
                     std::to_string(i) + " in " + std::string(what) + " text";
      util::logger()->debug("Base32 decode failed: {}", message);
      return makeErrorResult<void>(ErrorCode::kMalformedText, message);
    }

    for (std::size_t b = 0; b < kBitsPerChar; ++b) {
      unsigned bit = (static_cast<unsigned>(value) >> (kBitsPerChar - 1 - b)) & 1u;
      std::size_t stream_pos = i * kBitsPerChar + b;
      if (stream_pos < spare) {
        if (bit != 0) {
          auto message = std::string(what) + " text " + std::string(text) + " exceeds " +
                         std::to_string(out.size() * 8) + " bits";
          util::logger()->debug("Base32 decode failed: {}", message);
          return makeErrorResult<void>(ErrorCode::kMalformedText, message);
        }
        continue;
      }
      std::size_t pos = stream_pos - spare;
      out[pos / 8] = static_cast<std::uint8_t>(out[pos / 8] | (bit << (7 - pos % 8)));
    }
  }

  return {};
}

template <std::size_t N>
Result<std::array<std::uint8_t, N>> decodeFixed(std::string_view text, std::string_view what) {
  std::array<std::uint8_t, N> bytes{};
  auto result = decodeBuffer(text, bytes, what);
  if (!result) {
    return std::unexpected(result.error());
  }
  return bytes;
}

}  // namespace

std::string encodeTimestamp(const TimestampBytes& bytes) {
  return encodeBuffer(bytes);
}

std::string encodeRandomness(const RandomnessBytes& bytes) {
  return encodeBuffer(bytes);
}

std::string encodeUlid(const UlidBytes& bytes) {
  return encodeBuffer(bytes);
}

Result<std::string> encode(std::span<const std::uint8_t> bytes) {
  switch (bytes.size()) {
    case kTimestampSize:
    case kRandomnessSize:
    case kUlidSize:
      return encodeBuffer(bytes);
    default:
      return makeErrorResult<std::string>(
          ErrorCode::kWidthMismatch,
          "Expects 6, 10 or 16 bytes to encode; got " + std::to_string(bytes.size()) + " bytes");
  }
}

Result<TimestampBytes> decodeTimestamp(std::string_view text) {
  return decodeFixed<kTimestampSize>(text, "timestamp");
}

Result<RandomnessBytes> decodeRandomness(std::string_view text) {
  return decodeFixed<kRandomnessSize>(text, "randomness");
}

Result<UlidBytes> decodeUlid(std::string_view text) {
  return decodeFixed<kUlidSize>(text, "ULID");
}

Result<std::vector<std::uint8_t>> decode(std::string_view text) {
  std::size_t size = 0;
  std::string_view what;
  switch (text.size()) {
    case kTimestampLength:
      size = kTimestampSize;
      what = "timestamp";
      break;
    case kRandomnessLength:
      size = kRandomnessSize;
      what = "randomness";
      break;
    case kUlidLength:
      size = kUlidSize;
      what = "ULID";
      break;
    default:
      return makeErrorResult<std::vector<std::uint8_t>>(
          ErrorCode::kMalformedText,
          "Expects 10, 16 or 26 characters to decode; got " + std::to_string(text.size()));
  }

  std::vector<std::uint8_t> bytes(size);
  auto result = decodeBuffer(text, bytes, what);
  if (!result) {
    return std::unexpected(result.error());
  }
  return bytes;
}

int decodeChar(char c) noexcept {
  if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'Z') {
    if (c == 'I' || c == 'L' || c == 'O' || c == 'U') return -1;  // Invalid chars
    if (c < 'I') return c - 'A' + 10;
    if (c < 'L') return c - 'A' + 9;
    if (c < 'O') return c - 'A' + 8;
    if (c < 'U') return c - 'A' + 7;
    return c - 'A' + 6;
  }
  return -1;
}

bool isValidUlid(std::string_view text) noexcept {
  if (text.size() != kUlidLength) {
    return false;
  }
  if (std::any_of(text.begin(), text.end(), [](char c) { return decodeChar(c) < 0; })) {
    return false;
  }
  // Leading character carries the 2 spare bits
  return decodeChar(text[0]) < 8;
}

}  // namespace ulid::codec
