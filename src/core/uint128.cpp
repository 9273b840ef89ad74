#include "ulid/core/uint128.hpp"

#include <algorithm>

namespace ulid::core {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

Uint128 fromBigEndian(std::span<const std::uint8_t> bytes) noexcept {
  Uint128 value = 0;
  for (std::uint8_t byte : bytes) {
    value = (value << 8) | byte;
  }
  return value;
}

std::string toDecimalString(Uint128 value) {
  if (value == 0) {
    return "0";
  }

  std::string digits;
  while (value > 0) {
    digits += static_cast<char>('0' + static_cast<int>(value % 10));
    value /= 10;
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

Result<Uint128> parseDecimal(std::string_view text) {
  bool negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  if (text.empty()) {
    return makeErrorResult<Uint128>(ErrorCode::kMalformedText, "Expects a decimal integer");
  }

  constexpr Uint128 kMax = ~Uint128{0};
  Uint128 value = 0;
  bool overflow = false;

  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c < '0' || c > '9') {
      return makeErrorResult<Uint128>(
          ErrorCode::kMalformedText,
          "Invalid character '" + std::string(1, c) + "' at position " + std::to_string(i) +
              " in decimal integer");
    }
    // Keep scanning after overflow so bad characters still win
    auto digit = static_cast<unsigned>(c - '0');
    if (value > (kMax - digit) / 10) {
      overflow = true;
    } else if (!overflow) {
      value = value * 10 + digit;
    }
  }

  if (overflow) {
    return makeErrorResult<Uint128>(ErrorCode::kRangeOverflow,
                                    "Expects integer to be 128 bits; got " + std::string(text));
  }
  if (negative && value != 0) {
    return makeErrorResult<Uint128>(ErrorCode::kRangeOverflow, "Expects positive integer");
  }
  return value;
}

std::string toHexString(std::span<const std::uint8_t> bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(bytes.size() * 2);
  for (std::uint8_t byte : bytes) {
    result += kHex[byte >> 4];
    result += kHex[byte & 0x0F];
  }
  return result;
}

Result<void> parseHex(std::string_view text, std::span<std::uint8_t> bytes) {
  if (text.size() != bytes.size() * 2) {
    return makeErrorResult<void>(
        ErrorCode::kMalformedText,
        "Expected " + std::to_string(bytes.size() * 2) + " hex digits; got " +
            std::to_string(text.size()));
  }

  for (std::size_t i = 0; i < bytes.size(); ++i) {
    int high = hexValue(text[i * 2]);
    int low = hexValue(text[i * 2 + 1]);
    if (high < 0 || low < 0) {
      std::size_t pos = high < 0 ? i * 2 : i * 2 + 1;
      return makeErrorResult<void>(
          ErrorCode::kMalformedText,
          "Invalid hex character '" + std::string(1, text[pos]) + "' at position " +
              std::to_string(pos));
    }
    bytes[i] = static_cast<std::uint8_t>((high << 4) | low);
  }
  return {};
}

}  // namespace ulid::core
