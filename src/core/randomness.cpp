#include "ulid/core/randomness.hpp"

#include <algorithm>
#include <cmath>
#include <string_view>

namespace ulid::core {

Result<Randomness> Randomness::fromBytes(std::span<const std::uint8_t> bytes) {
  if (bytes.size() != codec::kRandomnessSize) {
    return makeErrorResult<Randomness>(
        ErrorCode::kWidthMismatch,
        "Expects randomness to be 80 bits; got " + std::to_string(bytes.size()) + " bytes");
  }

  Bytes buffer{};
  std::copy(bytes.begin(), bytes.end(), buffer.begin());
  return Randomness(buffer);
}

Result<Randomness> Randomness::fromInt(Uint128 value) {
  auto bytes = toBigEndian<codec::kRandomnessSize>(value);
  if (!bytes) {
    return makeErrorResult<Randomness>(
        ErrorCode::kRangeOverflow,
        "Expects randomness to be 80 bits; got " + toDecimalString(value));
  }
  return Randomness(*bytes);
}

Result<Randomness> Randomness::fromDouble(double value) {
  if (!std::isfinite(value) || value <= -1.0) {
    return makeErrorResult<Randomness>(
        ErrorCode::kRangeOverflow,
        "Expects finite positive number; got " + std::to_string(value));
  }

  double truncated = std::trunc(value);
  // 2^80 is exact in a double
  if (truncated >= std::ldexp(1.0, 80)) {
    return makeErrorResult<Randomness>(
        ErrorCode::kRangeOverflow,
        "Expects randomness to be 80 bits; got " + std::to_string(value));
  }
  return fromInt(static_cast<Uint128>(truncated));
}

Result<Randomness> Randomness::fromString(std::string_view str) {
  auto bytes = codec::decodeRandomness(str);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  return Randomness(*bytes);
}

Uint128 Randomness::toInt() const noexcept {
  return fromBigEndian(bytes_);
}

std::string Randomness::toString() const {
  return codec::encodeRandomness(bytes_);
}

std::string Randomness::toHex() const {
  return toHexString(bytes_);
}

bool Randomness::operator==(const Randomness& other) const noexcept {
  return bytes_ == other.bytes_;
}

bool Randomness::operator!=(const Randomness& other) const noexcept {
  return !(*this == other);
}

bool Randomness::operator<(const Randomness& other) const noexcept {
  return bytes_ < other.bytes_;
}

bool Randomness::operator<=(const Randomness& other) const noexcept {
  return bytes_ <= other.bytes_;
}

bool Randomness::operator>(const Randomness& other) const noexcept {
  return bytes_ > other.bytes_;
}

bool Randomness::operator>=(const Randomness& other) const noexcept {
  return bytes_ >= other.bytes_;
}

std::size_t Randomness::Hash::operator()(const Randomness& randomness) const noexcept {
  auto value = randomness.toInt();
  return std::hash<std::uint64_t>{}(static_cast<std::uint64_t>(value) ^
                                    static_cast<std::uint64_t>(value >> 64));
}

}  // namespace ulid::core
