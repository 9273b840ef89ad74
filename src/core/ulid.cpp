#include "ulid/core/ulid.hpp"

#include <algorithm>
#include <iterator>
#include <ostream>

namespace ulid::core {

namespace {

constexpr std::size_t kHexLength = 32;
constexpr std::size_t kUuidTextLength = 36;

}  // namespace

Result<Ulid> Ulid::fromBytes(std::span<const std::uint8_t> bytes) {
  if (bytes.size() != codec::kUlidSize) {
    return makeErrorResult<Ulid>(
        ErrorCode::kWidthMismatch,
        "Expects bytes to be 128 bits; got " + std::to_string(bytes.size()) + " bytes");
  }

  Bytes buffer{};
  std::copy(bytes.begin(), bytes.end(), buffer.begin());
  return Ulid(buffer);
}

Result<Ulid> Ulid::fromInt(Uint128 value) {
  auto bytes = toBigEndian<codec::kUlidSize>(value);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  return Ulid(*bytes);
}

Result<Ulid> Ulid::fromDecimal(std::string_view str) {
  auto value = parseDecimal(str);
  if (!value) {
    return std::unexpected(value.error());
  }
  return fromInt(*value);
}

Result<Ulid> Ulid::fromString(std::string_view str) {
  auto bytes = codec::decodeUlid(str);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  return Ulid(*bytes);
}

Result<Ulid> Ulid::fromHex(std::string_view str) {
  Bytes buffer{};
  auto result = parseHex(str, buffer);
  if (!result) {
    return std::unexpected(result.error());
  }
  return Ulid(buffer);
}

Ulid Ulid::fromUuid(const boost::uuids::uuid& uuid) noexcept {
  Bytes buffer{};
  std::copy(uuid.begin(), uuid.end(), buffer.begin());
  return Ulid(buffer);
}

Ulid Ulid::fromParts(const Timestamp& timestamp, const Randomness& randomness) noexcept {
  Bytes buffer{};
  auto next = std::copy(timestamp.bytes().begin(), timestamp.bytes().end(), buffer.begin());
  std::copy(randomness.bytes().begin(), randomness.bytes().end(), next);
  return Ulid(buffer);
}

Result<Ulid> Ulid::parse(std::string_view str) {
  switch (str.size()) {
    case codec::kUlidLength:
      return fromString(str);
    case kHexLength:
      return fromHex(str);
    case kUuidTextLength: {
      // 8-4-4-4-12
      for (std::size_t pos : {8u, 13u, 18u, 23u}) {
        if (str[pos] != '-') {
          return makeErrorResult<Ulid>(
              ErrorCode::kMalformedText,
              "Expected '-' at position " + std::to_string(pos) + " in UUID text");
        }
      }
      std::string hex;
      hex.reserve(kHexLength);
      std::copy_if(str.begin(), str.end(), std::back_inserter(hex),
                   [](char c) { return c != '-'; });
      if (hex.size() != kHexLength) {
        return makeErrorResult<Ulid>(ErrorCode::kMalformedText,
                                     "Unexpected '-' in UUID text " + std::string(str));
      }
      return fromHex(hex);
    }
    default:
      return makeErrorResult<Ulid>(
          ErrorCode::kMalformedText,
          "Expects 26 character ULID, 32 digit hex or 36 character UUID text; got " +
              std::to_string(str.size()) + " characters");
  }
}

Timestamp Ulid::timestamp() const noexcept {
  Timestamp::Bytes buffer{};
  std::copy_n(bytes_.begin(), buffer.size(), buffer.begin());
  return Timestamp(buffer);
}

Randomness Ulid::randomness() const noexcept {
  Randomness::Bytes buffer{};
  std::copy_n(bytes_.begin() + codec::kTimestampSize, buffer.size(), buffer.begin());
  return Randomness(buffer);
}

std::string Ulid::toString() const {
  return codec::encodeUlid(bytes_);
}

Uint128 Ulid::toInt() const noexcept {
  return fromBigEndian(bytes_);
}

std::string Ulid::toDecimal() const {
  return toDecimalString(toInt());
}

std::string Ulid::toHex() const {
  return toHexString(bytes_);
}

boost::uuids::uuid Ulid::toUuid() const noexcept {
  boost::uuids::uuid uuid{};
  std::copy(bytes_.begin(), bytes_.end(), uuid.begin());
  return uuid;
}

bool Ulid::isNil() const noexcept {
  return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

bool Ulid::operator==(const Ulid& other) const noexcept {
  return bytes_ == other.bytes_;
}

bool Ulid::operator!=(const Ulid& other) const noexcept {
  return !(*this == other);
}

bool Ulid::operator<(const Ulid& other) const noexcept {
  return bytes_ < other.bytes_;
}

bool Ulid::operator<=(const Ulid& other) const noexcept {
  return bytes_ <= other.bytes_;
}

bool Ulid::operator>(const Ulid& other) const noexcept {
  return bytes_ > other.bytes_;
}

bool Ulid::operator>=(const Ulid& other) const noexcept {
  return bytes_ >= other.bytes_;
}

std::size_t Ulid::Hash::operator()(const Ulid& id) const noexcept {
  auto value = id.toInt();
  return std::hash<std::uint64_t>{}(static_cast<std::uint64_t>(value) ^
                                    static_cast<std::uint64_t>(value >> 64));
}

std::ostream& operator<<(std::ostream& os, const Ulid& id) {
  return os << id.toString();
}

}  // namespace ulid::core
