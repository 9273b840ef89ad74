#include "ulid/core/timestamp.hpp"

#include <algorithm>
#include <cmath>
#include <string_view>

#include "ulid/core/uint128.hpp"

namespace ulid::core {

Result<Timestamp> Timestamp::fromBytes(std::span<const std::uint8_t> bytes) {
  if (bytes.size() != codec::kTimestampSize) {
    return makeErrorResult<Timestamp>(
        ErrorCode::kWidthMismatch,
        "Expects timestamp to be 48 bits; got " + std::to_string(bytes.size()) + " bytes");
  }

  Bytes buffer{};
  std::copy(bytes.begin(), bytes.end(), buffer.begin());
  return Timestamp(buffer);
}

Result<Timestamp> Timestamp::fromMilliseconds(std::uint64_t milliseconds) {
  auto bytes = toBigEndian<codec::kTimestampSize>(milliseconds);
  if (!bytes) {
    return makeErrorResult<Timestamp>(
        ErrorCode::kRangeOverflow,
        "Expects timestamp to be 48 bits; got " + std::to_string(milliseconds) + " ms");
  }
  return Timestamp(*bytes);
}

Result<Timestamp> Timestamp::fromWholeSeconds(std::int64_t seconds) {
  if (seconds < 0) {
    return makeErrorResult<Timestamp>(
        ErrorCode::kRangeOverflow,
        "Expects non-negative timestamp; got " + std::to_string(seconds) + " s");
  }
  if (static_cast<std::uint64_t>(seconds) > kMaxMilliseconds / 1000) {
    return makeErrorResult<Timestamp>(
        ErrorCode::kRangeOverflow,
        "Expects timestamp to be 48 bits; got " + std::to_string(seconds) + " s");
  }
  return fromMilliseconds(static_cast<std::uint64_t>(seconds) * 1000);
}

Result<Timestamp> Timestamp::fromSeconds(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0.0) {
    return makeErrorResult<Timestamp>(
        ErrorCode::kRangeOverflow,
        "Expects finite non-negative timestamp; got " + std::to_string(seconds) + " s");
  }

  double milliseconds = std::trunc(seconds * 1000.0);
  if (milliseconds > static_cast<double>(kMaxMilliseconds)) {
    return makeErrorResult<Timestamp>(
        ErrorCode::kRangeOverflow,
        "Expects timestamp to be 48 bits; got " + std::to_string(seconds) + " s");
  }
  return fromMilliseconds(static_cast<std::uint64_t>(milliseconds));
}

Result<Timestamp> Timestamp::fromTimePoint(util::TimePoint time) {
  auto milliseconds = util::Time::toMilliseconds(time);
  if (milliseconds < 0) {
    return makeErrorResult<Timestamp>(
        ErrorCode::kRangeOverflow,
        "Expects time after the Unix epoch; got " + util::Time::toRfc3339(time));
  }
  return fromMilliseconds(static_cast<std::uint64_t>(milliseconds));
}

Result<Timestamp> Timestamp::fromString(std::string_view str) {
  auto bytes = codec::decodeTimestamp(str);
  if (!bytes) {
    return std::unexpected(bytes.error());
  }
  return Timestamp(*bytes);
}

Result<Timestamp> Timestamp::fromRfc3339(const std::string& str) {
  auto time = util::Time::fromRfc3339(str);
  if (!time) {
    return std::unexpected(time.error());
  }
  return fromTimePoint(*time);
}

std::uint64_t Timestamp::milliseconds() const noexcept {
  return static_cast<std::uint64_t>(fromBigEndian(bytes_));
}

double Timestamp::seconds() const noexcept {
  return static_cast<double>(milliseconds()) / 1000.0;
}

util::TimePoint Timestamp::timePoint() const {
  return util::Time::fromMilliseconds(milliseconds());
}

std::string Timestamp::toRfc3339() const {
  return util::Time::toRfc3339(timePoint());
}

std::string Timestamp::toString() const {
  return codec::encodeTimestamp(bytes_);
}

bool Timestamp::operator==(const Timestamp& other) const noexcept {
  return bytes_ == other.bytes_;
}

bool Timestamp::operator!=(const Timestamp& other) const noexcept {
  return !(*this == other);
}

bool Timestamp::operator<(const Timestamp& other) const noexcept {
  return bytes_ < other.bytes_;
}

bool Timestamp::operator<=(const Timestamp& other) const noexcept {
  return bytes_ <= other.bytes_;
}

bool Timestamp::operator>(const Timestamp& other) const noexcept {
  return bytes_ > other.bytes_;
}

bool Timestamp::operator>=(const Timestamp& other) const noexcept {
  return bytes_ >= other.bytes_;
}

std::size_t Timestamp::Hash::operator()(const Timestamp& timestamp) const noexcept {
  return std::hash<std::uint64_t>{}(timestamp.milliseconds());
}

}  // namespace ulid::core
