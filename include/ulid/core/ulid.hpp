#pragma once

#include <concepts>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include <boost/uuid/uuid.hpp>

#include "ulid/codec/base32.hpp"
#include "ulid/common.hpp"
#include "ulid/core/randomness.hpp"
#include "ulid/core/timestamp.hpp"
#include "ulid/core/uint128.hpp"

namespace ulid::core {

// ULID (Universally Unique Lexicographically Sortable Identifier)
// 16 big-endian bytes: 48-bit millisecond timestamp then 80 random bits.
// Byte order, integer order and canonical text order agree.
class Ulid {
 public:
  using Bytes = codec::UlidBytes;

  // Exactly 16 bytes, used verbatim
  static Result<Ulid> fromBytes(std::span<const std::uint8_t> bytes);

  // Big-endian rendering of the 128-bit value
  static Result<Ulid> fromInt(Uint128 value);

  // Negative values are kRangeOverflow
  template <Integer T>
  static Result<Ulid> fromInt(T value) {
    if constexpr (std::is_signed_v<T>) {
      if (value < 0) {
        return makeErrorResult<Ulid>(ErrorCode::kRangeOverflow,
                                     "Expects positive integer; got " + std::to_string(value));
      }
    }
    return fromInt(static_cast<Uint128>(value));
  }
  template <std::integral T>
    requires(!Integer<T>)
  static Result<Ulid> fromInt(T) = delete;

  // Decimal integer text of any size; fails unless 0 <= value < 2^128
  static Result<Ulid> fromDecimal(std::string_view str);

  // 26 character Base32 text
  static Result<Ulid> fromString(std::string_view str);

  // 32 hex digits
  static Result<Ulid> fromHex(std::string_view str);

  // Raw UUID bytes reinterpreted; the UUID's own version and time fields
  // carry no meaning here
  static Ulid fromUuid(const boost::uuids::uuid& uuid) noexcept;

  static Ulid fromParts(const Timestamp& timestamp, const Randomness& randomness) noexcept;

  // Accepts Base32 (26), hex (32) or hyphenated UUID (36) text
  static Result<Ulid> parse(std::string_view str);

  // Default constructor creates the nil ULID (all zero bytes)
  Ulid() = default;
  explicit Ulid(const Bytes& bytes) noexcept : bytes_(bytes) {}

  const Bytes& bytes() const noexcept { return bytes_; }

  Timestamp timestamp() const noexcept;
  Randomness randomness() const noexcept;

  // Get string representation
  std::string toString() const;

  Uint128 toInt() const noexcept;
  std::string toDecimal() const;
  std::string toHex() const;
  boost::uuids::uuid toUuid() const noexcept;

  bool isNil() const noexcept;

  // Comparison operators
  bool operator==(const Ulid& other) const noexcept;
  bool operator!=(const Ulid& other) const noexcept;
  bool operator<(const Ulid& other) const noexcept;
  bool operator<=(const Ulid& other) const noexcept;
  bool operator>(const Ulid& other) const noexcept;
  bool operator>=(const Ulid& other) const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const Ulid& id) const noexcept;
  };

 private:
  Bytes bytes_{};
};

std::ostream& operator<<(std::ostream& os, const Ulid& id);

}  // namespace ulid::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<ulid::core::Ulid> : ulid::core::Ulid::Hash {};
}  // namespace std
