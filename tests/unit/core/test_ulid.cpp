#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <sstream>
#include <unordered_map>

#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/string_generator.hpp>

#include "ulid/core/ulid.hpp"
#include "test_helpers.hpp"

using namespace ulid::core;
using namespace ulid::test;
using ulid::ErrorCode;

namespace {

constexpr const char* kKnownHex = "0000016299B3C0005A1E3B2C4F5D6E7A";
constexpr const char* kKnownText = "00000P56DKR005M7HV5H7NTVKT";
constexpr const char* kKnownDecimal = "28094338040974810725997814312570";

std::vector<Ulid> randomUlids(std::size_t count, unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<Ulid> ids;
  for (std::size_t i = 0; i < count; ++i) {
    Ulid::Bytes bytes;
    for (auto& b : bytes) b = static_cast<std::uint8_t>(dist(gen));
    ids.emplace_back(bytes);
  }
  return ids;
}

}  // namespace

class UlidTest : public ::testing::Test {};

TEST_F(UlidTest, KnownVector) {
  auto id = Ulid::fromBytes(bytesFromHex(kKnownHex));
  ASSERT_OK(id);

  EXPECT_EQ(id->toString(), kKnownText);
  EXPECT_EQ(id->toDecimal(), kKnownDecimal);
  EXPECT_EQ(id->toHex(), "0000016299b3c0005a1e3b2c4f5d6e7a");

  auto parsed = Ulid::fromString(kKnownText);
  ASSERT_OK(parsed);
  EXPECT_EQ(*parsed, *id);
  EXPECT_EQ(std::vector<std::uint8_t>(parsed->bytes().begin(), parsed->bytes().end()),
            bytesFromHex(kKnownHex));
}

TEST_F(UlidTest, Components) {
  auto id = Ulid::fromString(kKnownText);
  ASSERT_OK(id);

  EXPECT_EQ(id->timestamp().milliseconds(), 23239091u);
  EXPECT_EQ(id->timestamp().toString(), "00000P56DK");
  EXPECT_EQ(id->randomness().toString(), "R005M7HV5H7NTVKT");
  EXPECT_EQ(Ulid::fromParts(id->timestamp(), id->randomness()), *id);
}

TEST_F(UlidTest, FromBytesRequiresSixteenBytes) {
  EXPECT_ERROR(Ulid::fromBytes(std::vector<std::uint8_t>(15)), ErrorCode::kWidthMismatch);
  EXPECT_ERROR(Ulid::fromBytes(std::vector<std::uint8_t>(17)), ErrorCode::kWidthMismatch);
  EXPECT_ERROR(Ulid::fromBytes(std::vector<std::uint8_t>{}), ErrorCode::kWidthMismatch);
}

TEST_F(UlidTest, FromStringRejectsMalformed) {
  EXPECT_ERROR(Ulid::fromString(std::string(kKnownText).substr(0, 25)), ErrorCode::kMalformedText);
  EXPECT_ERROR(Ulid::fromString(std::string(kKnownText) + "0"), ErrorCode::kMalformedText);
  EXPECT_ERROR(Ulid::fromString("00000P56DKR005M7HV5H7NTVKI"), ErrorCode::kMalformedText);
  EXPECT_ERROR(Ulid::fromString("00000P56DKR005M7HV5H7NTVKL"), ErrorCode::kMalformedText);
  EXPECT_ERROR(Ulid::fromString("00000P56DKR005M7HV5H7NTVKO"), ErrorCode::kMalformedText);
  EXPECT_ERROR(Ulid::fromString("00000P56DKR005M7HV5H7NTVKU"), ErrorCode::kMalformedText);
  EXPECT_ERROR(Ulid::fromString("8ZZZZZZZZZZZZZZZZZZZZZZZZZ"), ErrorCode::kMalformedText);
}

TEST_F(UlidTest, IntegerConversions) {
  auto id = Ulid::fromDecimal(kKnownDecimal);
  ASSERT_OK(id);
  EXPECT_EQ(id->toString(), kKnownText);
  EXPECT_EQ(*Ulid::fromInt(id->toInt()), *id);

  auto max = Ulid::fromDecimal("340282366920938463463374607431768211455");
  ASSERT_OK(max);
  EXPECT_EQ(max->toString(), "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");

  // 2^128 needs 17 bytes
  EXPECT_ERROR(Ulid::fromDecimal("340282366920938463463374607431768211456"),
               ErrorCode::kRangeOverflow);
  EXPECT_ERROR(Ulid::fromDecimal("-1"), ErrorCode::kRangeOverflow);
  EXPECT_ERROR(Ulid::fromInt(-1), ErrorCode::kRangeOverflow);

  auto small = Ulid::fromInt(258);
  ASSERT_OK(small);
  EXPECT_EQ(small->toHex(), "00000000000000000000000000000102");

  auto all_ones = Ulid::fromInt(~Uint128{0});
  ASSERT_OK(all_ones);
  EXPECT_EQ(all_ones->toString(), "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
  EXPECT_EQ(all_ones->toInt(), ~Uint128{0});
}

template <typename T>
concept AcceptsInteger = requires(T value) { Ulid::fromInt(value); };

static_assert(AcceptsInteger<int>);
static_assert(AcceptsInteger<std::uint8_t>);
static_assert(AcceptsInteger<Uint128>);
static_assert(!AcceptsInteger<bool>);
static_assert(!AcceptsInteger<char>);

TEST_F(UlidTest, RoundTrips) {
  for (const auto& id : randomUlids(100, 7)) {
    auto from_text = Ulid::fromString(id.toString());
    ASSERT_OK(from_text);
    EXPECT_EQ(*from_text, id);

    EXPECT_EQ(*Ulid::fromInt(id.toInt()), id);

    auto from_decimal = Ulid::fromDecimal(id.toDecimal());
    ASSERT_OK(from_decimal);
    EXPECT_EQ(*from_decimal, id);

    EXPECT_EQ(Ulid::fromUuid(id.toUuid()), id);
  }
}

TEST_F(UlidTest, OrderPreservation) {
  auto ids = randomUlids(200, 11);

  for (std::size_t i = 1; i < ids.size(); ++i) {
    const auto& a = ids[i - 1];
    const auto& b = ids[i];
    bool bytes_less = a.bytes() < b.bytes();
    EXPECT_EQ(bytes_less, a < b);
    EXPECT_EQ(bytes_less, a.toString() < b.toString());
    EXPECT_EQ(bytes_less, a.toInt() < b.toInt());
  }

  auto by_text = ids;
  std::sort(by_text.begin(), by_text.end(),
            [](const Ulid& a, const Ulid& b) { return a.toString() < b.toString(); });
  auto by_value = ids;
  std::sort(by_value.begin(), by_value.end());
  EXPECT_EQ(by_text, by_value);
}

TEST_F(UlidTest, UuidReinterpretsBytes) {
  boost::uuids::string_generator gen;
  auto uuid = gen("00000162-99b3-c000-5a1e-3b2c4f5d6e7a");

  auto id = Ulid::fromUuid(uuid);
  EXPECT_EQ(id.toString(), kKnownText);
  EXPECT_EQ(boost::uuids::to_string(id.toUuid()), "00000162-99b3-c000-5a1e-3b2c4f5d6e7a");
}

TEST_F(UlidTest, ParseAcceptsSeveralTextForms) {
  auto from_base32 = Ulid::parse(kKnownText);
  auto from_hex = Ulid::parse("0000016299b3c0005a1e3b2c4f5d6e7a");
  auto from_uuid = Ulid::parse("00000162-99B3-C000-5A1E-3B2C4F5D6E7A");

  ASSERT_OK(from_base32);
  ASSERT_OK(from_hex);
  ASSERT_OK(from_uuid);
  EXPECT_EQ(*from_base32, *from_hex);
  EXPECT_EQ(*from_base32, *from_uuid);

  EXPECT_ERROR(Ulid::parse("not-an-id"), ErrorCode::kMalformedText);
  EXPECT_ERROR(Ulid::parse("00000162x99b3-c000-5a1e-3b2c4f5d6e7a"), ErrorCode::kMalformedText);
  EXPECT_ERROR(Ulid::parse("0000016299b3c0005a1e3b2c4f5d6e7g"), ErrorCode::kMalformedText);
}

TEST_F(UlidTest, DefaultIsNil) {
  Ulid id;
  EXPECT_TRUE(id.isNil());
  EXPECT_EQ(id.toString(), "00000000000000000000000000");
  EXPECT_FALSE(Ulid::fromString(kKnownText)->isNil());
}

TEST_F(UlidTest, StreamOutput) {
  std::ostringstream oss;
  oss << *Ulid::fromString(kKnownText);
  EXPECT_EQ(oss.str(), kKnownText);
}

TEST_F(UlidTest, UnorderedMapUsage) {
  std::unordered_map<Ulid, std::string> map;
  auto ids = randomUlids(2, 3);

  map[ids[0]] = "first";
  map[ids[1]] = "second";

  EXPECT_EQ(map[ids[0]], "first");
  EXPECT_EQ(map[ids[1]], "second");
  EXPECT_EQ(map.size(), 2u);
}
