#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "ulid/codec/base32.hpp"
#include "test_helpers.hpp"

using namespace ulid::codec;
using namespace ulid::test;
using ulid::ErrorCode;

namespace {

template <std::size_t N>
std::array<std::uint8_t, N> toArray(const std::vector<std::uint8_t>& bytes) {
  std::array<std::uint8_t, N> out{};
  std::copy_n(bytes.begin(), N, out.begin());
  return out;
}

}  // namespace

class Base32Test : public ::testing::Test {};

TEST_F(Base32Test, KnownUlidVector) {
  auto bytes = toArray<16>(bytesFromHex("0000016299B3C0005A1E3B2C4F5D6E7A"));

  EXPECT_EQ(encodeUlid(bytes), "00000P56DKR005M7HV5H7NTVKT");

  auto decoded = decodeUlid("00000P56DKR005M7HV5H7NTVKT");
  ASSERT_OK(decoded);
  EXPECT_EQ(*decoded, bytes);
}

TEST_F(Base32Test, KnownComponentVectors) {
  auto timestamp = toArray<6>(bytesFromHex("0000016299B3"));
  auto randomness = toArray<10>(bytesFromHex("C0005A1E3B2C4F5D6E7A"));

  EXPECT_EQ(encodeTimestamp(timestamp), "00000P56DK");
  EXPECT_EQ(encodeRandomness(randomness), "R005M7HV5H7NTVKT");
}

TEST_F(Base32Test, Extremes) {
  EXPECT_EQ(encodeUlid(UlidBytes{}), std::string(26, '0'));
  EXPECT_EQ(encodeTimestamp(TimestampBytes{}), std::string(10, '0'));

  UlidBytes max_ulid;
  max_ulid.fill(0xFF);
  EXPECT_EQ(encodeUlid(max_ulid), "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");

  TimestampBytes max_timestamp;
  max_timestamp.fill(0xFF);
  EXPECT_EQ(encodeTimestamp(max_timestamp), "7ZZZZZZZZZ");

  RandomnessBytes max_randomness;
  max_randomness.fill(0xFF);
  EXPECT_EQ(encodeRandomness(max_randomness), "ZZZZZZZZZZZZZZZZ");
}

TEST_F(Base32Test, DecodeIsCaseInsensitive) {
  auto upper = decodeUlid("00000P56DKR005M7HV5H7NTVKT");
  auto lower = decodeUlid("00000p56dkr005m7hv5h7ntvkt");

  ASSERT_OK(upper);
  ASSERT_OK(lower);
  EXPECT_EQ(*upper, *lower);
}

TEST_F(Base32Test, RoundTripRandomBuffers) {
  std::mt19937 gen(12345);
  std::uniform_int_distribution<int> dist(0, 255);

  for (int i = 0; i < 200; ++i) {
    UlidBytes bytes;
    for (auto& b : bytes) b = static_cast<std::uint8_t>(dist(gen));

    auto text = encodeUlid(bytes);
    EXPECT_EQ(text.size(), kUlidLength);
    auto decoded = decodeUlid(text);
    ASSERT_OK(decoded);
    EXPECT_EQ(*decoded, bytes);
  }
}

TEST_F(Base32Test, WrongLengthRejected) {
  EXPECT_ERROR(decodeUlid(std::string(25, '0')), ErrorCode::kMalformedText);
  EXPECT_ERROR(decodeUlid(std::string(27, '0')), ErrorCode::kMalformedText);
  EXPECT_ERROR(decodeTimestamp("000000000"), ErrorCode::kMalformedText);
  EXPECT_ERROR(decodeRandomness("00000000000000000"), ErrorCode::kMalformedText);
  EXPECT_ERROR(decodeUlid(""), ErrorCode::kMalformedText);
}

TEST_F(Base32Test, CharactersOutsideAlphabetRejected) {
  EXPECT_ERROR(decodeUlid("00000P56DKR005M7HV5H7NTVKI"), ErrorCode::kMalformedText);
  EXPECT_ERROR(decodeUlid("00000P56DKR005M7HV5H7NTVKL"), ErrorCode::kMalformedText);
  EXPECT_ERROR(decodeUlid("00000P56DKR005M7HV5H7NTVKO"), ErrorCode::kMalformedText);
  EXPECT_ERROR(decodeUlid("00000P56DKR005M7HV5H7NTVKU"), ErrorCode::kMalformedText);
  EXPECT_ERROR(decodeUlid("00000P56DKR005M7HV5H7NTVK-"), ErrorCode::kMalformedText);
  EXPECT_ERROR(decodeUlid("00000P56DKR005M7HV5H7NTVK="), ErrorCode::kMalformedText);
}

TEST_F(Base32Test, ErrorNamesOffendingCharacter) {
  auto result = decodeUlid("00000P56DKR005M7HV5H7NTVKU");
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message().find("'U'"), std::string::npos);
  EXPECT_NE(result.error().message().find("25"), std::string::npos);
}

TEST_F(Base32Test, OverflowingLeadingCharacterRejected) {
  EXPECT_OK(decodeUlid("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"));
  EXPECT_ERROR(decodeUlid("8ZZZZZZZZZZZZZZZZZZZZZZZZZ"), ErrorCode::kMalformedText);
  EXPECT_ERROR(decodeUlid("80000000000000000000000000"), ErrorCode::kMalformedText);

  EXPECT_OK(decodeTimestamp("7ZZZZZZZZZ"));
  EXPECT_ERROR(decodeTimestamp("8000000000"), ErrorCode::kMalformedText);

  // Randomness has no spare bits
  EXPECT_OK(decodeRandomness("ZZZZZZZZZZZZZZZZ"));
}

TEST_F(Base32Test, GenericEncodeChoosesWidth) {
  std::vector<std::uint8_t> six(6, 0xFF);
  std::vector<std::uint8_t> ten(10, 0xFF);
  std::vector<std::uint8_t> sixteen(16, 0xFF);

  auto a = encode(six);
  auto b = encode(ten);
  auto c = encode(sixteen);
  ASSERT_OK(a);
  ASSERT_OK(b);
  ASSERT_OK(c);
  EXPECT_EQ(a->size(), 10u);
  EXPECT_EQ(b->size(), 16u);
  EXPECT_EQ(c->size(), 26u);

  EXPECT_ERROR(encode(std::vector<std::uint8_t>(15)), ErrorCode::kWidthMismatch);
  EXPECT_ERROR(encode(std::vector<std::uint8_t>(0)), ErrorCode::kWidthMismatch);
}

TEST_F(Base32Test, GenericDecodeChoosesWidth) {
  auto timestamp = decode("00000P56DK");
  auto randomness = decode("R005M7HV5H7NTVKT");
  auto id = decode("00000P56DKR005M7HV5H7NTVKT");

  ASSERT_OK(timestamp);
  ASSERT_OK(randomness);
  ASSERT_OK(id);
  EXPECT_EQ(*timestamp, bytesFromHex("0000016299B3"));
  EXPECT_EQ(*randomness, bytesFromHex("C0005A1E3B2C4F5D6E7A"));
  EXPECT_EQ(*id, bytesFromHex("0000016299B3C0005A1E3B2C4F5D6E7A"));

  EXPECT_ERROR(decode("0000"), ErrorCode::kMalformedText);
}

TEST_F(Base32Test, TextOrderMatchesByteOrder) {
  std::mt19937 gen(99);
  std::uniform_int_distribution<int> dist(0, 255);

  std::vector<UlidBytes> buffers(100);
  for (auto& bytes : buffers) {
    for (auto& b : bytes) b = static_cast<std::uint8_t>(dist(gen));
  }

  for (std::size_t i = 1; i < buffers.size(); ++i) {
    const auto& a = buffers[i - 1];
    const auto& b = buffers[i];
    EXPECT_EQ(a < b, encodeUlid(a) < encodeUlid(b));
  }
}

TEST_F(Base32Test, DecodeChar) {
  EXPECT_EQ(decodeChar('0'), 0);
  EXPECT_EQ(decodeChar('9'), 9);
  EXPECT_EQ(decodeChar('A'), 10);
  EXPECT_EQ(decodeChar('h'), 17);
  EXPECT_EQ(decodeChar('J'), 18);
  EXPECT_EQ(decodeChar('M'), 20);
  EXPECT_EQ(decodeChar('P'), 22);
  EXPECT_EQ(decodeChar('V'), 27);
  EXPECT_EQ(decodeChar('z'), 31);
  EXPECT_EQ(decodeChar('I'), -1);
  EXPECT_EQ(decodeChar('u'), -1);
  EXPECT_EQ(decodeChar('*'), -1);

  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    EXPECT_EQ(decodeChar(kAlphabet[i]), static_cast<int>(i));
  }
}

TEST_F(Base32Test, IsValidUlid) {
  EXPECT_TRUE(isValidUlid("00000P56DKR005M7HV5H7NTVKT"));
  EXPECT_TRUE(isValidUlid("7zzzzzzzzzzzzzzzzzzzzzzzzz"));
  EXPECT_FALSE(isValidUlid("8ZZZZZZZZZZZZZZZZZZZZZZZZZ"));
  EXPECT_FALSE(isValidUlid("00000P56DKR005M7HV5H7NTVK"));
  EXPECT_FALSE(isValidUlid("00000P56DKR005M7HV5H7NTVKO"));
}
