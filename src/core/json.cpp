#include "ulid/core/json.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace ulid::core {

namespace {

template <typename T>
Result<T> unsupportedShape(const nlohmann::json& value, std::string_view expected) {
  return makeErrorResult<T>(ErrorCode::kUnsupportedShape,
                            "Expected " + std::string(expected) + "; got " +
                                value.type_name());
}

std::vector<std::uint8_t> binaryBytes(const nlohmann::json& value) {
  const auto& binary = value.get_binary();
  return std::vector<std::uint8_t>(binary.begin(), binary.end());
}

template <typename T>
T fromJsonOrThrow(const Result<T>& result) {
  if (!result) {
    throw std::invalid_argument(result.error().toString());
  }
  return *result;
}

}  // namespace

void to_json(nlohmann::json& j, const Ulid& id) {
  j = id.toString();
}

void from_json(const nlohmann::json& j, Ulid& id) {
  id = fromJsonOrThrow(ulidFromJson(j));
}

void to_json(nlohmann::json& j, const Timestamp& timestamp) {
  j = timestamp.toString();
}

void from_json(const nlohmann::json& j, Timestamp& timestamp) {
  auto input = fromJsonOrThrow(timestampInputFromJson(j));
  timestamp = fromJsonOrThrow(toTimestamp(input));
}

void to_json(nlohmann::json& j, const Randomness& randomness) {
  j = randomness.toString();
}

void from_json(const nlohmann::json& j, Randomness& randomness) {
  auto input = fromJsonOrThrow(randomnessInputFromJson(j));
  randomness = fromJsonOrThrow(toRandomness(input));
}

Result<Ulid> ulidFromJson(const nlohmann::json& value) {
  constexpr std::string_view kExpected = "string, non-negative integer or binary";

  switch (value.type()) {
    case nlohmann::json::value_t::string:
      return Ulid::parse(value.get_ref<const std::string&>());
    case nlohmann::json::value_t::number_unsigned:
      return Ulid::fromInt(value.get<std::uint64_t>());
    case nlohmann::json::value_t::number_integer:
      return Ulid::fromInt(value.get<std::int64_t>());
    case nlohmann::json::value_t::binary:
      return Ulid::fromBytes(binaryBytes(value));
    default:
      return unsupportedShape<Ulid>(value, kExpected);
  }
}

Result<TimestampInput> timestampInputFromJson(const nlohmann::json& value) {
  constexpr std::string_view kExpected = "integer, float, string or binary";

  switch (value.type()) {
    case nlohmann::json::value_t::number_integer:
      return TimestampInput{value.get<std::int64_t>()};
    case nlohmann::json::value_t::number_unsigned: {
      auto number = value.get<std::uint64_t>();
      if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return makeErrorResult<TimestampInput>(
            ErrorCode::kRangeOverflow,
            "Expects timestamp to be 48 bits; got " + std::to_string(number) + " s");
      }
      return TimestampInput{static_cast<std::int64_t>(number)};
    }
    case nlohmann::json::value_t::number_float:
      return TimestampInput{value.get<double>()};
    case nlohmann::json::value_t::string:
      return TimestampInput{value.get<std::string>()};
    case nlohmann::json::value_t::binary:
      return TimestampInput{binaryBytes(value)};
    default:
      return unsupportedShape<TimestampInput>(value, kExpected);
  }
}

Result<RandomnessInput> randomnessInputFromJson(const nlohmann::json& value) {
  constexpr std::string_view kExpected = "integer, float, string or binary";

  switch (value.type()) {
    case nlohmann::json::value_t::number_integer:
      return RandomnessInput{value.get<std::int64_t>()};
    case nlohmann::json::value_t::number_unsigned:
      return RandomnessInput{static_cast<Uint128>(value.get<std::uint64_t>())};
    case nlohmann::json::value_t::number_float:
      return RandomnessInput{value.get<double>()};
    case nlohmann::json::value_t::string:
      return RandomnessInput{value.get<std::string>()};
    case nlohmann::json::value_t::binary:
      return RandomnessInput{binaryBytes(value)};
    default:
      return unsupportedShape<RandomnessInput>(value, kExpected);
  }
}

}  // namespace ulid::core
