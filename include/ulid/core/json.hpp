#pragma once

#include <nlohmann/json.hpp>

#include "ulid/common.hpp"
#include "ulid/core/generator.hpp"
#include "ulid/core/randomness.hpp"
#include "ulid/core/timestamp.hpp"
#include "ulid/core/ulid.hpp"

namespace ulid::core {

// nlohmann::json adapters. Values serialize as their canonical Base32 text.
// from_json throws std::invalid_argument on bad input, as get<T>() expects;
// the *FromJson functions below report errors as Result instead.
void to_json(nlohmann::json& j, const Ulid& id);
void from_json(const nlohmann::json& j, Ulid& id);
void to_json(nlohmann::json& j, const Timestamp& timestamp);
void from_json(const nlohmann::json& j, Timestamp& timestamp);
void to_json(nlohmann::json& j, const Randomness& randomness);
void from_json(const nlohmann::json& j, Randomness& randomness);

// String (Base32, hex or UUID text), non-negative integer, or 16 byte binary
Result<Ulid> ulidFromJson(const nlohmann::json& value);

// Integer or float seconds, 10 character string, or 6 byte binary
Result<TimestampInput> timestampInputFromJson(const nlohmann::json& value);

// Integer or float, 16 character string, or 10 byte binary
Result<RandomnessInput> randomnessInputFromJson(const nlohmann::json& value);

}  // namespace ulid::core
