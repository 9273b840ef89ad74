#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "ulid/common.hpp"
#include "ulid/core/randomness.hpp"
#include "ulid/core/timestamp.hpp"
#include "ulid/core/uint128.hpp"
#include "ulid/core/ulid.hpp"
#include "ulid/util/clock.hpp"
#include "ulid/util/random.hpp"

namespace ulid::config {
class Config;
}  // namespace ulid::config

namespace ulid::core {

// Accepted timestamp shapes. Integer and floating alternatives are Unix
// seconds; text is the 10 character Base32 form; a Ulid contributes its
// timestamp component.
using TimestampInput = std::variant<std::chrono::system_clock::time_point,
                                    std::int64_t,
                                    double,
                                    std::string,
                                    std::vector<std::uint8_t>,
                                    Timestamp,
                                    Ulid>;

// Accepted randomness shapes. Numbers are truncated and encoded big-endian;
// text is the 16 character Base32 form; a Ulid contributes its randomness
// component.
using RandomnessInput = std::variant<Uint128,
                                     std::int64_t,
                                     double,
                                     std::string,
                                     std::vector<std::uint8_t>,
                                     Randomness,
                                     Ulid>;

// Reduce an input to its canonical component
Result<Timestamp> toTimestamp(const TimestampInput& input);
Result<Randomness> toRandomness(const RandomnessInput& input);

/**
 * @brief Creates ULIDs from a clock and a random source
 *
 * Each call reads the clock at most once and the random source at most
 * once. The generator holds no other state and may be shared between
 * threads as long as its sources can be.
 */
class Generator {
 public:
  // System clock and operating system randomness
  Generator();

  Generator(std::shared_ptr<util::Clock> clock, std::shared_ptr<util::RandomSource> random);

  // Sources and log level named by the configuration
  static Result<Generator> fromConfig(const config::Config& config);

  // Current time and fresh randomness
  Result<Ulid> generate() const;

  // Given timestamp and fresh randomness
  Result<Ulid> fromTimestamp(const Timestamp& timestamp) const;
  Result<Ulid> fromTimestamp(const TimestampInput& input) const;

  // Current time and given randomness
  Result<Ulid> fromRandomness(const Randomness& randomness) const;
  Result<Ulid> fromRandomness(const RandomnessInput& input) const;

  const util::Clock& clock() const { return *clock_; }
  util::RandomSource& random() const { return *random_; }

 private:
  Result<Timestamp> sampleTimestamp() const;
  Result<Randomness> drawRandomness() const;

  std::shared_ptr<util::Clock> clock_;
  std::shared_ptr<util::RandomSource> random_;
};

// Process-wide generator backed by the system sources
const Generator& defaultGenerator();

// Shorthands for defaultGenerator()
Result<Ulid> generate();
Result<Ulid> fromTimestamp(const TimestampInput& input);
Result<Ulid> fromRandomness(const RandomnessInput& input);

}  // namespace ulid::core
