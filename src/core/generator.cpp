#include "ulid/core/generator.hpp"

#include <type_traits>

#include "ulid/config/config.hpp"
#include "ulid/util/log.hpp"

namespace ulid::core {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

Result<Timestamp> toTimestamp(const TimestampInput& input) {
  return std::visit(
      Overloaded{
          [](const std::chrono::system_clock::time_point& time) {
            return Timestamp::fromTimePoint(time);
          },
          [](std::int64_t seconds) { return Timestamp::fromSeconds(seconds); },
          [](double seconds) { return Timestamp::fromSeconds(seconds); },
          [](const std::string& text) { return Timestamp::fromString(text); },
          [](const std::vector<std::uint8_t>& bytes) { return Timestamp::fromBytes(bytes); },
          [](const Timestamp& timestamp) -> Result<Timestamp> { return timestamp; },
          [](const Ulid& id) -> Result<Timestamp> { return id.timestamp(); },
      },
      input);
}

Result<Randomness> toRandomness(const RandomnessInput& input) {
  return std::visit(
      Overloaded{
          [](Uint128 value) { return Randomness::fromInt(value); },
          [](std::int64_t value) { return Randomness::fromInt(value); },
          [](double value) { return Randomness::fromDouble(value); },
          [](const std::string& text) { return Randomness::fromString(text); },
          [](const std::vector<std::uint8_t>& bytes) { return Randomness::fromBytes(bytes); },
          [](const Randomness& randomness) -> Result<Randomness> { return randomness; },
          [](const Ulid& id) -> Result<Randomness> { return id.randomness(); },
      },
      input);
}

Generator::Generator()
    : Generator(std::make_shared<util::SystemClock>(), std::make_shared<util::SystemRandom>()) {}

Generator::Generator(std::shared_ptr<util::Clock> clock,
                     std::shared_ptr<util::RandomSource> random)
    : clock_(std::move(clock)), random_(std::move(random)) {}

Result<Generator> Generator::fromConfig(const config::Config& config) {
  auto valid = config.validate();
  if (!valid) {
    return std::unexpected(valid.error());
  }

  auto level = util::setLogLevel(config.log_level);
  if (!level) {
    return std::unexpected(level.error());
  }

  std::shared_ptr<util::Clock> clock;
  switch (config.clock) {
    case config::Config::ClockType::kSystem:
      clock = std::make_shared<util::SystemClock>();
      break;
    case config::Config::ClockType::kFixed:
      clock = std::make_shared<util::FixedClock>(config.fixed_time_ms);
      break;
  }

  std::shared_ptr<util::RandomSource> random;
  switch (config.random) {
    case config::Config::RandomType::kSystem:
      random = std::make_shared<util::SystemRandom>();
      break;
    case config::Config::RandomType::kSeeded:
      random = std::make_shared<util::SeededRandom>(config.seed);
      break;
  }

  util::logger()->info("Generator configured: clock={}, random={}",
                       config::Config::clockTypeToString(config.clock),
                       config::Config::randomTypeToString(config.random));
  return Generator(std::move(clock), std::move(random));
}

Result<Ulid> Generator::generate() const {
  auto timestamp = sampleTimestamp();
  if (!timestamp) {
    return std::unexpected(timestamp.error());
  }
  return fromTimestamp(*timestamp);
}

Result<Ulid> Generator::fromTimestamp(const Timestamp& timestamp) const {
  auto randomness = drawRandomness();
  if (!randomness) {
    return std::unexpected(randomness.error());
  }

  auto id = Ulid::fromParts(timestamp, *randomness);
  util::logger()->trace("Generated ULID {}", id.toString());
  return id;
}

Result<Ulid> Generator::fromTimestamp(const TimestampInput& input) const {
  auto timestamp = toTimestamp(input);
  if (!timestamp) {
    return std::unexpected(timestamp.error());
  }
  return fromTimestamp(*timestamp);
}

Result<Ulid> Generator::fromRandomness(const Randomness& randomness) const {
  auto timestamp = sampleTimestamp();
  if (!timestamp) {
    return std::unexpected(timestamp.error());
  }
  return Ulid::fromParts(*timestamp, randomness);
}

Result<Ulid> Generator::fromRandomness(const RandomnessInput& input) const {
  auto randomness = toRandomness(input);
  if (!randomness) {
    return std::unexpected(randomness.error());
  }
  return fromRandomness(*randomness);
}

Result<Timestamp> Generator::sampleTimestamp() const {
  auto timestamp = Timestamp::fromMilliseconds(clock_->nowMilliseconds());
  if (!timestamp) {
    util::logError(timestamp.error(), "sampleTimestamp");
  }
  return timestamp;
}

Result<Randomness> Generator::drawRandomness() const {
  Randomness::Bytes bytes{};
  auto filled = random_->fill(bytes);
  if (!filled) {
    util::logError(filled.error(), "drawRandomness");
    return std::unexpected(filled.error());
  }
  return Randomness(bytes);
}

const Generator& defaultGenerator() {
  static const Generator instance;
  return instance;
}

Result<Ulid> generate() {
  return defaultGenerator().generate();
}

Result<Ulid> fromTimestamp(const TimestampInput& input) {
  return defaultGenerator().fromTimestamp(input);
}

Result<Ulid> fromRandomness(const RandomnessInput& input) {
  return defaultGenerator().fromRandomness(input);
}

}  // namespace ulid::core
