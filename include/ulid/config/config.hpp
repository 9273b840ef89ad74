#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "ulid/common.hpp"

namespace ulid::config {

// Generator configuration, read from TOML:
//
//   clock = "fixed"            # "system" (default) or "fixed"
//   fixed_time_ms = 1700000000000
//   random = "seeded"          # "system" (default) or "seeded"
//   seed = 42
//   log_level = "debug"        # spdlog level name, default "warn"
class Config {
 public:
  // Defaults only; nothing is read from disk
  Config() = default;

  enum class ClockType {
    kSystem,
    kFixed
  };
  ClockType clock = ClockType::kSystem;
  std::uint64_t fixed_time_ms = 0;

  enum class RandomType {
    kSystem,
    kSeeded
  };
  RandomType random = RandomType::kSystem;
  std::uint64_t seed = 0;

  std::string log_level = "warn";

  // Load configuration from file, overriding fields it sets
  Result<void> load(const std::filesystem::path& config_path);

  // Load configuration from TOML text
  Result<void> loadFromString(std::string_view content);

  // Check field values are usable
  Result<void> validate() const;

  // Path that was loaded, empty if none
  const std::filesystem::path& configPath() const { return config_path_; }

  // $ULID_CONFIG, else $XDG_CONFIG_HOME/ulid/config.toml
  static std::filesystem::path defaultConfigPath();

  // Defaults overridden by the file at defaultConfigPath() when it exists
  static Result<Config> loadDefault();

  static std::string clockTypeToString(ClockType type);
  static Result<ClockType> stringToClockType(const std::string& str);
  static std::string randomTypeToString(RandomType type);
  static Result<RandomType> stringToRandomType(const std::string& str);

 private:
  std::filesystem::path config_path_;
};

}  // namespace ulid::config
