#include "ulid/config/config.hpp"

#include <cstdlib>
#include <sstream>

#include <toml++/toml.hpp>

#include "ulid/core/timestamp.hpp"
#include "ulid/util/log.hpp"

namespace ulid::config {

namespace {

// Apply parsed TOML to the config fields
Result<void> applyTable(const toml::table& config_data, Config& config) {
  if (auto node = config_data["clock"]) {
    auto value = node.value<std::string>();
    if (!value) {
      return makeErrorResult<void>(ErrorCode::kConfigError, "clock must be a string");
    }
    auto type = Config::stringToClockType(*value);
    if (!type) {
      return std::unexpected(type.error());
    }
    config.clock = *type;
  }

  if (auto node = config_data["fixed_time_ms"]) {
    auto value = node.value<std::int64_t>();
    if (!value || *value < 0) {
      return makeErrorResult<void>(ErrorCode::kConfigError,
                                   "fixed_time_ms must be a non-negative integer");
    }
    config.fixed_time_ms = static_cast<std::uint64_t>(*value);
  }

  if (auto node = config_data["random"]) {
    auto value = node.value<std::string>();
    if (!value) {
      return makeErrorResult<void>(ErrorCode::kConfigError, "random must be a string");
    }
    auto type = Config::stringToRandomType(*value);
    if (!type) {
      return std::unexpected(type.error());
    }
    config.random = *type;
  }

  if (auto node = config_data["seed"]) {
    auto value = node.value<std::int64_t>();
    if (!value) {
      return makeErrorResult<void>(ErrorCode::kConfigError, "seed must be an integer");
    }
    config.seed = static_cast<std::uint64_t>(*value);
  }

  if (auto node = config_data["log_level"]) {
    auto value = node.value<std::string>();
    if (!value) {
      return makeErrorResult<void>(ErrorCode::kConfigError, "log_level must be a string");
    }
    config.log_level = *value;
  }

  return config.validate();
}

std::string describeParseError(const toml::parse_error& e) {
  std::ostringstream oss;
  oss << e.description() << " (line " << e.source().begin.line << ", column "
      << e.source().begin.column << ")";
  return oss.str();
}

}  // namespace

Result<void> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());
    auto result = applyTable(config_data, *this);
    if (!result) {
      return result;
    }
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Failed to parse " + config_path.string() + ": " +
                                         describeParseError(e)));
  }

  config_path_ = config_path;
  util::logger()->info("Loaded config from {}", config_path.string());
  return {};
}

Result<void> Config::loadFromString(std::string_view content) {
  try {
    auto config_data = toml::parse(content);
    return applyTable(config_data, *this);
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Failed to parse config: " + describeParseError(e)));
  }
}

Result<void> Config::validate() const {
  if (fixed_time_ms > core::Timestamp::kMaxMilliseconds) {
    return makeErrorResult<void>(
        ErrorCode::kConfigError,
        "fixed_time_ms must fit in 48 bits; got " + std::to_string(fixed_time_ms));
  }

  auto level = util::parseLogLevel(log_level);
  if (!level) {
    return std::unexpected(level.error());
  }
  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  if (const char* path = std::getenv("ULID_CONFIG"); path && *path) {
    return path;
  }
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "ulid" / "config.toml";
  }
  const char* home = std::getenv("HOME");
  return std::filesystem::path(home ? home : ".") / ".config" / "ulid" / "config.toml";
}

Result<Config> Config::loadDefault() {
  Config config;
  auto path = defaultConfigPath();
  if (std::filesystem::exists(path)) {
    auto result = config.load(path);
    if (!result) {
      return std::unexpected(result.error());
    }
  }
  return config;
}

std::string Config::clockTypeToString(ClockType type) {
  switch (type) {
    case ClockType::kSystem:
      return "system";
    case ClockType::kFixed:
      return "fixed";
  }
  return "system";
}

Result<Config::ClockType> Config::stringToClockType(const std::string& str) {
  if (str == "system") return ClockType::kSystem;
  if (str == "fixed") return ClockType::kFixed;
  return makeErrorResult<ClockType>(ErrorCode::kConfigError, "Unknown clock: " + str);
}

std::string Config::randomTypeToString(RandomType type) {
  switch (type) {
    case RandomType::kSystem:
      return "system";
    case RandomType::kSeeded:
      return "seeded";
  }
  return "system";
}

Result<Config::RandomType> Config::stringToRandomType(const std::string& str) {
  if (str == "system") return RandomType::kSystem;
  if (str == "seeded") return RandomType::kSeeded;
  return makeErrorResult<RandomType>(ErrorCode::kConfigError, "Unknown random: " + str);
}

}  // namespace ulid::config
