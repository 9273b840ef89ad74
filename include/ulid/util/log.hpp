#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "ulid/common.hpp"

namespace ulid::util {

// Name of the library logger registered with spdlog
inline constexpr std::string_view kLoggerName = "ulid";

// Library logger: stderr color sink, level warn until changed
std::shared_ptr<spdlog::logger> logger();

// Level for a name (trace, debug, info, warn, error, critical, off)
Result<spdlog::level::level_enum> parseLogLevel(std::string_view level);

// Set the logger level by name (trace, debug, info, warn, error, critical, off)
Result<void> setLogLevel(std::string_view level);

// Log an error produced while performing the named operation
void logError(const Error& error, std::string_view operation);

}  // namespace ulid::util
