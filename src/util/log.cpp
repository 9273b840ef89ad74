#include "ulid/util/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ulid::util {

namespace {

std::shared_ptr<spdlog::logger> createLogger() {
  const std::string name(kLoggerName);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(name, console_sink);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  logger->set_level(spdlog::level::warn);

  try {
    spdlog::register_logger(logger);
  } catch (const spdlog::spdlog_ex&) {
    // Registered concurrently by someone else; use theirs
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
  }
  return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(once, [] { instance = createLogger(); });
  return instance;
}

Result<spdlog::level::level_enum> parseLogLevel(std::string_view level) {
  const std::string name(level);
  auto parsed = spdlog::level::from_str(name);

  // from_str maps unknown names to off, so only accept off when asked for
  if (parsed == spdlog::level::off && name != "off") {
    return makeErrorResult<spdlog::level::level_enum>(ErrorCode::kConfigError,
                                                      "Unknown log level: " + name);
  }
  return parsed;
}

Result<void> setLogLevel(std::string_view level) {
  auto parsed = parseLogLevel(level);
  if (!parsed) {
    return std::unexpected(parsed.error());
  }

  logger()->set_level(*parsed);
  return {};
}

void logError(const Error& error, std::string_view operation) {
  logger()->error("[{}] {} (during {})", static_cast<int>(error.code()), error.toString(),
                  operation);
}

}  // namespace ulid::util
