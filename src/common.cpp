#include "ulid/common.hpp"

#include <sstream>

#ifndef ULID_VERSION_MAJOR
#define ULID_VERSION_MAJOR 0
#define ULID_VERSION_MINOR 0
#define ULID_VERSION_PATCH 0
#endif

namespace ulid {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kWidthMismatch:
      return "Width mismatch";
    case ErrorCode::kRangeOverflow:
      return "Range overflow";
    case ErrorCode::kUnsupportedShape:
      return "Unsupported shape";
    case ErrorCode::kMalformedText:
      return "Malformed text";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Error::toString() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;
  return oss.str();
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
  return Version{ULID_VERSION_MAJOR, ULID_VERSION_MINOR, ULID_VERSION_PATCH, ""};
}

}  // namespace ulid
