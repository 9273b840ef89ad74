#include "ulid/util/random.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include "ulid/util/log.hpp"

#if defined(__linux__)
#include <sys/random.h>
#endif

namespace ulid::util {

namespace {

void fillFromEngine(std::mt19937_64& engine, std::span<std::uint8_t> bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    std::uint64_t word = engine();
    for (int b = 0; b < 8 && i < bytes.size(); ++b, ++i) {
      bytes[i] = static_cast<std::uint8_t>(word & 0xFF);
      word >>= 8;
    }
  }
}

#if defined(__linux__)
// Returns false when the kernel source cannot serve the request
bool fillFromKernel(std::span<std::uint8_t> bytes) {
  std::size_t offset = 0;
  while (offset < bytes.size()) {
    ssize_t n = getrandom(bytes.data() + offset, bytes.size() - offset, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      logger()->warn("getrandom failed, using fallback generator: {}", std::strerror(errno));
      return false;
    }
    offset += static_cast<std::size_t>(n);
  }
  return true;
}
#endif

}  // namespace

Result<void> SystemRandom::fill(std::span<std::uint8_t> bytes) {
  if (bytes.empty()) {
    return {};
  }

#if defined(__linux__)
  if (fillFromKernel(bytes)) {
    return {};
  }
#endif

  // Fallback to standard random number generator
  try {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(
        (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd()));
    fillFromEngine(gen, bytes);
  } catch (const std::exception& e) {
    return makeErrorResult<void>(ErrorCode::kSystemError,
                                 std::string("No random source available: ") + e.what());
  }
  return {};
}

Result<void> SeededRandom::fill(std::span<std::uint8_t> bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  fillFromEngine(engine_, bytes);
  return {};
}

}  // namespace ulid::util
