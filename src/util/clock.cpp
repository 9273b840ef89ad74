#include "ulid/util/clock.hpp"

#include <chrono>

namespace ulid::util {

std::uint64_t SystemClock::nowMilliseconds() const {
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  return milliseconds < 0 ? 0 : static_cast<std::uint64_t>(milliseconds);
}

std::uint64_t FixedClock::nowMilliseconds() const {
  return milliseconds_.load();
}

void FixedClock::set(std::uint64_t milliseconds) {
  milliseconds_.store(milliseconds);
}

void FixedClock::advance(std::uint64_t milliseconds) {
  milliseconds_.fetch_add(milliseconds);
}

}  // namespace ulid::util
