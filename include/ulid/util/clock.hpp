#pragma once

#include <atomic>
#include <cstdint>

namespace ulid::util {

// Wall-clock source, milliseconds since the Unix epoch
class Clock {
 public:
  virtual ~Clock() = default;

  virtual std::uint64_t nowMilliseconds() const = 0;
};

// std::chrono::system_clock
class SystemClock : public Clock {
 public:
  std::uint64_t nowMilliseconds() const override;
};

// Clock that reports a settable instant
class FixedClock : public Clock {
 public:
  explicit FixedClock(std::uint64_t milliseconds) : milliseconds_(milliseconds) {}

  std::uint64_t nowMilliseconds() const override;

  void set(std::uint64_t milliseconds);
  void advance(std::uint64_t milliseconds);

 private:
  std::atomic<std::uint64_t> milliseconds_;
};

}  // namespace ulid::util
