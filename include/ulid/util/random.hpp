#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <span>

#include "ulid/common.hpp"

namespace ulid::util {

// Source of random bytes. fill() writes exactly bytes.size() bytes or fails.
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  virtual Result<void> fill(std::span<std::uint8_t> bytes) = 0;
};

/**
 * @brief Operating system randomness
 *
 * Uses getrandom(2) on Linux and falls back to a per-thread mt19937_64
 * seeded from std::random_device when the kernel source is unavailable.
 */
class SystemRandom : public RandomSource {
 public:
  Result<void> fill(std::span<std::uint8_t> bytes) override;
};

/**
 * @brief Reproducible randomness from a fixed seed
 *
 * Two instances with the same seed produce the same byte sequence.
 * Safe to share between threads.
 */
class SeededRandom : public RandomSource {
 public:
  explicit SeededRandom(std::uint64_t seed) : engine_(seed) {}

  Result<void> fill(std::span<std::uint8_t> bytes) override;

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

}  // namespace ulid::util
