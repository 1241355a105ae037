#pragma once

#include <cstdint>
#include <mutex>
#include <random>

#include "core/clock.hpp"

namespace agent_coord::bridge {

struct RetryOptions {
  std::uint32_t max_attempts{3};
  core::Millis base_delay{1000};
  core::Millis max_delay{60000};
  double jitter_ratio{0.2};
};

// Exponential back-off with symmetric jitter. Attempt 1 is immediate; the
// delay before attempt k is base * 2^(k-2), capped at max_delay.
class RetryPolicy {
 public:
  explicit RetryPolicy(RetryOptions options, std::uint64_t seed = std::random_device{}());

  [[nodiscard]] core::Millis nominal_delay(std::uint32_t attempt) const;
  core::Millis delay_before(std::uint32_t attempt);

  [[nodiscard]] std::uint32_t max_attempts() const noexcept { return options_.max_attempts; }
  [[nodiscard]] const RetryOptions& options() const noexcept { return options_; }

 private:
  RetryOptions options_;
  std::mutex rng_mutex_{};
  std::mt19937_64 rng_;
};

}  // namespace agent_coord::bridge
