#include "bridge/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace agent_coord::bridge {

RetryPolicy::RetryPolicy(RetryOptions options, const std::uint64_t seed) : options_(options), rng_(seed) {
  if (options_.max_attempts == 0) {
    throw std::invalid_argument("retry max_attempts must be >= 1");
  }
  if (options_.base_delay <= core::Millis{0} || options_.max_delay < options_.base_delay) {
    throw std::invalid_argument("retry delays must satisfy 0 < base_delay <= max_delay");
  }
  if (options_.jitter_ratio < 0.0 || options_.jitter_ratio > 1.0) {
    throw std::invalid_argument("retry jitter_ratio must be within 0..1");
  }
}

core::Millis RetryPolicy::nominal_delay(const std::uint32_t attempt) const {
  if (attempt <= 1) {
    return core::Millis{0};
  }
  const double base = static_cast<double>(options_.base_delay.count());
  const double cap = static_cast<double>(options_.max_delay.count());
  const double scaled = base * std::pow(2.0, static_cast<double>(attempt - 2));
  return core::Millis(static_cast<core::Millis::rep>(std::min(scaled, cap)));
}

core::Millis RetryPolicy::delay_before(const std::uint32_t attempt) {
  const auto nominal = nominal_delay(attempt);
  if (nominal.count() == 0 || options_.jitter_ratio == 0.0) {
    return nominal;
  }

  const double spread = static_cast<double>(nominal.count()) * options_.jitter_ratio;
  double offset = 0.0;
  {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<double> jitter(-spread, spread);
    offset = jitter(rng_);
  }

  const double jittered = std::clamp(static_cast<double>(nominal.count()) + offset, 0.0,
                                     static_cast<double>(options_.max_delay.count()));
  return core::Millis(static_cast<core::Millis::rep>(std::llround(jittered)));
}

}  // namespace agent_coord::bridge
