#pragma once

#include <algorithm>
#include <cstddef>

namespace agent_coord::core {

inline constexpr float clamp01(const float value) noexcept {
  return std::clamp(value, 0.0F, 1.0F);
}

// Incremental mean over `count` samples, where `sample` is the count-th one.
inline constexpr double running_mean(const double mean, const double sample, const std::size_t count) noexcept {
  if (count == 0) {
    return sample;
  }
  return mean + ((sample - mean) / static_cast<double>(count));
}

}  // namespace agent_coord::core
