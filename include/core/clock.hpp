#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace agent_coord::core {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Millis = std::chrono::milliseconds;

inline std::uint64_t monotonic_timestamp_now_ns() {
  const auto now = SteadyClock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(std::chrono::duration_cast<Millis>(now).count());
}

// 2024-01-31T12:00:00.250Z
inline std::string iso8601_utc(const std::uint64_t wall_ms) {
  const auto seconds = static_cast<std::time_t>(wall_ms / 1000);
  std::tm parts{};
  gmtime_r(&seconds, &parts);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &parts);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03uZ", date, static_cast<unsigned>(wall_ms % 1000));
  return out;
}

inline float elapsed_ms(const TimePoint from, const TimePoint to) {
  return std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(to - from).count();
}

// Time source shared by every component that reasons about deadlines.
class Clock {
 public:
  virtual ~Clock() = default;

  [[nodiscard]] virtual TimePoint now() const = 0;
  [[nodiscard]] virtual std::uint64_t wall_ms() const = 0;
};

class SystemClock final : public Clock {
 public:
  [[nodiscard]] TimePoint now() const override { return SteadyClock::now(); }
  [[nodiscard]] std::uint64_t wall_ms() const override { return unix_timestamp_now_ms(); }
};

// Deterministic clock for tests; only moves when advanced.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(std::uint64_t wall_start_ms = 1'700'000'000'000ULL) : wall_start_ms_(wall_start_ms) {}

  [[nodiscard]] TimePoint now() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return TimePoint{} + offset_;
  }

  [[nodiscard]] std::uint64_t wall_ms() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return wall_start_ms_ + static_cast<std::uint64_t>(std::chrono::duration_cast<Millis>(offset_).count());
  }

  void advance(const SteadyClock::duration step) {
    std::lock_guard<std::mutex> lock(mutex_);
    offset_ += step;
  }

 private:
  mutable std::mutex mutex_;
  std::uint64_t wall_start_ms_;
  SteadyClock::duration offset_{SteadyClock::duration::zero()};
};

}  // namespace agent_coord::core
