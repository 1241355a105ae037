#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/clock.hpp"

namespace agent_coord::bridge {

enum class breaker_state : std::uint8_t {
    CLOSED = 0,
    OPEN = 1,
    HALF_OPEN = 2,
};

const char* to_string(breaker_state state) noexcept;
std::optional<breaker_state> breaker_state_from_string(std::string_view value) noexcept;

struct BreakerOptions {
  std::uint32_t failure_threshold{5};
  core::Millis recovery_timeout{30000};
  std::uint32_t half_open_probes{3};
};

struct BreakerSnapshot {
  std::string channel;
  breaker_state state{breaker_state::CLOSED};
  std::uint32_t consecutive_failures{0};
  std::uint32_t probes_remaining{0};
  std::uint32_t probe_successes{0};
  std::uint64_t opened_at_wall_ms{0};
  std::uint64_t times_opened{0};
};

nlohmann::json to_json(const BreakerSnapshot& snapshot);
BreakerSnapshot breaker_snapshot_from_json(const nlohmann::json& json);

// Per-channel closed / open / half_open state machine. All transitions happen
// under one lock; the change listener runs after the lock is released.
class CircuitBreaker {
 public:
  using Listener = std::function<void(const BreakerSnapshot&)>;

  CircuitBreaker(std::string channel, BreakerOptions options, const core::Clock& clock);

  // Open moves to half_open once the recovery timeout elapsed. In half_open
  // each allowed call consumes one probe from the budget.
  bool allow_request();
  void record_success();
  void record_failure();

  [[nodiscard]] breaker_state state() const;
  [[nodiscard]] BreakerSnapshot snapshot() const;
  [[nodiscard]] const BreakerOptions& options() const noexcept { return options_; }

  // Rebases a persisted opened_at wall time onto the monotonic clock.
  void restore(const BreakerSnapshot& snapshot);
  void set_listener(Listener listener);

 private:
  void open_locked(core::TimePoint now);
  [[nodiscard]] BreakerSnapshot snapshot_locked() const;
  void notify(const BreakerSnapshot& snapshot);

  const std::string channel_;
  const BreakerOptions options_;
  const core::Clock& clock_;

  mutable std::mutex mutex_{};
  breaker_state state_{breaker_state::CLOSED};
  std::uint32_t consecutive_failures_{0};
  std::uint32_t probes_remaining_{0};
  std::uint32_t probe_successes_{0};
  core::TimePoint opened_at_{};
  std::uint64_t opened_at_wall_ms_{0};
  std::uint64_t times_opened_{0};
  Listener listener_{};
};

}  // namespace agent_coord::bridge
