#include "bridge/circuit_breaker.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace agent_coord::bridge {

const char* to_string(const breaker_state state) noexcept {
  switch (state) {
    case breaker_state::CLOSED:
      return "closed";
    case breaker_state::OPEN:
      return "open";
    case breaker_state::HALF_OPEN:
      return "half_open";
  }
  return "closed";
}

std::optional<breaker_state> breaker_state_from_string(const std::string_view value) noexcept {
  if (value == "closed") {
    return breaker_state::CLOSED;
  }
  if (value == "open") {
    return breaker_state::OPEN;
  }
  if (value == "half_open") {
    return breaker_state::HALF_OPEN;
  }
  return std::nullopt;
}

nlohmann::json to_json(const BreakerSnapshot& snapshot) {
  return nlohmann::json{{"channel", snapshot.channel},
                        {"state", to_string(snapshot.state)},
                        {"consecutive_failures", snapshot.consecutive_failures},
                        {"probes_remaining", snapshot.probes_remaining},
                        {"probe_successes", snapshot.probe_successes},
                        {"opened_at_ms", snapshot.opened_at_wall_ms},
                        {"times_opened", snapshot.times_opened}};
}

BreakerSnapshot breaker_snapshot_from_json(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw std::invalid_argument("breaker state must be a JSON object");
  }
  const auto state = breaker_state_from_string(json.value("state", std::string("closed")));
  if (!state.has_value()) {
    throw std::invalid_argument("unknown breaker state");
  }

  BreakerSnapshot snapshot{};
  snapshot.channel = json.value("channel", std::string{});
  snapshot.state = *state;
  snapshot.consecutive_failures = json.value("consecutive_failures", 0U);
  snapshot.probes_remaining = json.value("probes_remaining", 0U);
  snapshot.probe_successes = json.value("probe_successes", 0U);
  snapshot.opened_at_wall_ms = json.value("opened_at_ms", std::uint64_t{0});
  snapshot.times_opened = json.value("times_opened", std::uint64_t{0});
  return snapshot;
}

CircuitBreaker::CircuitBreaker(std::string channel, BreakerOptions options, const core::Clock& clock)
    : channel_(std::move(channel)), options_(options), clock_(clock) {
  if (options_.failure_threshold == 0 || options_.half_open_probes == 0) {
    throw std::invalid_argument("breaker failure_threshold and half_open_probes must be >= 1");
  }
  if (options_.recovery_timeout <= core::Millis{0}) {
    throw std::invalid_argument("breaker recovery_timeout must be > 0");
  }
}

bool CircuitBreaker::allow_request() {
  std::optional<BreakerSnapshot> changed;
  bool allowed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
      case breaker_state::CLOSED:
        allowed = true;
        break;
      case breaker_state::OPEN:
        if (clock_.now() - opened_at_ < options_.recovery_timeout) {
          break;
        }
        state_ = breaker_state::HALF_OPEN;
        probes_remaining_ = options_.half_open_probes;
        probe_successes_ = 0;
        std::cerr << "[bridge] breaker " << channel_ << " half_open, probing\n";
        [[fallthrough]];
      case breaker_state::HALF_OPEN:
        if (probes_remaining_ > 0) {
          --probes_remaining_;
          allowed = true;
          changed = snapshot_locked();
        }
        break;
    }
  }
  if (changed.has_value()) {
    notify(*changed);
  }
  return allowed;
}

void CircuitBreaker::record_success() {
  BreakerSnapshot changed{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == breaker_state::HALF_OPEN) {
      ++probe_successes_;
      if (probe_successes_ >= options_.half_open_probes) {
        state_ = breaker_state::CLOSED;
        consecutive_failures_ = 0;
        probes_remaining_ = 0;
        probe_successes_ = 0;
        std::cerr << "[bridge] breaker " << channel_ << " closed\n";
      }
    } else if (state_ == breaker_state::CLOSED) {
      if (consecutive_failures_ == 0) {
        return;
      }
      consecutive_failures_ = 0;
    } else {
      return;
    }
    changed = snapshot_locked();
  }
  notify(changed);
}

void CircuitBreaker::record_failure() {
  BreakerSnapshot changed{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_.now();
    ++consecutive_failures_;
    if (state_ == breaker_state::HALF_OPEN) {
      open_locked(now);
    } else if (state_ == breaker_state::CLOSED && consecutive_failures_ >= options_.failure_threshold) {
      open_locked(now);
    }
    changed = snapshot_locked();
  }
  notify(changed);
}

void CircuitBreaker::open_locked(const core::TimePoint now) {
  state_ = breaker_state::OPEN;
  opened_at_ = now;
  opened_at_wall_ms_ = clock_.wall_ms();
  probes_remaining_ = 0;
  probe_successes_ = 0;
  ++times_opened_;
  std::cerr << "[bridge] breaker " << channel_ << " open after " << consecutive_failures_
            << " consecutive failures\n";
}

breaker_state CircuitBreaker::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

BreakerSnapshot CircuitBreaker::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_locked();
}

BreakerSnapshot CircuitBreaker::snapshot_locked() const {
  return {channel_, state_, consecutive_failures_, probes_remaining_, probe_successes_, opened_at_wall_ms_,
          times_opened_};
}

void CircuitBreaker::restore(const BreakerSnapshot& snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = snapshot.state;
  consecutive_failures_ = snapshot.consecutive_failures;
  probes_remaining_ = snapshot.probes_remaining;
  probe_successes_ = snapshot.probe_successes;
  opened_at_wall_ms_ = snapshot.opened_at_wall_ms;
  times_opened_ = snapshot.times_opened;

  const auto now = clock_.now();
  const auto wall_now = clock_.wall_ms();
  const auto elapsed = wall_now > opened_at_wall_ms_ ? core::Millis(wall_now - opened_at_wall_ms_) : core::Millis{0};
  opened_at_ = now - elapsed;

  std::cerr << "[bridge] breaker " << channel_ << " restored as " << to_string(state_) << '\n';
}

void CircuitBreaker::set_listener(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

void CircuitBreaker::notify(const BreakerSnapshot& snapshot) {
  Listener listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(snapshot);
  }
}

}  // namespace agent_coord::bridge
