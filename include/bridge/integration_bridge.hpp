#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bridge/circuit_breaker.hpp"
#include "bridge/dead_letter_queue.hpp"
#include "bridge/message_contract.hpp"
#include "bridge/retry_policy.hpp"
#include "bridge/state_store.hpp"
#include "bridge/validator_client.hpp"
#include "bus/message_bus.hpp"
#include "core/clock.hpp"

namespace agent_coord::bridge {

struct BridgeOptions {
  std::string bridge_id{"supervisor_bridge"};
  std::string channel{"validator"};
  core::Millis call_timeout{5000};
  core::Millis poll_timeout{100};
  std::size_t max_inbound_per_poll{16};
  BreakerOptions breaker{};
  RetryOptions retry{};
  std::optional<std::uint64_t> retry_seed{};
};

enum class forward_outcome : std::uint8_t {
    DELIVERED = 0,
    DEAD_LETTERED = 1,
    REJECTED_CONTRACT = 2,
    CIRCUIT_OPEN = 3,
    CANCELLED = 4,
};

const char* to_string(forward_outcome outcome) noexcept;

struct ForwardResult {
  forward_outcome outcome{forward_outcome::DELIVERED};
  std::uint32_t attempts{0};
  std::string reason;
};

struct BridgeCounters {
  std::uint64_t processed{0};
  std::uint64_t failed{0};
  std::uint64_t dead_lettered{0};
  std::uint64_t fail_fast{0};
  std::uint64_t discarded{0};
  std::uint64_t replayed{0};
  std::uint64_t received{0};
  std::uint64_t contract_rejections{0};
  std::uint64_t backoff_ms{0};
};

struct ReplayReport {
  std::size_t attempted{0};
  std::size_t replayed{0};
  std::size_t failed{0};
  std::vector<std::string> missing;
};

// Resilient path to the external validator: contract check, circuit breaker,
// bounded retries with back-off, and a dead-letter queue for everything that
// could not be delivered.
class IntegrationBridge {
 public:
  IntegrationBridge(BridgeOptions options, ContractRegistry contracts, ValidatorClient& client, bus::MessageBus& bus,
                    const core::Clock& clock, StateStore* store = nullptr);

  IntegrationBridge(const IntegrationBridge&) = delete;
  IntegrationBridge& operator=(const IntegrationBridge&) = delete;

  // Loads persisted dead letters and breaker state, then persists every
  // breaker change from here on.
  void restore();

  ForwardResult forward(model::message msg);

  // Pulls validator responses and republishes valid ones on
  // deployment.notification. Returns the number published.
  std::size_t poll_inbound();

  // Re-sends dead letters (all when ids is empty). Success removes the
  // entry; failure keeps the single entry and accumulates retry_count.
  ReplayReport replay_dead_letters(const std::vector<std::string>& ids = {});
  bool discard_dead_letter(const std::string& message_id, const std::string& note = {});
  [[nodiscard]] std::vector<model::dead_letter_entry> dead_letters(std::size_t limit = 100) const;
  [[nodiscard]] std::size_t dead_letter_depth() const { return dead_letters_.size(); }

  // Aborts pending back-off waits; later forwards dead-letter immediately.
  void cancel();
  // Re-arms the bridge after a forced stop.
  void reset_cancel();
  [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

  [[nodiscard]] nlohmann::json health() const;
  [[nodiscard]] BridgeCounters counters() const;
  [[nodiscard]] BreakerSnapshot breaker() const { return breaker_.snapshot(); }
  [[nodiscard]] const ContractRegistry& contracts() const noexcept { return contracts_; }

  // Message addressed to the validator, stamped with a bridge-scoped id.
  [[nodiscard]] model::message make_message(const std::string& topic, nlohmann::json payload,
                                            const std::string& contract_version = {}) const;

 private:
  ForwardResult deliver(const model::message& msg);
  bool wait_backoff(core::Millis delay);
  void dead_letter(const model::message& msg, const std::string& reason, std::uint32_t attempts);
  std::string next_id(const char* prefix) const;

  BridgeOptions options_;
  ContractRegistry contracts_;
  ValidatorClient& client_;
  bus::MessageBus& bus_;
  const core::Clock& clock_;
  StateStore* store_;

  CircuitBreaker breaker_;
  RetryPolicy retry_;
  DeadLetterQueue dead_letters_;

  std::atomic<bool> cancelled_{false};
  std::mutex cancel_mutex_{};
  std::condition_variable cancel_cv_{};

  std::string id_prefix_;
  mutable std::atomic<std::uint64_t> next_id_{0};
  bool receive_healthy_{true};

  std::atomic<std::uint64_t> processed_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::atomic<std::uint64_t> dead_lettered_{0};
  std::atomic<std::uint64_t> fail_fast_{0};
  std::atomic<std::uint64_t> discarded_{0};
  std::atomic<std::uint64_t> replayed_{0};
  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> contract_rejections_{0};
  std::atomic<std::uint64_t> backoff_ms_{0};
};

}  // namespace agent_coord::bridge
