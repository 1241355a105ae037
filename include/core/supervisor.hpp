#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "bridge/integration_bridge.hpp"
#include "bus/message_bus.hpp"
#include "conflict/conflict_resolver.hpp"
#include "core/clock.hpp"
#include "core/cycle_metrics.hpp"
#include "core/tick_schedule.hpp"
#include "emergency/emergency_manager.hpp"
#include "model/conflict.hpp"
#include "registry/agent_registry.hpp"
#include "sinks/stdout_debug.hpp"

namespace agent_coord::core {

struct SupervisorOptions {
  std::string agent_id{"operational_supervisor"};
  std::chrono::milliseconds tick_interval{1000};
  std::chrono::milliseconds shutdown_grace{5000};
  std::uint64_t replay_every_ticks{30};
  std::uint64_t evict_every_ticks{10};
  bool stdout_debug{false};
};

// Fixed-period coordination loop: collect -> evaluate -> resolve -> forward.
// A tick that runs long is logged as an overrun and the next tick starts
// immediately; phases are never skipped.
class Supervisor {
 public:
  Supervisor(SupervisorOptions options, const Clock& clock, bus::MessageBus& bus, registry::AgentRegistry& registry,
             emergency::EmergencyManager& emergencies, conflict::ConflictResolver& conflicts,
             bridge::IntegrationBridge& bridge);
  ~Supervisor();

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  CycleMetrics run_for_ticks(std::size_t total_ticks);

  void start();
  // Lets the in-flight tick finish; after the grace period pending bridge
  // back-off is cancelled. Returns false when the stop had to be forced.
  bool stop();
  [[nodiscard]] bool running() const noexcept { return running_.load(); }

  [[nodiscard]] CycleMetrics metrics() const;

 private:
  struct AgentReading {
    double value;
    TimePoint received_at;
  };

  void tick();
  bool run_phase(loop_phase phase, const std::function<void()>& body, std::array<double, kLoopPhaseCount>& timings);
  void collect();
  void evaluate();
  void resolve();
  void forward();
  void housekeeping();
  void record_cycle(const std::array<double, kLoopPhaseCount>& timings, double cycle_ms, bool overrun);
  bool sleep_until_next_tick();

  void on_metrics(const model::message& msg);
  void on_action_request(const model::message& msg);
  void on_agent_status(const model::message& msg);
  void forget_agent(const std::string& agent_id);
  nlohmann::json improvement_payload() const;

  SupervisorOptions options_;
  const Clock& clock_;
  bus::MessageBus& bus_;
  registry::AgentRegistry& registry_;
  emergency::EmergencyManager& emergencies_;
  conflict::ConflictResolver& conflicts_;
  bridge::IntegrationBridge& bridge_;
  sinks::StdoutDebugSink stdout_sink_{};
  TickSchedule housekeeping_{};
  std::vector<bus::SubscriptionId> subscriptions_{};

  // Written by bus handlers, drained by collect() and resolve().
  std::mutex inbox_mutex_{};
  // metric -> agent -> latest reading
  std::unordered_map<std::string, std::unordered_map<std::string, AgentReading>> readings_{};
  std::vector<model::action_request> pending_requests_{};
  std::atomic<std::uint64_t> inbound_rejected_{0};

  // Per-tick working state, touched only by the loop thread.
  emergency::MetricsSnapshot snapshot_{};
  std::vector<model::emergency_event> cycle_events_{};
  std::vector<model::conflict_record> cycle_conflicts_{};
  std::size_t cycle_transitions_{0};
  std::size_t cycle_forwarded_{0};

  mutable std::mutex metrics_mutex_{};
  CycleMetrics metrics_{};

  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};

  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::mutex stop_mutex_{};
  std::condition_variable stop_cv_{};
  bool loop_exited_{false};
  std::thread worker_{};
};

}  // namespace agent_coord::core
