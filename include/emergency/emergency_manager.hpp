#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "bus/message_bus.hpp"
#include "core/clock.hpp"
#include "emergency/fallback_chain.hpp"
#include "emergency/intervention.hpp"
#include "emergency/reasoning_service.hpp"
#include "model/emergency.hpp"

namespace agent_coord::emergency {

struct EmergencyThreshold {
  model::emergency_type type{model::emergency_type::FAILURE_RATE};
  std::string metric;
  double threshold{0.0};
  core::Millis dwell{0};
  core::Millis cooldown{0};
};

std::vector<EmergencyThreshold> default_thresholds();

// Aggregated view handed to evaluate(). When a metric has no explicit
// affected set, the agents whose own reading breaches the threshold are used.
struct MetricsSnapshot {
  core::TimePoint taken_at{};
  std::unordered_map<std::string, double> values{};
  std::unordered_map<std::string, std::set<std::string>> affected_agents{};
  std::unordered_map<std::string, std::unordered_map<std::string, double>> per_agent{};

  void set(const std::string& metric, double value, std::set<std::string> agents = {});
  // Keeps the per-agent reading; the aggregate is the maximum across agents.
  void record(const std::string& metric, const std::string& agent_id, double value);
};

struct EmergencyStats {
  std::uint64_t fired{0};
  std::uint64_t suppressed{0};
  std::uint64_t interventions{0};
  std::uint64_t interventions_failed{0};
  std::uint64_t resolved{0};
  std::array<std::uint64_t, model::kEmergencyTypeCount> fired_by_type{};
};

class EmergencyManager {
 public:
  EmergencyManager(std::vector<EmergencyThreshold> thresholds, const core::Clock& clock, bus::MessageBus& bus,
                   ReasoningService* reasoning = nullptr, core::Millis reasoning_timeout = core::Millis{2000});

  // Fires an event for every metric that stayed above its threshold for the
  // dwell time and whose type is outside its cooldown window.
  std::vector<model::emergency_event> evaluate(const MetricsSnapshot& snapshot);

  // Runs the protocol for the event type in order until a step succeeds.
  // Always publishes an emergency.raised / emergency.resolved pair.
  InterventionResult intervene(const model::emergency_event& event);

  void set_protocol(model::emergency_type type, InterventionProtocol protocol);
  [[nodiscard]] std::vector<std::string> protocol_names(model::emergency_type type) const;

  bool resolve(const std::string& event_id, const std::string& note = {});
  // Clears active events whose cooldown elapsed while the metric was no
  // longer breaching.
  std::size_t clear_expired(core::TimePoint now);

  [[nodiscard]] std::vector<model::emergency_event> active() const;
  [[nodiscard]] std::vector<model::emergency_event> history(std::size_t limit = 50) const;
  [[nodiscard]] EmergencyStats stats() const;

 private:
  struct ThresholdState {
    EmergencyThreshold config;
    std::optional<core::TimePoint> breach_started{};
    bool breaching{false};
  };

  InterventionProtocol default_protocol(model::emergency_type type);
  InterventionStep command_step(InterventionKind kind, bool needs_agents);
  InterventionStep notify_human_step();
  float score_severity(const ThresholdState& state, double value, std::size_t affected);
  bool breaching(model::emergency_type type) const;
  void archive(model::emergency_event event);

  const core::Clock& clock_;
  bus::MessageBus& bus_;
  ReasoningService* reasoning_;
  core::Millis reasoning_timeout_;
  std::vector<ScoringStep> severity_chain_{};

  mutable std::mutex mutex_{};
  std::vector<ThresholdState> thresholds_{};
  std::array<std::optional<core::TimePoint>, model::kEmergencyTypeCount> cooldown_until_{};
  std::array<InterventionProtocol, model::kEmergencyTypeCount> protocols_{};
  std::unordered_map<std::string, model::emergency_event> active_{};
  std::deque<model::emergency_event> history_{};
  EmergencyStats stats_{};
  std::uint64_t next_event_id_{0};
};

}  // namespace agent_coord::emergency
