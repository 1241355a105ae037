#include "emergency/emergency_manager.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "bus/topics.hpp"

namespace agent_coord::emergency {
namespace {

constexpr std::size_t kHistoryLimit = 256;
constexpr const char* kSenderId = "emergency_manager";

std::size_t index_of(const model::emergency_type type) {
  return static_cast<std::size_t>(type);
}

nlohmann::json agents_json(const std::set<std::string>& agents) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& agent_id : agents) {
    out.push_back(agent_id);
  }
  return out;
}

}  // namespace

const char* to_string(const InterventionKind kind) noexcept {
  switch (kind) {
    case InterventionKind::REDUCE_LOAD:
      return "reduce_load";
    case InterventionKind::ACTIVATE_FALLBACK:
      return "activate_fallback";
    case InterventionKind::THROTTLE_REQUESTS:
      return "throttle_requests";
    case InterventionKind::CLEAR_CACHES:
      return "clear_caches";
    case InterventionKind::RESTART_AGENTS:
      return "restart_agents";
    case InterventionKind::REDISTRIBUTE_WORKLOAD:
      return "redistribute_workload";
    case InterventionKind::NOTIFY_HUMAN:
      return "notify_human";
    case InterventionKind::CUSTOM:
      return "custom";
  }
  return "custom";
}

std::vector<EmergencyThreshold> default_thresholds() {
  using std::chrono::seconds;
  return {
      {model::emergency_type::FAILURE_RATE, "failure_rate", 0.3, seconds(120), seconds(300)},
      {model::emergency_type::LATENCY, "latency_ms", 8000.0, seconds(180), seconds(180)},
      {model::emergency_type::DOWNTIME, "agents_offline", 0.0, seconds(0), seconds(600)},
      {model::emergency_type::RESOURCE_EXHAUSTION, "memory_usage_percent", 90.0, seconds(300), seconds(300)},
      {model::emergency_type::RATE_LIMIT, "rate_limit_hits", 0.0, seconds(30), seconds(900)},
  };
}

void MetricsSnapshot::set(const std::string& metric, const double value, std::set<std::string> agents) {
  values[metric] = value;
  if (!agents.empty()) {
    affected_agents[metric] = std::move(agents);
  }
}

void MetricsSnapshot::record(const std::string& metric, const std::string& agent_id, const double value) {
  auto& readings = per_agent[metric];
  readings[agent_id] = value;
  double peak = value;
  for (const auto& [_, reading] : readings) {
    peak = std::max(peak, reading);
  }
  values[metric] = peak;
}

EmergencyManager::EmergencyManager(std::vector<EmergencyThreshold> thresholds, const core::Clock& clock,
                                   bus::MessageBus& bus, ReasoningService* reasoning,
                                   const core::Millis reasoning_timeout)
    : clock_(clock), bus_(bus), reasoning_(reasoning), reasoning_timeout_(reasoning_timeout) {
  for (auto& threshold : thresholds) {
    if (threshold.metric.empty()) {
      throw std::invalid_argument("emergency threshold metric must not be empty");
    }
    if (threshold.dwell < core::Millis{0} || threshold.cooldown < core::Millis{0}) {
      throw std::invalid_argument("emergency dwell and cooldown must not be negative");
    }
    thresholds_.push_back({std::move(threshold), std::nullopt, false});
  }

  for (std::size_t i = 0; i < model::kEmergencyTypeCount; ++i) {
    protocols_[i] = default_protocol(static_cast<model::emergency_type>(i));
  }

  severity_chain_.push_back(
      {"reasoning",
       [this]() { return reasoning_ != nullptr && reasoning_->available(); },
       [this](const ScoringInput& input) -> std::optional<float> {
         const nlohmann::json context{{"task", "score_emergency_severity"},
                                      {"type", model::to_string(input.type)},
                                      {"value", input.value},
                                      {"threshold", input.threshold},
                                      {"affected_agents", input.affected_agents}};
         const auto decision = reasoning_->decide(context, reasoning_timeout_);
         if (!decision.has_value() || !decision->contains("severity") || !(*decision)["severity"].is_number()) {
           return std::nullopt;
         }
         return (*decision)["severity"].get<float>();
       }});
  severity_chain_.push_back({"threshold_ratio", nullptr, threshold_ratio_score});
}

std::vector<model::emergency_event> EmergencyManager::evaluate(const MetricsSnapshot& snapshot) {
  struct Candidate {
    std::size_t threshold_index;
    double value;
    std::set<std::string> affected;
  };

  const auto now = snapshot.taken_at;
  std::vector<Candidate> candidates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < thresholds_.size(); ++i) {
      auto& state = thresholds_[i];
      const auto value_it = snapshot.values.find(state.config.metric);
      const bool over = value_it != snapshot.values.end() && value_it->second > state.config.threshold;

      if (!over) {
        state.breach_started.reset();
        state.breaching = false;
        continue;
      }

      state.breaching = true;
      if (!state.breach_started.has_value()) {
        state.breach_started = now;
      }
      if (now - *state.breach_started < state.config.dwell) {
        continue;
      }

      const auto& cooldown = cooldown_until_[index_of(state.config.type)];
      if (cooldown.has_value() && now < *cooldown) {
        ++stats_.suppressed;
        continue;
      }

      std::set<std::string> affected;
      if (const auto agents_it = snapshot.affected_agents.find(state.config.metric);
          agents_it != snapshot.affected_agents.end()) {
        affected = agents_it->second;
      } else if (const auto readings_it = snapshot.per_agent.find(state.config.metric);
                 readings_it != snapshot.per_agent.end()) {
        for (const auto& [agent_id, reading] : readings_it->second) {
          if (reading > state.config.threshold) {
            affected.insert(agent_id);
          }
        }
      }
      cooldown_until_[index_of(state.config.type)] = now + state.config.cooldown;
      candidates.push_back({i, value_it->second, std::move(affected)});
    }
  }

  std::vector<model::emergency_event> fired;
  fired.reserve(candidates.size());
  for (auto& candidate : candidates) {
    const auto& config = thresholds_[candidate.threshold_index].config;
    model::emergency_event event{};
    event.type = config.type;
    event.observed_value = candidate.value;
    event.threshold = config.threshold;
    event.detected_at = now;
    event.detected_wall_ms = clock_.wall_ms();
    event.cooldown_until = now + config.cooldown;
    event.severity = score_severity(thresholds_[candidate.threshold_index], candidate.value, candidate.affected.size());
    event.affected_agents = std::move(candidate.affected);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      event.id = "emg-" + std::to_string(++next_event_id_);
      ++stats_.fired;
      ++stats_.fired_by_type[index_of(event.type)];
      active_[event.id] = event;
    }

    std::cerr << "[emergency] " << model::to_string(event.type) << " detected: " << config.metric << '='
              << event.observed_value << " > " << config.threshold << " severity=" << event.severity << '\n';
    fired.push_back(std::move(event));
  }
  return fired;
}

float EmergencyManager::score_severity(const ThresholdState& state, const double value, const std::size_t affected) {
  const ScoringInput input{state.config.type, value, state.config.threshold, affected};
  return score_with_fallback(severity_chain_, input, 1.0F).score;
}

InterventionResult EmergencyManager::intervene(const model::emergency_event& event) {
  InterventionProtocol protocol;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    protocol = protocols_[index_of(event.type)];
    ++stats_.interventions;
  }

  bus_.publish(bus::topics::kEmergencyRaised, model::to_json(event), model::priority::CRITICAL, core::Millis{0},
               kSenderId);

  InterventionResult result{};
  result.event_id = event.id;
  result.type = event.type;

  for (const auto& step : protocol) {
    StepOutcome outcome{step.name, false, {}};
    try {
      outcome.succeeded = step.run ? step.run(event) : false;
      outcome.detail = outcome.succeeded ? "handled" : "declined";
    } catch (const std::exception& ex) {
      outcome.detail = ex.what();
      std::cerr << "[emergency] intervention " << step.name << " failed for " << event.id << ": " << ex.what()
                << '\n';
    }
    result.steps.push_back(outcome);

    if (outcome.succeeded) {
      result.succeeded = true;
      result.resolved_by = step.name;
      break;
    }
  }

  if (!result.succeeded) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.interventions_failed;
  }

  nlohmann::json steps = nlohmann::json::array();
  for (const auto& outcome : result.steps) {
    steps.push_back({{"step", outcome.name}, {"succeeded", outcome.succeeded}, {"detail", outcome.detail}});
  }
  bus_.publish(bus::topics::kEmergencyResolved,
               nlohmann::json{{"event", model::to_json(event)},
                              {"succeeded", result.succeeded},
                              {"resolved_by", result.resolved_by},
                              {"steps", steps}},
               model::priority::HIGH, core::Millis{0}, kSenderId);

  std::cerr << "[emergency] intervention for " << event.id << ' '
            << (result.succeeded ? "handled by " + result.resolved_by : std::string("exhausted all steps")) << '\n';
  return result;
}

InterventionProtocol EmergencyManager::default_protocol(const model::emergency_type type) {
  switch (type) {
    case model::emergency_type::FAILURE_RATE:
      return {command_step(InterventionKind::ACTIVATE_FALLBACK, false),
              command_step(InterventionKind::REDUCE_LOAD, false), notify_human_step()};
    case model::emergency_type::LATENCY:
      return {command_step(InterventionKind::REDUCE_LOAD, false),
              command_step(InterventionKind::THROTTLE_REQUESTS, false), notify_human_step()};
    case model::emergency_type::DOWNTIME:
      return {command_step(InterventionKind::RESTART_AGENTS, true),
              command_step(InterventionKind::REDISTRIBUTE_WORKLOAD, true), notify_human_step()};
    case model::emergency_type::RESOURCE_EXHAUSTION:
      return {command_step(InterventionKind::CLEAR_CACHES, false),
              command_step(InterventionKind::REDUCE_LOAD, false), notify_human_step()};
    case model::emergency_type::RATE_LIMIT:
      return {command_step(InterventionKind::THROTTLE_REQUESTS, false), notify_human_step()};
  }
  return {notify_human_step()};
}

InterventionStep EmergencyManager::command_step(const InterventionKind kind, const bool needs_agents) {
  const std::string name = to_string(kind);
  return {kind, name, [this, name, needs_agents](const model::emergency_event& event) {
            if (needs_agents && event.affected_agents.empty()) {
              return false;
            }
            nlohmann::json targets = event.affected_agents.empty() ? nlohmann::json::array({"*"})
                                                                   : agents_json(event.affected_agents);
            const auto id = bus_.publish(bus::topics::kAgentCommand,
                                         nlohmann::json{{"command", name},
                                                        {"agents", targets},
                                                        {"emergency_id", event.id},
                                                        {"emergency_type", model::to_string(event.type)}},
                                         model::priority::HIGH, core::Millis{0}, kSenderId);
            if (id.empty()) {
              std::cerr << "[emergency] " << name << " command for " << event.id
                        << " refused by a full command queue\n";
              return false;
            }
            return true;
          }};
}

InterventionStep EmergencyManager::notify_human_step() {
  return {InterventionKind::NOTIFY_HUMAN, to_string(InterventionKind::NOTIFY_HUMAN),
          [](const model::emergency_event& event) {
            std::cerr << "[emergency] CRITICAL operator notification: " << model::to_string(event.type) << " event "
                      << event.id << " severity=" << event.severity << " affected=" << event.affected_agents.size()
                      << '\n';
            return true;
          }};
}

void EmergencyManager::set_protocol(const model::emergency_type type, InterventionProtocol protocol) {
  std::lock_guard<std::mutex> lock(mutex_);
  protocols_[index_of(type)] = std::move(protocol);
}

std::vector<std::string> EmergencyManager::protocol_names(const model::emergency_type type) const {
  std::vector<std::string> names;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& step : protocols_[index_of(type)]) {
    names.push_back(step.name);
  }
  return names;
}

bool EmergencyManager::resolve(const std::string& event_id, const std::string& note) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = active_.find(event_id);
  if (it == active_.end()) {
    return false;
  }
  archive(std::move(it->second));
  active_.erase(it);
  ++stats_.resolved;
  std::cerr << "[emergency] " << event_id << " resolved" << (note.empty() ? "" : ": " + note) << '\n';
  return true;
}

bool EmergencyManager::breaching(const model::emergency_type type) const {
  return std::any_of(thresholds_.begin(), thresholds_.end(),
                     [type](const ThresholdState& state) { return state.config.type == type && state.breaching; });
}

std::size_t EmergencyManager::clear_expired(const core::TimePoint now) {
  std::size_t cleared = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = active_.begin(); it != active_.end();) {
    if (now >= it->second.cooldown_until && !breaching(it->second.type)) {
      archive(std::move(it->second));
      it = active_.erase(it);
      ++stats_.resolved;
      ++cleared;
    } else {
      ++it;
    }
  }
  return cleared;
}

void EmergencyManager::archive(model::emergency_event event) {
  history_.push_back(std::move(event));
  while (history_.size() > kHistoryLimit) {
    history_.pop_front();
  }
}

std::vector<model::emergency_event> EmergencyManager::active() const {
  std::vector<model::emergency_event> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [_, event] : active_) {
      out.push_back(event);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) { return lhs.detected_at < rhs.detected_at; });
  return out;
}

std::vector<model::emergency_event> EmergencyManager::history(const std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t count = std::min(limit, history_.size());
  return {history_.end() - static_cast<std::ptrdiff_t>(count), history_.end()};
}

EmergencyStats EmergencyManager::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace agent_coord::emergency
