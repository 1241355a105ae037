#include "core/supervisor.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <utility>

#include "bridge/message_contract.hpp"
#include "bus/topics.hpp"
#include "core/math.hpp"

namespace agent_coord::core {
namespace {

constexpr const char* kOfflineMetric = "agents_offline";
constexpr const char* kAnonymousAgent = "anonymous";

double elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(std::chrono::steady_clock::now() - start)
      .count();
}

const char* severity_label(const float severity) {
  if (severity >= 0.8F) {
    return "critical";
  }
  if (severity >= 0.5F) {
    return "high";
  }
  if (severity >= 0.2F) {
    return "medium";
  }
  return "low";
}

}  // namespace

const char* to_string(const loop_phase phase) noexcept {
  switch (phase) {
    case loop_phase::COLLECT:
      return "collect";
    case loop_phase::EVALUATE:
      return "evaluate";
    case loop_phase::RESOLVE:
      return "resolve";
    case loop_phase::FORWARD:
      return "forward";
  }
  return "unknown";
}

Supervisor::Supervisor(SupervisorOptions options, const Clock& clock, bus::MessageBus& bus,
                       registry::AgentRegistry& registry, emergency::EmergencyManager& emergencies,
                       conflict::ConflictResolver& conflicts, bridge::IntegrationBridge& bridge)
    : options_(std::move(options)),
      clock_(clock),
      bus_(bus),
      registry_(registry),
      emergencies_(emergencies),
      conflicts_(conflicts),
      bridge_(bridge) {
  if (options_.tick_interval <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("supervisor tick interval must be greater than 0");
  }

  subscriptions_.push_back(bus_.subscribe(
      bus::topics::kAgentMetrics, [this](const model::message& msg) { on_metrics(msg); }, "supervisor.metrics"));
  subscriptions_.push_back(bus_.subscribe(
      bus::topics::kAgentActionRequest, [this](const model::message& msg) { on_action_request(msg); },
      "supervisor.action_request"));
  subscriptions_.push_back(bus_.subscribe(
      bus::topics::kAgentStatus, [this](const model::message& msg) { on_agent_status(msg); },
      "supervisor.agent_status"));

  housekeeping_.add("clear_emergencies", 1, [this]() { emergencies_.clear_expired(clock_.now()); });
  housekeeping_.add("evict_offline", options_.evict_every_ticks, [this]() {
    for (const auto& agent_id : registry_.evict_offline(clock_.now())) {
      forget_agent(agent_id);
    }
  });
  housekeeping_.add("replay_dead_letters", options_.replay_every_ticks, [this]() {
    if (bridge_.dead_letter_depth() == 0 || bridge_.breaker().state == bridge::breaker_state::OPEN) {
      return;
    }
    bridge_.replay_dead_letters();
  });
}

Supervisor::~Supervisor() {
  stop();
  for (const auto id : subscriptions_) {
    bus_.unsubscribe(id);
  }
}

CycleMetrics Supervisor::run_for_ticks(const std::size_t total_ticks) {
  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; i < total_ticks; ++i) {
    tick();
    if (i + 1 < total_ticks && !sleep_until_next_tick()) {
      break;
    }
  }
  return metrics();
}

void Supervisor::tick() {
  const auto cycle_start = std::chrono::steady_clock::now();
  cycle_events_.clear();
  cycle_conflicts_.clear();
  cycle_transitions_ = 0;
  cycle_forwarded_ = 0;

  std::array<double, kLoopPhaseCount> timings{};
  run_phase(loop_phase::COLLECT, [this]() { collect(); }, timings);
  run_phase(loop_phase::EVALUATE, [this]() { evaluate(); }, timings);
  run_phase(loop_phase::RESOLVE, [this]() { resolve(); }, timings);
  run_phase(loop_phase::FORWARD, [this]() { forward(); }, timings);
  housekeeping();

  const double cycle_ms = elapsed_since(cycle_start);
  const auto tick_ms = static_cast<double>(options_.tick_interval.count());
  const bool overrun = cycle_ms > tick_ms;
  record_cycle(timings, cycle_ms, overrun);

  if (overrun) {
    std::cerr << "[supervisor] tick overran: " << cycle_ms << " ms > " << tick_ms << " ms\n";
    next_wakeup_ = std::chrono::steady_clock::now();
  } else {
    next_wakeup_ += options_.tick_interval;
  }

  if (options_.stdout_debug) {
    stdout_sink_.publish(metrics(), bridge_.breaker(), bridge_.dead_letter_depth());
  }
}

bool Supervisor::run_phase(const loop_phase phase, const std::function<void()>& body,
                           std::array<double, kLoopPhaseCount>& timings) {
  const auto start = std::chrono::steady_clock::now();
  bool ok = true;
  try {
    body();
  } catch (const std::exception& ex) {
    ok = false;
    std::cerr << "[supervisor] " << to_string(phase) << " phase failed: " << ex.what() << '\n';
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    ++metrics_.phase_errors;
  }
  timings[static_cast<std::size_t>(phase)] = elapsed_since(start);
  return ok;
}

void Supervisor::collect() {
  const auto now = clock_.now();
  cycle_transitions_ = registry_.sweep(now).size();

  snapshot_ = emergency::MetricsSnapshot{};
  snapshot_.taken_at = now;
  // A reading older than the offline window no longer describes a live agent.
  const auto stale_before = now - registry_.offline_after();
  {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    for (auto metric_it = readings_.begin(); metric_it != readings_.end();) {
      auto& readings = metric_it->second;
      for (auto it = readings.begin(); it != readings.end();) {
        if (it->second.received_at < stale_before) {
          it = readings.erase(it);
          continue;
        }
        snapshot_.record(metric_it->first, it->first, it->second.value);
        ++it;
      }
      metric_it = readings.empty() ? readings_.erase(metric_it) : std::next(metric_it);
    }
  }

  std::set<std::string> offline;
  for (const auto& agent : registry_.snapshot()) {
    if (agent.status == model::agent_status::OFFLINE) {
      offline.insert(agent.agent_id);
    }
  }
  const auto offline_count = static_cast<double>(offline.size());
  snapshot_.set(kOfflineMetric, offline_count, std::move(offline));
}

void Supervisor::evaluate() {
  cycle_events_ = emergencies_.evaluate(snapshot_);
  for (const auto& event : cycle_events_) {
    emergencies_.intervene(event);
  }
}

void Supervisor::resolve() {
  std::vector<model::action_request> requests;
  {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    requests.swap(pending_requests_);
  }
  if (requests.empty()) {
    return;
  }

  auto result = conflicts_.detect_and_resolve(requests);
  const auto approve = [this](const model::action_request& request) {
    bus_.publish(bus::topics::kAgentCommand,
                 nlohmann::json{{"command", "apply_action"},
                                {"action", request.action},
                                {"resource_id", request.resource_id},
                                {"agents", nlohmann::json::array({request.source_id})}},
                 model::priority::NORMAL, Millis{0}, options_.agent_id);
  };

  for (const auto& record : result.conflicts) {
    bus_.publish(bus::topics::kConflictResolved, model::to_json(record), model::priority::HIGH, Millis{0},
                 options_.agent_id);
    approve(record.resolution);
  }
  for (const auto& request : result.accepted) {
    approve(request);
  }
  cycle_conflicts_ = std::move(result.conflicts);
}

void Supervisor::forward() {
  if (!cycle_events_.empty() || !cycle_conflicts_.empty()) {
    const std::string version = cycle_conflicts_.empty() ? "1.0" : "1.1";
    auto msg = bridge_.make_message(std::string(bridge::kImprovementTriggerTopic), improvement_payload(), version);
    const auto result = bridge_.forward(std::move(msg));
    if (result.outcome == bridge::forward_outcome::DELIVERED) {
      cycle_forwarded_ = 1;
    }
  }

  bridge_.poll_inbound();
  bus_.publish(bus::topics::kBridgeHealth, bridge_.health(), model::priority::NORMAL, Millis{0}, options_.agent_id);
}

void Supervisor::housekeeping() {
  try {
    housekeeping_.run_due();
  } catch (const std::exception& ex) {
    std::cerr << "[supervisor] housekeeping failed: " << ex.what() << '\n';
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    ++metrics_.phase_errors;
  }
}

nlohmann::json Supervisor::improvement_payload() const {
  std::set<std::string> affected;
  float peak_severity = 0.0F;
  nlohmann::json events = nlohmann::json::array();
  for (const auto& event : cycle_events_) {
    affected.insert(event.affected_agents.begin(), event.affected_agents.end());
    peak_severity = std::max(peak_severity, event.severity);
    events.push_back(model::to_json(event));
  }

  nlohmann::json metrics = nlohmann::json::object();
  for (const auto& [metric, value] : snapshot_.values) {
    metrics[metric] = value;
  }

  nlohmann::json payload{
      {"trigger_type", cycle_events_.empty() ? "conflict" : "emergency"},
      {"performance_data",
       {{"supervisor", options_.agent_id},
        {"agents_registered", registry_.size()},
        {"agents_active", registry_.list_active().size()},
        {"metrics", metrics},
        {"emergencies", events}}},
      {"timestamp", iso8601_utc(clock_.wall_ms())},
      {"affected_agents", affected},
      {"severity", cycle_events_.empty() ? "low" : severity_label(peak_severity)},
  };

  if (!cycle_conflicts_.empty()) {
    nlohmann::json conflicts = nlohmann::json::array();
    for (const auto& record : cycle_conflicts_) {
      conflicts.push_back(model::to_json(record));
    }
    payload["conflicts"] = conflicts;
  }
  return payload;
}

void Supervisor::record_cycle(const std::array<double, kLoopPhaseCount>& timings, const double cycle_ms,
                              const bool overrun) {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  const std::size_t n = static_cast<std::size_t>(++metrics_.ticks);
  for (std::size_t i = 0; i < kLoopPhaseCount; ++i) {
    metrics_.avg_phase_ms[i] = running_mean(metrics_.avg_phase_ms[i], timings[i], n);
  }
  metrics_.avg_cycle_ms = running_mean(metrics_.avg_cycle_ms, cycle_ms, n);
  metrics_.avg_conflicts_per_cycle =
      running_mean(metrics_.avg_conflicts_per_cycle, static_cast<double>(cycle_conflicts_.size()), n);
  metrics_.avg_emergencies_per_cycle =
      running_mean(metrics_.avg_emergencies_per_cycle, static_cast<double>(cycle_events_.size()), n);
  metrics_.last_conflicts = cycle_conflicts_.size();
  metrics_.last_emergencies = cycle_events_.size();
  metrics_.last_forwarded = cycle_forwarded_;
  metrics_.last_transitions = cycle_transitions_;
  metrics_.total_conflicts += cycle_conflicts_.size();
  metrics_.total_emergencies += cycle_events_.size();
  metrics_.total_forwarded += cycle_forwarded_;
  metrics_.inbound_rejected = inbound_rejected_.load();
  if (overrun) {
    ++metrics_.overruns;
  }
}

bool Supervisor::sleep_until_next_tick() {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_cv_.wait_until(lock, next_wakeup_, [this]() { return stop_requested_.load(); });
  return !stop_requested_.load();
}

void Supervisor::start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_.store(false);
    loop_exited_ = false;
  }
  bridge_.reset_cancel();

  worker_ = std::thread([this]() {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
    std::cerr << "[supervisor] coordination loop started, tick=" << options_.tick_interval.count() << "ms\n";
    while (!stop_requested_.load()) {
      tick();
      if (!sleep_until_next_tick()) {
        break;
      }
    }
    {
      std::lock_guard<std::mutex> lock(stop_mutex_);
      loop_exited_ = true;
    }
    stop_cv_.notify_all();
  });
}

bool Supervisor::stop() {
  if (!running_.load()) {
    return true;
  }

  std::unique_lock<std::mutex> lock(stop_mutex_);
  stop_requested_.store(true);
  stop_cv_.notify_all();

  const bool graceful = stop_cv_.wait_for(lock, options_.shutdown_grace, [this]() { return loop_exited_; });
  lock.unlock();
  if (!graceful) {
    std::cerr << "[supervisor] grace period of " << options_.shutdown_grace.count()
              << "ms elapsed; cancelling in-flight bridge work\n";
    bridge_.cancel();
  }

  if (worker_.joinable()) {
    worker_.join();
  }
  running_.store(false);
  std::cerr << "[supervisor] coordination loop stopped (" << (graceful ? "graceful" : "forced") << ")\n";
  return graceful;
}

CycleMetrics Supervisor::metrics() const {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  return metrics_;
}

void Supervisor::on_metrics(const model::message& msg) {
  const auto& payload = msg.payload;
  std::string agent_id = msg.sender_id;
  if (payload.is_object() && payload.contains("agent_id") && payload["agent_id"].is_string()) {
    agent_id = payload["agent_id"].get<std::string>();
  }
  if (agent_id.empty()) {
    agent_id = kAnonymousAgent;
  }

  std::vector<std::pair<std::string, double>> values;
  if (payload.is_object() && payload.contains("metric") && payload["metric"].is_string() &&
      payload.contains("value") && payload["value"].is_number()) {
    values.emplace_back(payload["metric"].get<std::string>(), payload["value"].get<double>());
  } else if (payload.is_object() && payload.contains("metrics") && payload["metrics"].is_object()) {
    for (const auto& [metric, value] : payload["metrics"].items()) {
      if (value.is_number()) {
        values.emplace_back(metric, value.get<double>());
      }
    }
  }

  if (values.empty()) {
    ++inbound_rejected_;
    std::cerr << "[supervisor] ignoring malformed agent.metrics message " << msg.id << '\n';
    return;
  }

  std::lock_guard<std::mutex> lock(inbox_mutex_);
  for (const auto& [metric, value] : values) {
    readings_[metric][agent_id] = AgentReading{value, msg.created_at};
  }
}

void Supervisor::on_agent_status(const model::message& msg) {
  const auto& payload = msg.payload;
  if (!payload.is_object() || !payload.contains("agent_id") || !payload["agent_id"].is_string()) {
    return;
  }
  const std::string status = payload.value("status", "");
  if (status == "deregistered" || status == "evicted") {
    forget_agent(payload["agent_id"].get<std::string>());
  }
}

void Supervisor::forget_agent(const std::string& agent_id) {
  std::lock_guard<std::mutex> lock(inbox_mutex_);
  for (auto it = readings_.begin(); it != readings_.end();) {
    it->second.erase(agent_id);
    it = it->second.empty() ? readings_.erase(it) : std::next(it);
  }
}

void Supervisor::on_action_request(const model::message& msg) {
  const auto& payload = msg.payload;
  const bool well_formed = payload.is_object() && payload.contains("resource_id") &&
                           payload["resource_id"].is_string() && payload.contains("action") &&
                           payload["action"].is_string();
  if (!well_formed) {
    ++inbound_rejected_;
    std::cerr << "[supervisor] ignoring malformed agent.action_request " << msg.id << '\n';
    return;
  }

  model::action_request request{};
  request.source_id = payload.value("source_id", msg.sender_id);
  request.resource_id = payload["resource_id"].get<std::string>();
  request.action = payload["action"].get<std::string>();
  request.priority_score = payload.value("priority_score", 0.0);
  request.requested_at = msg.created_at;
  if (request.source_id.empty()) {
    ++inbound_rejected_;
    std::cerr << "[supervisor] action request " << msg.id << " has no source\n";
    return;
  }

  std::lock_guard<std::mutex> lock(inbox_mutex_);
  pending_requests_.push_back(std::move(request));
}

}  // namespace agent_coord::core
