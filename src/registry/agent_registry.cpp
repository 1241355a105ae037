#include "registry/agent_registry.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "bus/topics.hpp"

namespace agent_coord::registry {
namespace {

std::vector<model::agent_registration> sorted_by_id(std::vector<model::agent_registration> agents) {
  std::sort(agents.begin(), agents.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.agent_id < rhs.agent_id; });
  return agents;
}

}  // namespace

AgentRegistry::AgentRegistry(RegistryOptions options, const core::Clock& clock, bus::MessageBus& bus)
    : options_(options), clock_(clock), bus_(bus) {
  if (options_.heartbeat_interval <= core::Millis{0}) {
    throw std::invalid_argument("heartbeat interval must be greater than 0");
  }
  if (options_.missed_heartbeats == 0) {
    throw std::invalid_argument("missed heartbeat multiplier must be at least 1");
  }
}

core::Millis AgentRegistry::degraded_after() const noexcept {
  return options_.heartbeat_interval * options_.missed_heartbeats;
}

core::Millis AgentRegistry::offline_after() const noexcept { return degraded_after() * 2; }

core::Millis AgentRegistry::evict_after() const noexcept { return degraded_after() * 3; }

void AgentRegistry::register_agent(const std::string& agent_id, std::set<std::string> capabilities) {
  if (agent_id.empty()) {
    throw std::invalid_argument("agent_id must not be empty");
  }

  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (agents_.find(agent_id) != agents_.end()) {
      throw std::invalid_argument("agent already registered: " + agent_id);
    }
    model::agent_registration registration{};
    registration.agent_id = agent_id;
    registration.capabilities = std::move(capabilities);
    registration.status = model::agent_status::ACTIVE;
    registration.last_heartbeat = clock_.now();
    agents_.emplace(agent_id, std::move(registration));
  }

  std::cerr << "[registry] registered " << agent_id << '\n';
  bus_.publish(bus::topics::kAgentStatus, nlohmann::json{{"agent_id", agent_id}, {"status", "registered"}},
               model::priority::NORMAL);
}

bool AgentRegistry::heartbeat(const std::string& agent_id, const core::TimePoint timestamp) {
  std::optional<model::status_transition> recovered;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
      return false;
    }

    auto& registration = it->second;
    registration.last_heartbeat = std::max(registration.last_heartbeat, timestamp);
    if (registration.status != model::agent_status::ACTIVE) {
      recovered = model::status_transition{agent_id, registration.status, model::agent_status::ACTIVE, timestamp};
      registration.status = model::agent_status::ACTIVE;
    }
  }

  if (recovered.has_value()) {
    std::cerr << "[registry] " << agent_id << " recovered from " << model::to_string(recovered->from) << '\n';
    publish_transition(*recovered, core::Millis{0});
  }
  return true;
}

bool AgentRegistry::deregister(const std::string& agent_id) {
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (agents_.erase(agent_id) == 0) {
      return false;
    }
  }

  std::cerr << "[registry] deregistered " << agent_id << '\n';
  bus_.publish(bus::topics::kAgentStatus, nlohmann::json{{"agent_id", agent_id}, {"status", "deregistered"}},
               model::priority::NORMAL);
  return true;
}

std::vector<model::status_transition> AgentRegistry::sweep(const core::TimePoint now) {
  std::vector<std::pair<model::status_transition, core::Millis>> pending;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& [agent_id, registration] : agents_) {
      const auto silence = std::chrono::duration_cast<core::Millis>(now - registration.last_heartbeat);

      if (registration.status == model::agent_status::ACTIVE && silence > degraded_after()) {
        pending.push_back({{agent_id, model::agent_status::ACTIVE, model::agent_status::DEGRADED, now}, silence});
        registration.status = model::agent_status::DEGRADED;
      }
      if (registration.status == model::agent_status::DEGRADED && silence > offline_after()) {
        pending.push_back({{agent_id, model::agent_status::DEGRADED, model::agent_status::OFFLINE, now}, silence});
        registration.status = model::agent_status::OFFLINE;
      }
    }
  }

  std::vector<model::status_transition> transitions;
  transitions.reserve(pending.size());
  for (const auto& [transition, silence] : pending) {
    std::cerr << "[registry] " << transition.agent_id << ' ' << model::to_string(transition.from) << " -> "
              << model::to_string(transition.to) << " after " << silence.count() << " ms of silence\n";
    publish_transition(transition, silence);
    transitions.push_back(transition);
  }
  return transitions;
}

std::vector<std::string> AgentRegistry::evict_offline(const core::TimePoint now) {
  std::vector<std::string> evicted;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = agents_.begin(); it != agents_.end();) {
      const auto silence = now - it->second.last_heartbeat;
      if (it->second.status == model::agent_status::OFFLINE && silence > evict_after()) {
        evicted.push_back(it->first);
        it = agents_.erase(it);
      } else {
        ++it;
      }
    }
  }

  std::sort(evicted.begin(), evicted.end());
  for (const auto& agent_id : evicted) {
    std::cerr << "[registry] evicted offline agent " << agent_id << '\n';
    bus_.publish(bus::topics::kAgentStatus, nlohmann::json{{"agent_id", agent_id}, {"status", "evicted"}},
                 model::priority::NORMAL);
  }
  return evicted;
}

void AgentRegistry::publish_transition(const model::status_transition& transition, const core::Millis silence) {
  const auto priority =
      transition.to == model::agent_status::OFFLINE ? model::priority::HIGH : model::priority::NORMAL;
  bus_.publish(bus::topics::kAgentStatus,
               nlohmann::json{{"agent_id", transition.agent_id},
                              {"from", model::to_string(transition.from)},
                              {"status", model::to_string(transition.to)},
                              {"silence_ms", silence.count()}},
               priority);
}

std::vector<model::agent_registration> AgentRegistry::list_active() const {
  std::vector<model::agent_registration> out;
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto& [_, registration] : agents_) {
    if (registration.status == model::agent_status::ACTIVE) {
      out.push_back(registration);
    }
  }
  return sorted_by_id(std::move(out));
}

std::vector<model::agent_registration> AgentRegistry::snapshot() const {
  std::vector<model::agent_registration> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(agents_.size());
    for (const auto& [_, registration] : agents_) {
      out.push_back(registration);
    }
  }
  return sorted_by_id(std::move(out));
}

std::optional<model::agent_registration> AgentRegistry::find(const std::string& agent_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = agents_.find(agent_id);
  if (it == agents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t AgentRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return agents_.size();
}

}  // namespace agent_coord::registry
