#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "bus/message_bus.hpp"
#include "core/clock.hpp"
#include "model/agent.hpp"

namespace agent_coord::registry {

struct RegistryOptions {
  core::Millis heartbeat_interval{10000};
  // Silence of N intervals degrades an agent, 2N marks it offline and 3N
  // makes it eligible for eviction.
  std::uint32_t missed_heartbeats{3};
};

class AgentRegistry {
 public:
  AgentRegistry(RegistryOptions options, const core::Clock& clock, bus::MessageBus& bus);

  // Throws std::invalid_argument on an empty or already registered id.
  void register_agent(const std::string& agent_id, std::set<std::string> capabilities);
  bool heartbeat(const std::string& agent_id, core::TimePoint timestamp);
  bool deregister(const std::string& agent_id);

  // Applies silence-based transitions and publishes each on agent.status.
  std::vector<model::status_transition> sweep(core::TimePoint now);
  // Drops offline agents whose silence exceeded the eviction window.
  std::vector<std::string> evict_offline(core::TimePoint now);

  [[nodiscard]] std::vector<model::agent_registration> list_active() const;
  [[nodiscard]] std::vector<model::agent_registration> snapshot() const;
  [[nodiscard]] std::optional<model::agent_registration> find(const std::string& agent_id) const;
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] core::Millis degraded_after() const noexcept;
  [[nodiscard]] core::Millis offline_after() const noexcept;
  [[nodiscard]] core::Millis evict_after() const noexcept;

 private:
  void publish_transition(const model::status_transition& transition, core::Millis silence);

  RegistryOptions options_;
  const core::Clock& clock_;
  bus::MessageBus& bus_;

  mutable std::shared_mutex mutex_{};
  std::unordered_map<std::string, model::agent_registration> agents_{};
};

}  // namespace agent_coord::registry
