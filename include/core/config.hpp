#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "bridge/circuit_breaker.hpp"
#include "bridge/retry_policy.hpp"
#include "bus/message_bus.hpp"
#include "emergency/emergency_manager.hpp"
#include "registry/agent_registry.hpp"

namespace agent_coord::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"coord"};
  bool enabled{false};
};

struct CoordConfig {
  std::chrono::milliseconds tick_interval{1000};
  std::chrono::milliseconds shutdown_grace{5000};
  std::string supervisor_agent_id{"operational_supervisor"};
  std::uint64_t replay_every_ticks{30};
  std::uint64_t evict_every_ticks{10};
  registry::RegistryOptions registry{};
  bus::BusOptions bus{};
  bridge::BreakerOptions breaker{};
  bridge::RetryOptions retry{};
  std::chrono::milliseconds call_timeout{5000};
  std::string bridge_channel{"validator"};
  std::vector<emergency::EmergencyThreshold> emergency_thresholds{emergency::default_thresholds()};
  RedisConfig redis{};
  bool stdout_debug{false};
};

// Throws std::runtime_error naming the offending key.
CoordConfig load_coord_config(const std::string& path);

}  // namespace agent_coord::core
