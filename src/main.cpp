#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "bridge/integration_bridge.hpp"
#include "bridge/redis_validator_client.hpp"
#include "bridge/validator_client.hpp"
#include "bus/message_bus.hpp"
#include "conflict/conflict_resolver.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/supervisor.hpp"
#include "emergency/emergency_manager.hpp"
#include "registry/agent_registry.hpp"
#include "sinks/redis_connection.hpp"
#include "sinks/redis_state_store.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const agent_coord::core::CoordConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[supervisor] loaded config from " << config_path
         << " | agent_id=" << config.supervisor_agent_id
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | heartbeat_interval_ms=" << config.registry.heartbeat_interval.count()
         << " | missed_heartbeats=" << config.registry.missed_heartbeats
         << " | queue_capacity=" << config.bus.queue_capacity
         << " | worker_threads=" << config.bus.worker_threads
         << " | breaker=" << config.breaker.failure_threshold << '/' << config.breaker.recovery_timeout.count()
         << "ms/" << config.breaker.half_open_probes
         << " | retry=" << config.retry.max_attempts << 'x' << config.retry.base_delay.count() << "ms"
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  using namespace agent_coord;

  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/coord.yaml";

  core::CoordConfig config{};
  try {
    config = core::load_coord_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  core::SystemClock clock;
  bus::MessageBus message_bus{config.bus, clock};
  registry::AgentRegistry agent_registry{config.registry, clock, message_bus};
  emergency::EmergencyManager emergencies{config.emergency_thresholds, clock, message_bus};
  conflict::ConflictResolver conflicts{clock};

  std::unique_ptr<sinks::RedisConnection> redis;
  std::unique_ptr<sinks::RedisStateStore> store;
  std::unique_ptr<bridge::ValidatorClient> validator;
  if (config.redis.enabled) {
    sinks::RedisOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.password = config.redis.password;
    options.db = config.redis.db;
    options.key_prefix = config.redis.key_prefix;
    redis = std::make_unique<sinks::RedisConnection>(options);
    if (redis->check_connectivity()) {
      std::cerr << "[supervisor] redis connectivity confirmed\n";
    } else {
      std::cerr << "[supervisor] redis connectivity check failed; will keep retrying\n";
    }
    store = std::make_unique<sinks::RedisStateStore>(*redis);
    validator = std::make_unique<bridge::RedisValidatorClient>(*redis);
  } else {
    std::cerr << "[supervisor] redis disabled; validator channel offline, state kept in memory\n";
    validator = std::make_unique<bridge::OfflineValidatorClient>();
  }

  bridge::BridgeOptions bridge_options{};
  bridge_options.bridge_id = config.supervisor_agent_id + "_bridge";
  bridge_options.channel = config.bridge_channel;
  bridge_options.call_timeout = config.call_timeout;
  bridge_options.breaker = config.breaker;
  bridge_options.retry = config.retry;

  bridge::IntegrationBridge integration_bridge{bridge_options, bridge::ContractRegistry::with_defaults(), *validator,
                                               message_bus, clock, store.get()};
  integration_bridge.restore();

  core::SupervisorOptions supervisor_options{};
  supervisor_options.agent_id = config.supervisor_agent_id;
  supervisor_options.tick_interval = config.tick_interval;
  supervisor_options.shutdown_grace = config.shutdown_grace;
  supervisor_options.replay_every_ticks = config.replay_every_ticks;
  supervisor_options.evict_every_ticks = config.evict_every_ticks;
  supervisor_options.stdout_debug = config.stdout_debug;

  core::Supervisor supervisor{supervisor_options, clock, message_bus, agent_registry, emergencies, conflicts,
                              integration_bridge};

  message_bus.start();
  supervisor.start();
  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cerr << "[supervisor] shutdown signal received\n";
  supervisor.stop();
  message_bus.stop();

  const auto health = integration_bridge.health();
  std::cerr << "[supervisor] exiting cleanly; dead letters pending=" << health["dead_letter_queue_size"] << '\n';
  return 0;
}
