#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/emergency.hpp"

namespace agent_coord::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value, const long long min, const long long max) {
  long long parsed = 0;
  try {
    std::size_t consumed = 0;
    parsed = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (parsed < min || parsed > max) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min) + ".." + std::to_string(max));
  }
  return parsed;
}

double parse_number(const std::string& key, const std::string& value) {
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
    return parsed;
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number, got '" + value + "'");
  }
}

std::chrono::milliseconds parse_ms(const std::string& key, const std::string& value, const long long min) {
  return std::chrono::milliseconds(parse_integer(key, value, min, 86'400'000LL * 30));
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto port = parse_integer("redis.address port", value.substr(split + 1), 1, 65535);
  redis.port = static_cast<std::uint16_t>(port);
}

void apply_emergency_key(CoordConfig& config, const std::string& key, const std::string& value) {
  // emergency.<type>.<field>
  const std::string rest = key.substr(std::string("emergency.").size());
  const auto dot = rest.find('.');
  if (dot == std::string::npos) {
    throw std::runtime_error("unknown config key: " + key);
  }
  const auto type = model::emergency_type_from_string(rest.substr(0, dot));
  if (!type.has_value()) {
    throw std::runtime_error("unknown emergency type in " + key);
  }
  const std::string field = rest.substr(dot + 1);

  auto it = std::find_if(config.emergency_thresholds.begin(), config.emergency_thresholds.end(),
                         [&type](const emergency::EmergencyThreshold& t) { return t.type == *type; });
  if (it == config.emergency_thresholds.end()) {
    throw std::runtime_error("no threshold configured for " + key);
  }

  if (field == "threshold") {
    it->threshold = parse_number(key, value);
  } else if (field == "dwell_ms") {
    it->dwell = parse_ms(key, value, 0);
  } else if (field == "cooldown_ms") {
    it->cooldown = parse_ms(key, value, 0);
  } else if (field == "metric") {
    if (value.empty()) {
      throw std::runtime_error(key + " must not be empty");
    }
    it->metric = value;
  } else {
    throw std::runtime_error("unknown config key: " + key);
  }
}

void apply_key_value(CoordConfig& config, const std::string& key, const std::string& value) {
  if (key == "tick_rate_hz") {
    const auto hz = parse_integer(key, value, 1, 1000);
    config.tick_interval = std::chrono::milliseconds(1000 / hz);
    return;
  }

  if (key == "supervisor.shutdown_grace_ms") {
    config.shutdown_grace = parse_ms(key, value, 1);
  } else if (key == "supervisor.agent_id") {
    if (value.empty()) {
      throw std::runtime_error("supervisor.agent_id must not be empty");
    }
    config.supervisor_agent_id = value;
  } else if (key == "supervisor.replay_every_ticks") {
    config.replay_every_ticks = static_cast<std::uint64_t>(parse_integer(key, value, 0, 1'000'000));
  } else if (key == "supervisor.evict_every_ticks") {
    config.evict_every_ticks = static_cast<std::uint64_t>(parse_integer(key, value, 0, 1'000'000));
  } else if (key == "registry.heartbeat_interval_ms") {
    config.registry.heartbeat_interval = parse_ms(key, value, 1);
  } else if (key == "registry.missed_heartbeats") {
    config.registry.missed_heartbeats = static_cast<std::uint32_t>(parse_integer(key, value, 1, 1000));
  } else if (key == "bus.queue_capacity") {
    config.bus.queue_capacity = static_cast<std::size_t>(parse_integer(key, value, 1, 10'000'000));
  } else if (key == "bus.worker_threads") {
    config.bus.worker_threads = static_cast<std::size_t>(parse_integer(key, value, 0, 64));
  } else if (key == "bus.default_ttl_ms") {
    config.bus.default_ttl = parse_ms(key, value, 1);
  } else if (key == "breaker.failure_threshold") {
    config.breaker.failure_threshold = static_cast<std::uint32_t>(parse_integer(key, value, 1, 1'000'000));
  } else if (key == "breaker.recovery_timeout_ms") {
    config.breaker.recovery_timeout = parse_ms(key, value, 1);
  } else if (key == "breaker.half_open_probes") {
    config.breaker.half_open_probes = static_cast<std::uint32_t>(parse_integer(key, value, 1, 1000));
  } else if (key == "retry.max_attempts") {
    config.retry.max_attempts = static_cast<std::uint32_t>(parse_integer(key, value, 1, 100));
  } else if (key == "retry.base_delay_ms") {
    config.retry.base_delay = parse_ms(key, value, 1);
  } else if (key == "retry.max_delay_ms") {
    config.retry.max_delay = parse_ms(key, value, 1);
  } else if (key == "retry.jitter_ratio") {
    config.retry.jitter_ratio = parse_number(key, value);
    if (config.retry.jitter_ratio < 0.0 || config.retry.jitter_ratio > 1.0) {
      throw std::runtime_error("retry.jitter_ratio must be in range 0..1");
    }
  } else if (key == "bridge.call_timeout_ms") {
    config.call_timeout = parse_ms(key, value, 1);
  } else if (key == "bridge.channel") {
    if (value.empty()) {
      throw std::runtime_error("bridge.channel must not be empty");
    }
    config.bridge_channel = value;
  } else if (key.rfind("emergency.", 0) == 0) {
    apply_emergency_key(config, key, value);
  } else if (key == "redis.address") {
    apply_redis_address(config.redis, value);
  } else if (key == "redis.password") {
    config.redis.password = value;
  } else if (key == "redis.db") {
    config.redis.db = static_cast<int>(parse_integer(key, value, 0, 15));
  } else if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
  } else if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
  } else {
    throw std::runtime_error("unknown config key: " + key);
  }
}

void validate(const CoordConfig& config) {
  if (config.retry.max_delay < config.retry.base_delay) {
    throw std::runtime_error("retry.max_delay_ms must be >= retry.base_delay_ms");
  }
}

}  // namespace

CoordConfig load_coord_config(const std::string& path) {
  CoordConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate(config);
  return config;
}

}  // namespace agent_coord::core
