#include "bridge/message_contract.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <utility>

namespace agent_coord::bridge {
namespace {

bool matches(const nlohmann::json& value, const field_type type) {
  switch (type) {
    case field_type::STRING:
      return value.is_string();
    case field_type::NUMBER:
      return value.is_number();
    case field_type::BOOLEAN:
      return value.is_boolean();
    case field_type::OBJECT:
      return value.is_object();
    case field_type::ARRAY:
      return value.is_array();
  }
  return false;
}

bool parse_component(const std::string_view text, int& out) {
  if (text.empty()) {
    return false;
  }
  const auto* end = text.data() + text.size();
  const auto result = std::from_chars(text.data(), end, out);
  return result.ec == std::errc{} && result.ptr == end && out >= 0;
}

}  // namespace

std::optional<contract_version> parse_contract_version(const std::string_view text) noexcept {
  const auto dot = text.find('.');
  if (dot == std::string_view::npos) {
    return std::nullopt;
  }
  contract_version version{};
  if (!parse_component(text.substr(0, dot), version.major) || !parse_component(text.substr(dot + 1), version.minor)) {
    return std::nullopt;
  }
  return version;
}

const char* to_string(const field_type type) noexcept {
  switch (type) {
    case field_type::STRING:
      return "string";
    case field_type::NUMBER:
      return "number";
    case field_type::BOOLEAN:
      return "boolean";
    case field_type::OBJECT:
      return "object";
    case field_type::ARRAY:
      return "array";
  }
  return "unknown";
}

void ContractRegistry::add(MessageContract contract) {
  if (contract.topic.empty()) {
    throw std::invalid_argument("contract topic must not be empty");
  }
  if (!parse_contract_version(contract.version).has_value()) {
    throw std::invalid_argument("malformed contract version '" + contract.version + "' for " + contract.topic);
  }

  auto& list = contracts_[contract.topic];
  const bool duplicate = std::any_of(list.begin(), list.end(),
                                     [&contract](const MessageContract& c) { return c.version == contract.version; });
  if (duplicate) {
    throw std::invalid_argument("duplicate contract " + contract.topic + "@" + contract.version);
  }
  list.push_back(std::move(contract));
}

const MessageContract* ContractRegistry::find_compatible(const std::string& topic,
                                                         const std::string_view version) const {
  const auto it = contracts_.find(topic);
  const auto wanted = parse_contract_version(version);
  if (it == contracts_.end() || !wanted.has_value()) {
    return nullptr;
  }

  const MessageContract* best = nullptr;
  int best_minor = 0;
  for (const auto& contract : it->second) {
    const auto have = parse_contract_version(contract.version);
    if (!have.has_value() || have->major != wanted->major || have->minor < wanted->minor) {
      continue;
    }
    if (best == nullptr || have->minor < best_minor) {
      best = &contract;
      best_minor = have->minor;
    }
  }
  return best;
}

ValidationResult ContractRegistry::validate(const model::message& msg) const {
  if (contracts_.find(msg.topic) == contracts_.end()) {
    return {false, "unknown_topic " + msg.topic};
  }
  const auto* contract = find_compatible(msg.topic, msg.contract_version);
  if (contract == nullptr) {
    return {false, "unsupported_version " + msg.contract_version};
  }
  if (!msg.payload.is_object()) {
    return {false, "payload is not an object"};
  }

  for (const auto& field : contract->fields) {
    const auto it = msg.payload.find(field.name);
    if (it == msg.payload.end()) {
      if (field.required) {
        return {false, "missing_field " + field.name};
      }
      continue;
    }
    if (!matches(*it, field.type)) {
      return {false, "invalid_type " + field.name + " (expected " + to_string(field.type) + ")"};
    }
  }
  return {true, {}};
}

std::vector<std::string> ContractRegistry::versions(const std::string& topic) const {
  std::vector<std::string> out;
  const auto it = contracts_.find(topic);
  if (it != contracts_.end()) {
    for (const auto& contract : it->second) {
      out.push_back(contract.version);
    }
  }
  return out;
}

ContractRegistry ContractRegistry::with_defaults() {
  const std::vector<field_spec> trigger_fields = {
      {"trigger_type", field_type::STRING, true},
      {"performance_data", field_type::OBJECT, true},
      {"timestamp", field_type::STRING, true},
      {"affected_agents", field_type::ARRAY, false},
      {"severity", field_type::STRING, false},
  };

  ContractRegistry registry;
  registry.add({std::string(kImprovementTriggerTopic), "1.0", trigger_fields});

  auto trigger_v11 = trigger_fields;
  trigger_v11.push_back({"conflicts", field_type::ARRAY, false});
  registry.add({std::string(kImprovementTriggerTopic), "1.1", std::move(trigger_v11)});

  registry.add({std::string(kDeploymentNotificationTopic),
                "1.0",
                {
                    {"deployment_id", field_type::STRING, true},
                    {"status", field_type::STRING, true},
                    {"timestamp", field_type::STRING, true},
                    {"prompt_version", field_type::STRING, false},
                    {"rollback_available", field_type::BOOLEAN, false},
                }});
  return registry;
}

}  // namespace agent_coord::bridge
