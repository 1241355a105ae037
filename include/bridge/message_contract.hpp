#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/message.hpp"

namespace agent_coord::bridge {

inline constexpr std::string_view kImprovementTriggerTopic = "improvement_trigger";
inline constexpr std::string_view kDeploymentNotificationTopic = "deployment_notification";

enum class field_type : std::uint8_t {
    STRING = 0,
    NUMBER = 1,
    BOOLEAN = 2,
    OBJECT = 3,
    ARRAY = 4,
};

struct field_spec {
    std::string name;
    field_type type{field_type::STRING};
    bool required{true};
};

struct contract_version {
    int major{1};
    int minor{0};
};

struct MessageContract {
  std::string topic;
  std::string version;
  std::vector<field_spec> fields;
};

struct ValidationResult {
  bool ok{false};
  std::string reason;
};

std::optional<contract_version> parse_contract_version(std::string_view text) noexcept;
const char* to_string(field_type type) noexcept;

// Compatibility table for every topic crossing the bridge. A message at
// version M.m is accepted by the contract with the same major and the
// smallest minor >= m.
class ContractRegistry {
 public:
  // Throws std::invalid_argument on an empty topic, a malformed version or a
  // duplicate (topic, version) pair.
  void add(MessageContract contract);

  [[nodiscard]] const MessageContract* find_compatible(const std::string& topic, std::string_view version) const;
  [[nodiscard]] ValidationResult validate(const model::message& msg) const;
  [[nodiscard]] std::vector<std::string> versions(const std::string& topic) const;

  // improvement_trigger 1.0 / 1.1 and deployment_notification 1.0.
  static ContractRegistry with_defaults();

 private:
  std::map<std::string, std::vector<MessageContract>> contracts_{};
};

}  // namespace agent_coord::bridge
