#include <stdexcept>
#include <string>

#include "model/agent.hpp"
#include "model/conflict.hpp"
#include "model/dead_letter.hpp"
#include "model/emergency.hpp"
#include "model/message.hpp"

namespace agent_coord::model {
namespace {

std::int64_t since_epoch_ms(const core::TimePoint value) {
  return std::chrono::duration_cast<core::Millis>(value.time_since_epoch()).count();
}

nlohmann::json request_to_json(const action_request& request) {
  return nlohmann::json{{"source_id", request.source_id},
                        {"resource_id", request.resource_id},
                        {"action", request.action},
                        {"priority_score", request.priority_score},
                        {"requested_at_ms", since_epoch_ms(request.requested_at)}};
}

}  // namespace

const char* to_string(const model::priority value) noexcept {
  switch (value) {
    case priority::LOW:
      return "low";
    case priority::NORMAL:
      return "normal";
    case priority::HIGH:
      return "high";
    case priority::CRITICAL:
      return "critical";
  }
  return "normal";
}

std::optional<model::priority> priority_from_string(const std::string_view value) noexcept {
  if (value == "low") {
    return priority::LOW;
  }
  if (value == "normal") {
    return priority::NORMAL;
  }
  if (value == "high") {
    return priority::HIGH;
  }
  if (value == "critical") {
    return priority::CRITICAL;
  }
  return std::nullopt;
}

const char* to_string(const agent_status value) noexcept {
  switch (value) {
    case agent_status::ACTIVE:
      return "active";
    case agent_status::DEGRADED:
      return "degraded";
    case agent_status::OFFLINE:
      return "offline";
  }
  return "offline";
}

const char* to_string(const emergency_type value) noexcept {
  switch (value) {
    case emergency_type::FAILURE_RATE:
      return "failure_rate";
    case emergency_type::LATENCY:
      return "latency";
    case emergency_type::DOWNTIME:
      return "downtime";
    case emergency_type::RESOURCE_EXHAUSTION:
      return "resource_exhaustion";
    case emergency_type::RATE_LIMIT:
      return "rate_limit";
  }
  return "failure_rate";
}

std::optional<emergency_type> emergency_type_from_string(const std::string_view value) noexcept {
  for (std::size_t i = 0; i < kEmergencyTypeCount; ++i) {
    const auto type = static_cast<emergency_type>(i);
    if (value == to_string(type)) {
      return type;
    }
  }
  return std::nullopt;
}

const char* to_string(const request_outcome value) noexcept {
  return value == request_outcome::WON ? "won" : "lost";
}

nlohmann::json to_json(const message& msg) {
  return nlohmann::json{{"id", msg.id},
                        {"topic", msg.topic},
                        {"payload", msg.payload},
                        {"priority", to_string(msg.priority)},
                        {"sender_id", msg.sender_id},
                        {"created_at_ms", msg.created_wall_ms},
                        {"ttl_ms", msg.ttl.count()},
                        {"contract_version", msg.contract_version}};
}

message message_from_json(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw std::invalid_argument("message must be a JSON object");
  }

  message msg{};
  msg.id = json.value("id", std::string{});
  msg.topic = json.at("topic").get<std::string>();
  msg.payload = json.value("payload", nlohmann::json::object());
  msg.sender_id = json.value("sender_id", std::string{});
  msg.created_wall_ms = json.value("created_at_ms", std::uint64_t{0});
  msg.ttl = core::Millis(json.value("ttl_ms", std::int64_t{0}));
  msg.contract_version = json.value("contract_version", std::string(kBaselineContractVersion));

  const auto parsed_priority = priority_from_string(json.value("priority", std::string{"normal"}));
  if (!parsed_priority.has_value()) {
    throw std::invalid_argument("unknown message priority");
  }
  msg.priority = *parsed_priority;
  return msg;
}

nlohmann::json to_json(const emergency_event& event) {
  nlohmann::json agents = nlohmann::json::array();
  for (const auto& agent_id : event.affected_agents) {
    agents.push_back(agent_id);
  }
  return nlohmann::json{{"id", event.id},
                        {"type", to_string(event.type)},
                        {"severity", event.severity},
                        {"observed_value", event.observed_value},
                        {"threshold", event.threshold},
                        {"detected_at_ms", event.detected_wall_ms},
                        {"affected_agents", agents}};
}

nlohmann::json to_json(const conflict_record& record) {
  nlohmann::json requests = nlohmann::json::array();
  for (const auto& competing : record.competing_requests) {
    auto entry = request_to_json(competing.request);
    entry["outcome"] = to_string(competing.outcome);
    requests.push_back(std::move(entry));
  }
  return nlohmann::json{{"id", record.id},
                        {"resource_id", record.resource_id},
                        {"competing_requests", requests},
                        {"resolution", request_to_json(record.resolution)},
                        {"resolved_at_ms", since_epoch_ms(record.resolved_at)}};
}

nlohmann::json to_json(const dead_letter_entry& entry) {
  return nlohmann::json{{"message", to_json(entry.original_message)},
                        {"failure_reason", entry.failure_reason},
                        {"retry_count", entry.retry_count},
                        {"first_failed_at_ms", entry.first_failed_at_ms},
                        {"last_attempt_at_ms", entry.last_attempt_at_ms}};
}

dead_letter_entry dead_letter_from_json(const nlohmann::json& json) {
  dead_letter_entry entry{};
  entry.original_message = message_from_json(json.at("message"));
  entry.failure_reason = json.value("failure_reason", std::string{});
  entry.retry_count = json.value("retry_count", std::uint32_t{0});
  entry.first_failed_at_ms = json.value("first_failed_at_ms", std::uint64_t{0});
  entry.last_attempt_at_ms = json.value("last_attempt_at_ms", std::uint64_t{0});
  return entry;
}

}  // namespace agent_coord::model
