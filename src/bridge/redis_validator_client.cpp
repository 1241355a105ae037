#include "bridge/redis_validator_client.hpp"

#include <cstdio>
#include <exception>
#include <iostream>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "bridge/message_contract.hpp"

namespace agent_coord::bridge {
namespace {

std::string seconds_arg(const core::Millis timeout) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.3f", static_cast<double>(timeout.count()) / 1000.0);
  return buffer;
}

// Keeps an unreadable response addressable so contract validation can
// dead-letter it instead of dropping it.
model::message quarantine(const std::string& raw) {
  model::message msg{};
  msg.topic = std::string(kDeploymentNotificationTopic);
  msg.payload = nlohmann::json{{"raw", raw}};
  msg.contract_version = "0.0";
  return msg;
}

}  // namespace

RedisValidatorClient::RedisValidatorClient(sinks::RedisConnection& connection)
    : connection_(connection),
      inbox_key_(connection.key("validator:inbox")),
      outbox_key_(connection.key("validator:outbox")) {}

call_status RedisValidatorClient::send(const model::message& msg, const core::Millis timeout) {
  const auto reply = connection_.command({"LPUSH", inbox_key_, model::to_json(msg).dump()}, timeout);
  if (reply == nullptr) {
    return call_status::UNAVAILABLE;
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    std::cerr << "[bridge] validator inbox rejected " << msg.id << ": " << (reply->str != nullptr ? reply->str : "")
              << '\n';
    return call_status::TRANSIENT_FAILURE;
  }
  return call_status::OK;
}

ReceiveResult RedisValidatorClient::receive(const core::Millis timeout) {
  const auto reply = connection_.command({"BRPOP", outbox_key_, seconds_arg(timeout)}, timeout);
  if (reply == nullptr) {
    return {call_status::UNAVAILABLE, std::nullopt};
  }
  if (reply->type == REDIS_REPLY_NIL) {
    return {call_status::OK, std::nullopt};
  }
  if (reply->type != REDIS_REPLY_ARRAY || reply->elements < 2 || reply->element[1] == nullptr ||
      reply->element[1]->str == nullptr) {
    return {call_status::TRANSIENT_FAILURE, std::nullopt};
  }

  const std::string raw(reply->element[1]->str, reply->element[1]->len);
  try {
    return {call_status::OK, model::message_from_json(nlohmann::json::parse(raw))};
  } catch (const std::exception& ex) {
    std::cerr << "[bridge] unreadable validator response: " << ex.what() << '\n';
    return {call_status::OK, quarantine(raw)};
  }
}

}  // namespace agent_coord::bridge
