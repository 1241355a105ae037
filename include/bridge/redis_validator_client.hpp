#pragma once

#include <string>

#include "bridge/validator_client.hpp"
#include "sinks/redis_connection.hpp"

namespace agent_coord::bridge {

// Validator channel over two Redis lists: outgoing messages are LPUSHed onto
// <prefix>:validator:inbox, responses are BRPOPed from <prefix>:validator:outbox.
class RedisValidatorClient final : public ValidatorClient {
 public:
  explicit RedisValidatorClient(sinks::RedisConnection& connection);

  call_status send(const model::message& msg, core::Millis timeout) override;
  ReceiveResult receive(core::Millis timeout) override;
  [[nodiscard]] std::string name() const override { return "redis"; }

 private:
  sinks::RedisConnection& connection_;
  std::string inbox_key_;
  std::string outbox_key_;
};

}  // namespace agent_coord::bridge
