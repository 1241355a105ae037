#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/clock.hpp"
#include "model/message.hpp"

namespace agent_coord::bridge {

enum class call_status : std::uint8_t {
    OK = 0,
    TRANSIENT_FAILURE = 1,
    TIMEOUT = 2,
    UNAVAILABLE = 3,
};

const char* to_string(call_status status) noexcept;

struct ReceiveResult {
  call_status status{call_status::OK};
  // Empty with OK status when nothing arrived before the timeout.
  std::optional<model::message> message{};
};

// Transport to the external validation process. Every call is bounded by
// the given timeout and never throws for transport errors.
class ValidatorClient {
 public:
  virtual ~ValidatorClient() = default;

  virtual call_status send(const model::message& msg, core::Millis timeout) = 0;
  virtual ReceiveResult receive(core::Millis timeout) = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

class OfflineValidatorClient final : public ValidatorClient {
 public:
  call_status send(const model::message&, core::Millis) override { return call_status::UNAVAILABLE; }
  ReceiveResult receive(core::Millis) override { return {call_status::UNAVAILABLE, std::nullopt}; }
  [[nodiscard]] std::string name() const override { return "offline"; }
};

}  // namespace agent_coord::bridge
