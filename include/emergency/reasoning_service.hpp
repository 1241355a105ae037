#pragma once

#include <optional>

#include <nlohmann/json.hpp>

#include "core/clock.hpp"

namespace agent_coord::emergency {

// Boundary to the external reasoning model. Only intervention logic calls it.
class ReasoningService {
 public:
  virtual ~ReasoningService() = default;

  [[nodiscard]] virtual bool available() const = 0;

  // Returns std::nullopt when no decision arrived within `timeout`.
  virtual std::optional<nlohmann::json> decide(const nlohmann::json& context, core::Millis timeout) = 0;
};

}  // namespace agent_coord::emergency
