#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "model/emergency.hpp"

namespace agent_coord::emergency {

enum class InterventionKind : std::uint8_t {
  REDUCE_LOAD,
  ACTIVATE_FALLBACK,
  THROTTLE_REQUESTS,
  CLEAR_CACHES,
  RESTART_AGENTS,
  REDISTRIBUTE_WORKLOAD,
  NOTIFY_HUMAN,
  CUSTOM,
};

const char* to_string(InterventionKind kind) noexcept;

// One protocol step; `run` reports whether the step handled the event.
struct InterventionStep {
  InterventionKind kind{InterventionKind::CUSTOM};
  std::string name;
  std::function<bool(const model::emergency_event&)> run;
};

using InterventionProtocol = std::vector<InterventionStep>;

struct StepOutcome {
  std::string name;
  bool succeeded{false};
  std::string detail;
};

struct InterventionResult {
  std::string event_id;
  model::emergency_type type{model::emergency_type::FAILURE_RATE};
  std::vector<StepOutcome> steps;
  bool succeeded{false};
  std::string resolved_by;
};

}  // namespace agent_coord::emergency
