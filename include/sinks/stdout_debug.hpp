#pragma once

#include <cstddef>

#include "bridge/circuit_breaker.hpp"
#include "core/cycle_metrics.hpp"

namespace agent_coord::sinks {

class StdoutDebugSink {
 public:
  void publish(const core::CycleMetrics& metrics, const bridge::BreakerSnapshot& breaker,
               std::size_t dead_letter_depth) const;
};

}  // namespace agent_coord::sinks
