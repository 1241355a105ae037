#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace agent_coord::sinks {

void StdoutDebugSink::publish(const core::CycleMetrics& metrics, const bridge::BreakerSnapshot& breaker,
                              const std::size_t dead_letter_depth) const {
  std::printf("[cycle] tick=%llu cycle_ms=%.2f emergencies=%zu conflicts=%zu transitions=%zu overruns=%llu "
              "phase_errors=%llu\n",
              static_cast<unsigned long long>(metrics.ticks), metrics.avg_cycle_ms, metrics.last_emergencies,
              metrics.last_conflicts, metrics.last_transitions, static_cast<unsigned long long>(metrics.overruns),
              static_cast<unsigned long long>(metrics.phase_errors));
  std::printf("[bridge] breaker=%s failures=%u dlq=%zu forwarded=%llu\n", bridge::to_string(breaker.state),
              breaker.consecutive_failures, dead_letter_depth,
              static_cast<unsigned long long>(metrics.total_forwarded));
}

}  // namespace agent_coord::sinks
