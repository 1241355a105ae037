#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace agent_coord::core {

enum class loop_phase : std::uint8_t {
    COLLECT = 0,
    EVALUATE = 1,
    RESOLVE = 2,
    FORWARD = 3,
};

inline constexpr std::size_t kLoopPhaseCount = 4;

const char* to_string(loop_phase phase) noexcept;

struct CycleMetrics {
  std::uint64_t ticks{0};
  std::uint64_t overruns{0};
  std::uint64_t phase_errors{0};
  std::array<double, kLoopPhaseCount> avg_phase_ms{};
  double avg_cycle_ms{0.0};
  double avg_conflicts_per_cycle{0.0};
  double avg_emergencies_per_cycle{0.0};
  std::size_t last_conflicts{0};
  std::size_t last_emergencies{0};
  std::size_t last_forwarded{0};
  std::size_t last_transitions{0};
  std::uint64_t total_conflicts{0};
  std::uint64_t total_emergencies{0};
  std::uint64_t total_forwarded{0};
  std::uint64_t inbound_rejected{0};
};

}  // namespace agent_coord::core
