#include "core/tick_schedule.hpp"

#include <utility>

namespace agent_coord::core {

void TickSchedule::add(std::string name, const std::uint64_t every_ticks, std::function<void()> run) {
  jobs_.push_back({std::move(name), every_ticks, std::move(run)});
}

bool TickSchedule::due(const std::uint64_t every_n_ticks) const noexcept {
  if (every_n_ticks == 0) {
    return false;
  }
  return (tick_count_ % every_n_ticks) == 0;
}

std::size_t TickSchedule::run_due() {
  std::size_t executed = 0;
  for (auto& job : jobs_) {
    if (due(job.every_ticks) && job.run) {
      job.run();
      ++executed;
    }
  }
  ++tick_count_;
  return executed;
}

}  // namespace agent_coord::core
