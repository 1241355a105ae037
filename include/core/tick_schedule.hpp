#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace agent_coord::core {

// Runs housekeeping jobs on every Nth coordination tick.
class TickSchedule {
 public:
  struct Job {
    std::string name;
    std::uint64_t every_ticks;
    std::function<void()> run;
  };

  void add(std::string name, std::uint64_t every_ticks, std::function<void()> run);

  // Runs the jobs due on the current tick, then advances the tick counter.
  // Returns the number of jobs executed.
  std::size_t run_due();

  [[nodiscard]] std::uint64_t tick() const noexcept { return tick_count_; }
  [[nodiscard]] bool due(std::uint64_t every_n_ticks) const noexcept;

 private:
  std::vector<Job> jobs_{};
  std::uint64_t tick_count_{0};
};

}  // namespace agent_coord::core
