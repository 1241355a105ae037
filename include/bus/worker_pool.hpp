#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace agent_coord::bus {

// Fixed-size pool used to fan a message out to its subscribers.
// Tasks must not throw.
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t worker_count);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Blocks until every task has returned. With no workers the tasks run
  // inline on the calling thread, in order.
  void run_all(std::vector<std::function<void()>> tasks);

  [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

 private:
  void worker_loop();

  std::vector<std::thread> workers_{};
  std::deque<std::function<void()>> queue_{};
  std::mutex mutex_{};
  std::condition_variable cv_{};
  bool shutting_down_{false};
};

}  // namespace agent_coord::bus
