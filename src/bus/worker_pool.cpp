#include "bus/worker_pool.hpp"

#include <memory>
#include <utility>

namespace agent_coord::bus {
namespace {

struct Completion {
  std::mutex mutex;
  std::condition_variable cv;
  std::size_t remaining{0};
};

}  // namespace

WorkerPool::WorkerPool(const std::size_t worker_count) {
  workers_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers_.emplace_back([this]() { worker_loop(); });
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
  }
  cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void WorkerPool::run_all(std::vector<std::function<void()>> tasks) {
  if (tasks.empty()) {
    return;
  }

  if (workers_.empty() || tasks.size() == 1) {
    for (auto& task : tasks) {
      task();
    }
    return;
  }

  auto completion = std::make_shared<Completion>();
  completion->remaining = tasks.size();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& task : tasks) {
      queue_.emplace_back([completion, task = std::move(task)]() {
        task();
        std::lock_guard<std::mutex> done_lock(completion->mutex);
        if (--completion->remaining == 0) {
          completion->cv.notify_all();
        }
      });
    }
  }
  cv_.notify_all();

  std::unique_lock<std::mutex> wait_lock(completion->mutex);
  completion->cv.wait(wait_lock, [&completion]() { return completion->remaining == 0; });
}

void WorkerPool::worker_loop() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return shutting_down_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    task();
  }
}

}  // namespace agent_coord::bus
