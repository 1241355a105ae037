#include "bridge/dead_letter_queue.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <utility>

namespace agent_coord::bridge {

DeadLetterQueue::DeadLetterQueue(StateStore* store) : store_(store) {}

bool DeadLetterQueue::add(const model::message& msg, const std::string& reason, const std::uint32_t attempts,
                          const std::uint64_t now_wall_ms) {
  model::dead_letter_entry persisted{};
  bool inserted = false;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(msg.id);
    if (it == entries_.end()) {
      model::dead_letter_entry entry{msg, reason, attempts, now_wall_ms, now_wall_ms};
      it = entries_.emplace(msg.id, std::move(entry)).first;
      inserted = true;
    } else {
      it->second.failure_reason = reason;
      it->second.retry_count += attempts;
      it->second.last_attempt_at_ms = now_wall_ms;
    }
    persisted = it->second;
  }

  if (store_ != nullptr && !store_->save_dead_letter(persisted)) {
    ++persist_failures_;
  }
  std::cerr << "[bridge] dead-lettered " << msg.id << " (" << msg.topic << "): " << reason
            << " retries=" << persisted.retry_count << '\n';
  return inserted;
}

bool DeadLetterQueue::remove(const std::string& message_id) {
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (entries_.erase(message_id) == 0) {
      return false;
    }
  }
  if (store_ != nullptr && !store_->erase_dead_letter(message_id)) {
    ++persist_failures_;
  }
  return true;
}

std::optional<model::dead_letter_entry> DeadLetterQueue::get(const std::string& message_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = entries_.find(message_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<model::dead_letter_entry> DeadLetterQueue::list(const std::size_t limit) const {
  std::vector<model::dead_letter_entry> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) {
      out.push_back(entry);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.first_failed_at_ms != rhs.first_failed_at_ms) {
      return lhs.first_failed_at_ms < rhs.first_failed_at_ms;
    }
    return lhs.original_message.id < rhs.original_message.id;
  });
  if (out.size() > limit) {
    out.resize(limit);
  }
  return out;
}

std::vector<std::string> DeadLetterQueue::ids() const {
  std::vector<std::string> out;
  for (const auto& entry : list(size())) {
    out.push_back(entry.original_message.id);
  }
  return out;
}

std::size_t DeadLetterQueue::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

std::size_t DeadLetterQueue::load() {
  if (store_ == nullptr) {
    return 0;
  }
  auto loaded = store_->load_dead_letters();
  if (!loaded.has_value()) {
    std::cerr << "[bridge] dead-letter store unavailable, starting with in-memory queue\n";
    return 0;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
  for (auto& entry : *loaded) {
    auto id = entry.original_message.id;
    entries_.emplace(std::move(id), std::move(entry));
  }
  std::cerr << "[bridge] restored " << entries_.size() << " dead-letter entries\n";
  return entries_.size();
}

}  // namespace agent_coord::bridge
