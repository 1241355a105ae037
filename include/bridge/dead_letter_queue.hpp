#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "bridge/state_store.hpp"
#include "model/dead_letter.hpp"

namespace agent_coord::bridge {

// Holds every message the bridge could not deliver, keyed by message id, so
// a message appears at most once. Entries leave only through remove().
class DeadLetterQueue {
 public:
  explicit DeadLetterQueue(StateStore* store = nullptr);

  // Inserts a new entry or, for a known id, accumulates retry_count and
  // refreshes the reason and last attempt. Returns true for a new entry.
  bool add(const model::message& msg, const std::string& reason, std::uint32_t attempts, std::uint64_t now_wall_ms);
  bool remove(const std::string& message_id);

  [[nodiscard]] std::optional<model::dead_letter_entry> get(const std::string& message_id) const;
  // Oldest failure first.
  [[nodiscard]] std::vector<model::dead_letter_entry> list(std::size_t limit = 100) const;
  [[nodiscard]] std::vector<std::string> ids() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::uint64_t persist_failures() const noexcept { return persist_failures_.load(); }

  // Replaces the in-memory contents with the persisted entries.
  std::size_t load();

 private:
  StateStore* store_;
  mutable std::shared_mutex mutex_{};
  std::map<std::string, model::dead_letter_entry> entries_{};
  std::atomic<std::uint64_t> persist_failures_{0};
};

}  // namespace agent_coord::bridge
