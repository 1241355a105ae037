#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "core/clock.hpp"
#include "model/conflict.hpp"

namespace agent_coord::conflict {

struct DetectionResult {
  std::vector<model::conflict_record> conflicts;
  // Requests that faced no contradicting proposal on their resource.
  std::vector<model::action_request> accepted;
};

// Strict ranking: higher score, then earlier request, then smaller
// source_id, then smaller action.
bool outranks(const model::action_request& lhs, const model::action_request& rhs);

class ConflictResolver {
 public:
  explicit ConflictResolver(const core::Clock& clock, std::size_t history_limit = 256);

  // Throws std::invalid_argument on an empty request list. Every request is
  // kept in the record, in submission order, with its outcome.
  model::conflict_record resolve(const std::vector<model::action_request>& requests);

  DetectionResult detect_and_resolve(const std::vector<model::action_request>& requests);

  [[nodiscard]] std::vector<model::conflict_record> history(std::size_t limit = 50) const;
  [[nodiscard]] std::uint64_t resolved_count() const;

 private:
  const core::Clock& clock_;
  std::size_t history_limit_;

  mutable std::mutex mutex_{};
  std::deque<model::conflict_record> history_{};
  std::uint64_t next_record_id_{0};
};

}  // namespace agent_coord::conflict
