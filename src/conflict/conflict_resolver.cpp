#include "conflict/conflict_resolver.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace agent_coord::conflict {

bool outranks(const model::action_request& lhs, const model::action_request& rhs) {
  if (lhs.priority_score != rhs.priority_score) {
    return lhs.priority_score > rhs.priority_score;
  }
  if (lhs.requested_at != rhs.requested_at) {
    return lhs.requested_at < rhs.requested_at;
  }
  if (lhs.source_id != rhs.source_id) {
    return lhs.source_id < rhs.source_id;
  }
  return lhs.action < rhs.action;
}

ConflictResolver::ConflictResolver(const core::Clock& clock, const std::size_t history_limit)
    : clock_(clock), history_limit_(history_limit) {}

model::conflict_record ConflictResolver::resolve(const std::vector<model::action_request>& requests) {
  if (requests.empty()) {
    throw std::invalid_argument("conflict resolution requires at least one request");
  }

  std::size_t winner = 0;
  for (std::size_t i = 1; i < requests.size(); ++i) {
    if (outranks(requests[i], requests[winner])) {
      winner = i;
    }
  }

  model::conflict_record record{};
  record.resource_id = requests[winner].resource_id;
  record.resolution = requests[winner];
  record.resolved_at = clock_.now();
  record.competing_requests.reserve(requests.size());
  for (std::size_t i = 0; i < requests.size(); ++i) {
    record.competing_requests.push_back(
        {requests[i], i == winner ? model::request_outcome::WON : model::request_outcome::LOST});
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    record.id = "cfl-" + std::to_string(++next_record_id_);
    history_.push_back(record);
    while (history_.size() > history_limit_) {
      history_.pop_front();
    }
  }

  std::cerr << "[conflict] " << record.id << " resource=" << record.resource_id << " requests=" << requests.size()
            << " winner=" << record.resolution.source_id << " action=" << record.resolution.action << '\n';
  return record;
}

DetectionResult ConflictResolver::detect_and_resolve(const std::vector<model::action_request>& requests) {
  std::map<std::string, std::vector<model::action_request>> by_resource;
  for (const auto& request : requests) {
    auto& group = by_resource[request.resource_id];

    // A source repeating the same proposal counts once, at its best rank.
    const auto duplicate = std::find_if(group.begin(), group.end(), [&request](const model::action_request& existing) {
      return existing.source_id == request.source_id && existing.action == request.action;
    });
    if (duplicate == group.end()) {
      group.push_back(request);
    } else if (outranks(request, *duplicate)) {
      *duplicate = request;
    }
  }

  DetectionResult result{};
  for (auto& [resource_id, group] : by_resource) {
    std::set<std::string> actions;
    for (const auto& request : group) {
      actions.insert(request.action);
    }

    if (actions.size() >= 2) {
      result.conflicts.push_back(resolve(group));
      continue;
    }
    for (auto& request : group) {
      result.accepted.push_back(std::move(request));
    }
  }
  return result;
}

std::vector<model::conflict_record> ConflictResolver::history(const std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t count = std::min(limit, history_.size());
  return {history_.end() - static_cast<std::ptrdiff_t>(count), history_.end()};
}

std::uint64_t ConflictResolver::resolved_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_record_id_;
}

}  // namespace agent_coord::conflict
