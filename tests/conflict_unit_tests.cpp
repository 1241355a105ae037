#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "conflict/conflict_resolver.hpp"
#include "core/clock.hpp"

using agent_coord::conflict::ConflictResolver;
using agent_coord::conflict::outranks;
using agent_coord::core::ManualClock;
using agent_coord::core::TimePoint;
using agent_coord::model::action_request;
using agent_coord::model::request_outcome;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

action_request request(const std::string& source, const std::string& resource, const std::string& action,
                       const double score, const int at_ms) {
  return {source, resource, action, score, TimePoint{} + std::chrono::milliseconds(at_ms)};
}

int test_ranking_tie_breaks() {
  const auto base = request("b", "r", "scale_up", 0.5, 10);
  if (!outranks(request("z", "r", "x", 0.6, 99), base)) {
    return fail("test_ranking_tie_breaks", "higher score wins");
  }
  if (!outranks(request("z", "r", "x", 0.5, 5), base)) {
    return fail("test_ranking_tie_breaks", "earlier request wins on equal score");
  }
  if (!outranks(request("a", "r", "x", 0.5, 10), base)) {
    return fail("test_ranking_tie_breaks", "smaller source wins on equal score and time");
  }
  if (!outranks(request("b", "r", "restart", 0.5, 10), base) || outranks(base, base)) {
    return fail("test_ranking_tie_breaks", "action name is the final tie break and ranking is strict");
  }
  return 0;
}

int test_resolve_keeps_every_request_in_order() {
  ManualClock clock;
  ConflictResolver resolver{clock};

  const std::vector<action_request> requests = {request("planner", "db", "scale_down", 0.4, 1),
                                                request("monitor", "db", "scale_up", 0.9, 2),
                                                request("tuner", "db", "restart", 0.2, 3)};
  const auto record = resolver.resolve(requests);

  if (record.id.empty() || record.resource_id != "db" || record.resolution.source_id != "monitor") {
    return fail("test_resolve_keeps_every_request_in_order", "highest score should win");
  }
  if (record.competing_requests.size() != 3 || record.competing_requests[0].request.source_id != "planner" ||
      record.competing_requests[1].outcome != request_outcome::WON ||
      record.competing_requests[0].outcome != request_outcome::LOST ||
      record.competing_requests[2].outcome != request_outcome::LOST) {
    return fail("test_resolve_keeps_every_request_in_order", "record must list requests in submission order");
  }
  return 0;
}

int test_resolution_is_order_independent() {
  ManualClock clock;
  ConflictResolver resolver{clock};

  std::vector<action_request> requests = {request("c", "q", "drain", 0.7, 4), request("a", "q", "pause", 0.7, 4),
                                          request("b", "q", "resume", 0.7, 4), request("d", "q", "drain", 0.1, 1)};
  std::sort(requests.begin(), requests.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.source_id < rhs.source_id; });
  do {
    const auto record = resolver.resolve(requests);
    if (record.resolution.source_id != "a" || record.resolution.action != "pause") {
      return fail("test_resolution_is_order_independent", "winner must not depend on submission order");
    }
  } while (std::next_permutation(requests.begin(), requests.end(),
                                 [](const auto& lhs, const auto& rhs) { return lhs.source_id < rhs.source_id; }));
  return 0;
}

int test_empty_request_list_is_rejected() {
  ManualClock clock;
  ConflictResolver resolver{clock};
  bool threw = false;
  try {
    resolver.resolve({});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_empty_request_list_is_rejected", "empty list should throw");
  }
  return 0;
}

int test_detect_groups_by_resource() {
  ManualClock clock;
  ConflictResolver resolver{clock};

  const std::vector<action_request> requests = {
      request("a", "cache", "flush", 0.3, 1),   request("b", "cache", "warm", 0.6, 2),
      request("a", "cache", "flush", 0.8, 3),   request("c", "queue", "drain", 0.5, 1),
      request("d", "queue", "drain", 0.4, 2),   request("e", "disk", "compact", 0.2, 1)};
  const auto result = resolver.detect_and_resolve(requests);

  if (result.conflicts.size() != 1 || result.conflicts.front().resource_id != "cache") {
    return fail("test_detect_groups_by_resource", "only cache has contradicting actions");
  }
  const auto& record = result.conflicts.front();
  if (record.competing_requests.size() != 2 || record.resolution.source_id != "a" ||
      record.resolution.priority_score != 0.8) {
    return fail("test_detect_groups_by_resource", "duplicate proposal should merge at its best rank");
  }
  if (result.accepted.size() != 3) {
    return fail("test_detect_groups_by_resource", "agreeing and lone requests should be accepted");
  }
  if (resolver.resolved_count() != 1 || resolver.history().size() != 1) {
    return fail("test_detect_groups_by_resource", "one record should be kept in history");
  }
  return 0;
}

int test_history_is_bounded() {
  ManualClock clock;
  ConflictResolver resolver{clock, 3};
  for (int i = 0; i < 5; ++i) {
    resolver.resolve({request("a", "r" + std::to_string(i), "x", 0.1, i)});
  }
  const auto history = resolver.history();
  if (history.size() != 3 || history.front().resource_id != "r2" || resolver.resolved_count() != 5) {
    return fail("test_history_is_bounded", "history should keep the newest records only");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_ranking_tie_breaks(); rc != 0) return rc;
  if (int rc = test_resolve_keeps_every_request_in_order(); rc != 0) return rc;
  if (int rc = test_resolution_is_order_independent(); rc != 0) return rc;
  if (int rc = test_empty_request_list_is_rejected(); rc != 0) return rc;
  if (int rc = test_detect_groups_by_resource(); rc != 0) return rc;
  if (int rc = test_history_is_bounded(); rc != 0) return rc;

  std::cout << "[PASS] conflict unit tests\n";
  return 0;
}
