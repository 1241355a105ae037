#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bridge/circuit_breaker.hpp"
#include "model/dead_letter.hpp"

namespace agent_coord::bridge {

// Durable home for the bridge's recovery state. Failures are reported
// through return values; callers keep their in-memory copy either way.
class StateStore {
 public:
  virtual ~StateStore() = default;

  virtual bool save_dead_letter(const model::dead_letter_entry& entry) = 0;
  virtual bool erase_dead_letter(const std::string& message_id) = 0;
  virtual std::optional<std::vector<model::dead_letter_entry>> load_dead_letters() = 0;

  virtual bool save_breaker(const BreakerSnapshot& snapshot) = 0;
  virtual std::optional<BreakerSnapshot> load_breaker(const std::string& channel) = 0;
};

}  // namespace agent_coord::bridge
