#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bridge/state_store.hpp"
#include "sinks/redis_connection.hpp"

namespace agent_coord::sinks {

// Dead letters live in hash <prefix>:dlq keyed by message id; breaker state
// is a JSON string at <prefix>:breaker:<channel>.
class RedisStateStore final : public bridge::StateStore {
 public:
  explicit RedisStateStore(RedisConnection& connection);

  bool save_dead_letter(const model::dead_letter_entry& entry) override;
  bool erase_dead_letter(const std::string& message_id) override;
  std::optional<std::vector<model::dead_letter_entry>> load_dead_letters() override;

  bool save_breaker(const bridge::BreakerSnapshot& snapshot) override;
  std::optional<bridge::BreakerSnapshot> load_breaker(const std::string& channel) override;

  [[nodiscard]] std::uint64_t errors() const noexcept { return errors_.load(); }

 private:
  bool write(const std::vector<std::string>& args);
  void note_result(bool ok);

  RedisConnection& connection_;
  std::atomic<bool> healthy_{true};
  std::atomic<std::uint64_t> errors_{0};
};

}  // namespace agent_coord::sinks
