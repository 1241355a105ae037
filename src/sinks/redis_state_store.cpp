#include "sinks/redis_state_store.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

namespace agent_coord::sinks {

RedisStateStore::RedisStateStore(RedisConnection& connection) : connection_(connection) {}

void RedisStateStore::note_result(const bool ok) {
  if (!ok) {
    ++errors_;
  }
  if (healthy_.exchange(ok) == ok) {
    return;
  }
  std::cerr << (ok ? "[redis] persist recovered\n" : "[redis] persist failed\n");
}

bool RedisStateStore::write(const std::vector<std::string>& args) {
  const auto reply = connection_.command(args);
  const bool ok = reply != nullptr && reply->type != REDIS_REPLY_ERROR;
  note_result(ok);
  return ok;
}

bool RedisStateStore::save_dead_letter(const model::dead_letter_entry& entry) {
  return write({"HSET", connection_.key("dlq"), entry.original_message.id, model::to_json(entry).dump()});
}

bool RedisStateStore::erase_dead_letter(const std::string& message_id) {
  return write({"HDEL", connection_.key("dlq"), message_id});
}

std::optional<std::vector<model::dead_letter_entry>> RedisStateStore::load_dead_letters() {
  const auto reply = connection_.command({"HGETALL", connection_.key("dlq")});
  if (reply == nullptr || reply->type != REDIS_REPLY_ARRAY) {
    note_result(false);
    return std::nullopt;
  }
  note_result(true);

  std::vector<model::dead_letter_entry> entries;
  for (std::size_t i = 0; i + 1 < reply->elements; i += 2) {
    const redisReply* field = reply->element[i];
    const redisReply* value = reply->element[i + 1];
    if (value == nullptr || value->str == nullptr) {
      continue;
    }
    try {
      entries.push_back(model::dead_letter_from_json(nlohmann::json::parse(std::string(value->str, value->len))));
    } catch (const std::exception& ex) {
      std::cerr << "[redis] skipping unreadable dead-letter entry "
                << (field != nullptr && field->str != nullptr ? field->str : "?") << ": " << ex.what() << '\n';
    }
  }
  return entries;
}

bool RedisStateStore::save_breaker(const bridge::BreakerSnapshot& snapshot) {
  return write({"SET", connection_.key("breaker:" + snapshot.channel), bridge::to_json(snapshot).dump()});
}

std::optional<bridge::BreakerSnapshot> RedisStateStore::load_breaker(const std::string& channel) {
  const auto reply = connection_.command({"GET", connection_.key("breaker:" + channel)});
  if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
    note_result(false);
    return std::nullopt;
  }
  note_result(true);
  if (reply->type != REDIS_REPLY_STRING || reply->str == nullptr) {
    return std::nullopt;
  }

  try {
    auto snapshot = bridge::breaker_snapshot_from_json(nlohmann::json::parse(std::string(reply->str, reply->len)));
    snapshot.channel = channel;
    return snapshot;
  } catch (const std::exception& ex) {
    std::cerr << "[redis] ignoring unreadable breaker state for " << channel << ": " << ex.what() << '\n';
    return std::nullopt;
  }
}

}  // namespace agent_coord::sinks
