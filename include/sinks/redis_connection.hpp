#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/clock.hpp"

struct redisContext;
struct redisReply;

namespace agent_coord::sinks {

struct RedisOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"coord"};
  std::uint32_t connect_timeout_ms{1000};
};

struct ReplyDeleter {
  void operator()(redisReply* reply) const;
};

using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

// One lazily (re)connected hiredis context shared by the state store and the
// validator channel. Commands are serialized.
class RedisConnection {
 public:
  explicit RedisConnection(RedisOptions options = {});
  ~RedisConnection();

  RedisConnection(const RedisConnection&) = delete;
  RedisConnection& operator=(const RedisConnection&) = delete;

  bool check_connectivity();

  // Sends one command, reconnecting once on an I/O error. Returns null when
  // the command could not be delivered; error replies are returned as-is.
  // A positive read_timeout overrides the socket timeout for this command.
  ReplyPtr command(const std::vector<std::string>& args, core::Millis read_timeout = core::Millis{0});

  [[nodiscard]] const RedisOptions& options() const noexcept { return options_; }
  [[nodiscard]] std::string key(const std::string& suffix) const { return options_.key_prefix + ":" + suffix; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  ReplyPtr send(const std::vector<std::string>& args, core::Millis read_timeout);

  RedisOptions options_;
  std::mutex mutex_{};
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
};

}  // namespace agent_coord::sinks
