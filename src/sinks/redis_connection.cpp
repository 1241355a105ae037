#include "sinks/redis_connection.hpp"

#include <iostream>
#include <string>
#include <utility>

#include <hiredis/hiredis.h>

namespace agent_coord::sinks {
namespace {

timeval to_timeval(const std::uint64_t timeout_ms) {
  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
  return timeout;
}

}  // namespace

void ReplyDeleter::operator()(redisReply* reply) const {
  if (reply != nullptr) {
    freeReplyObject(reply);
  }
}

RedisConnection::RedisConnection(RedisOptions options) : options_(std::move(options)) {}

RedisConnection::~RedisConnection() = default;

void RedisConnection::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisConnection::check_connectivity() {
  std::lock_guard<std::mutex> lock(mutex_);
  return ensure_connected();
}

bool RedisConnection::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisConnection::reconnect() {
  context_.reset();

  const timeval timeout = to_timeval(options_.connect_timeout_ms);
  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisConnection::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  const auto reply = send({"AUTH", options_.password}, core::Millis{0});
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  return ok;
}

bool RedisConnection::select_db() {
  if (options_.db == 0) {
    return true;
  }

  const auto reply = send({"SELECT", std::to_string(options_.db)}, core::Millis{0});
  return reply != nullptr && reply->type != REDIS_REPLY_ERROR;
}

ReplyPtr RedisConnection::command(const std::vector<std::string>& args, const core::Millis read_timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ensure_connected()) {
    return nullptr;
  }

  auto reply = send(args, read_timeout);
  if (reply != nullptr) {
    return reply;
  }
  if (!reconnect()) {
    return nullptr;
  }
  return send(args, read_timeout);
}

ReplyPtr RedisConnection::send(const std::vector<std::string>& args, const core::Millis read_timeout) {
  command_argv_.clear();
  command_argv_len_.clear();
  for (const auto& arg : args) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  const bool override_timeout = read_timeout > core::Millis{0};
  if (override_timeout) {
    // Leave room for the server-side block to expire before the socket does.
    const auto socket_ms = static_cast<std::uint64_t>(read_timeout.count()) + options_.connect_timeout_ms;
    if (redisSetTimeout(context_.get(), to_timeval(socket_ms)) != REDIS_OK) {
      std::cerr << "[redis] unable to extend read timeout\n";
      return nullptr;
    }
  }

  ReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(
      context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(), command_argv_len_.data())));

  if (override_timeout && context_ != nullptr && context_->err == REDIS_OK) {
    if (redisSetTimeout(context_.get(), to_timeval(options_.connect_timeout_ms)) != REDIS_OK) {
      std::cerr << "[redis] unable to restore read timeout\n";
      context_.reset();
    }
  }
  return reply;
}

}  // namespace agent_coord::sinks
