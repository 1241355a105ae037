#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "bus/worker_pool.hpp"
#include "core/clock.hpp"
#include "model/message.hpp"

namespace agent_coord::bus {

struct BusOptions {
  std::size_t queue_capacity{1024};
  std::size_t worker_threads{4};
  core::Millis default_ttl{30000};
  std::size_t history_limit{1000};
  core::Millis idle_wait{50};
};

struct BusStats {
  std::uint64_t published{0};
  std::uint64_t delivered{0};
  std::uint64_t expired_drops{0};
  std::uint64_t backpressure_drops{0};
  std::uint64_t handler_failures{0};
};

using Handler = std::function<void(const model::message&)>;
using SubscriptionId = std::uint64_t;

// In-process publish/subscribe hub.
//
// Each topic owns a bounded queue ordered by priority, then by insertion.
// Publishing never blocks: a full queue evicts its lowest-priority entry,
// or refuses the newcomer when everything pending outranks it.
// Every subscriber of a message runs concurrently on the worker pool, and a
// topic's next message is dispatched only after all of them returned.
class MessageBus {
 public:
  MessageBus(BusOptions options, const core::Clock& clock);
  ~MessageBus();

  MessageBus(const MessageBus&) = delete;
  MessageBus& operator=(const MessageBus&) = delete;

  // Returns the message id, or an empty string when backpressure refused it.
  std::string publish(const std::string& topic, nlohmann::json payload,
                      model::priority priority = model::priority::NORMAL, core::Millis ttl = core::Millis{0},
                      const std::string& sender_id = {}, const std::string& contract_version = {});

  // Publishes a prepared message. Missing id, timestamps and ttl are filled in.
  std::string publish(model::message msg);

  SubscriptionId subscribe(const std::string& topic, Handler handler, const std::string& subscriber_name = {});
  bool unsubscribe(SubscriptionId id);

  // Drains every topic on the calling thread. Returns the number of
  // handler invocations performed.
  std::size_t dispatch_pending();

  void start();
  void stop();
  [[nodiscard]] bool running() const noexcept { return running_.load(); }

  [[nodiscard]] BusStats stats() const;
  [[nodiscard]] std::uint64_t subscriber_failures(SubscriptionId id) const;
  [[nodiscard]] std::size_t pending(const std::string& topic) const;
  [[nodiscard]] std::size_t subscriber_count(const std::string& topic) const;
  [[nodiscard]] std::vector<model::message_ptr> history(const std::string& topic = {}, const std::string& sender_id = {},
                                                        std::size_t limit = 100) const;

 private:
  static constexpr std::size_t kBandCount = 4;

  struct Subscription {
    SubscriptionId id;
    std::string topic;
    std::string name;
    Handler handler;
    std::atomic<bool> active{true};
    std::atomic<std::uint64_t> failures{0};
  };

  struct TopicQueue {
    std::array<std::deque<model::message_ptr>, kBandCount> bands{};
    std::size_t size{0};
    bool saturated{false};
  };

  bool enqueue(model::message_ptr msg);
  bool evict_for(TopicQueue& queue, model::priority incoming);
  std::vector<model::message_ptr> pop_round();
  std::vector<std::shared_ptr<Subscription>> subscribers_of(const std::string& topic) const;
  std::size_t deliver(const model::message_ptr& msg);
  void invoke(const std::shared_ptr<Subscription>& subscription, const model::message& msg);
  void remember(const model::message_ptr& msg);
  void dispatcher_loop();

  BusOptions options_;
  const core::Clock& clock_;
  std::string id_prefix_;
  std::atomic<std::uint64_t> next_message_id_{0};
  std::atomic<SubscriptionId> next_subscription_id_{0};

  mutable std::mutex queue_mutex_{};
  std::unordered_map<std::string, TopicQueue> queues_{};
  std::condition_variable queue_cv_{};

  mutable std::shared_mutex subscriptions_mutex_{};
  std::unordered_map<SubscriptionId, std::shared_ptr<Subscription>> subscriptions_{};
  std::unordered_map<std::string, std::vector<SubscriptionId>> topic_subscribers_{};

  mutable std::mutex history_mutex_{};
  std::deque<model::message_ptr> history_{};

  std::mutex dispatch_mutex_{};
  WorkerPool pool_;
  std::atomic<bool> running_{false};
  std::thread dispatcher_{};

  std::atomic<std::uint64_t> published_{0};
  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> expired_drops_{0};
  std::atomic<std::uint64_t> backpressure_drops_{0};
  std::atomic<std::uint64_t> handler_failures_{0};
};

}  // namespace agent_coord::bus
