#include "bus/message_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace agent_coord::bus {
namespace {

std::size_t band_of(const model::priority priority) {
  return static_cast<std::size_t>(priority);
}

std::string make_id_prefix(const std::uint64_t wall_ms) {
  std::ostringstream out;
  out << "msg-" << std::hex << wall_ms << '-';
  return out.str();
}

}  // namespace

MessageBus::MessageBus(BusOptions options, const core::Clock& clock)
    : options_(std::move(options)),
      clock_(clock),
      id_prefix_(make_id_prefix(clock.wall_ms())),
      pool_(options_.worker_threads) {
  if (options_.queue_capacity == 0) {
    throw std::invalid_argument("bus queue capacity must be greater than 0");
  }
  if (options_.default_ttl <= core::Millis{0}) {
    throw std::invalid_argument("bus default ttl must be greater than 0");
  }
}

MessageBus::~MessageBus() { stop(); }

std::string MessageBus::publish(const std::string& topic, nlohmann::json payload, const model::priority priority,
                                const core::Millis ttl, const std::string& sender_id,
                                const std::string& contract_version) {
  model::message msg{};
  msg.topic = topic;
  msg.payload = std::move(payload);
  msg.priority = priority;
  msg.ttl = ttl;
  msg.sender_id = sender_id;
  msg.contract_version = contract_version;
  return publish(std::move(msg));
}

std::string MessageBus::publish(model::message msg) {
  if (msg.topic.empty()) {
    throw std::invalid_argument("message topic must not be empty");
  }

  if (msg.id.empty()) {
    msg.id = id_prefix_ + std::to_string(++next_message_id_);
  }
  msg.created_at = clock_.now();
  if (msg.created_wall_ms == 0) {
    msg.created_wall_ms = clock_.wall_ms();
  }
  if (msg.ttl <= core::Millis{0}) {
    msg.ttl = options_.default_ttl;
  }
  if (msg.contract_version.empty()) {
    msg.contract_version = std::string(model::kBaselineContractVersion);
  }

  auto shared = std::make_shared<const model::message>(std::move(msg));
  std::string id = shared->id;
  const bool queued = enqueue(std::move(shared));
  ++published_;
  if (!queued) {
    return {};
  }
  queue_cv_.notify_one();
  return id;
}

bool MessageBus::enqueue(model::message_ptr msg) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  auto& queue = queues_[msg->topic];

  if (queue.size >= options_.queue_capacity) {
    if (!evict_for(queue, msg->priority)) {
      ++backpressure_drops_;
      return false;
    }
    ++backpressure_drops_;
    if (!queue.saturated) {
      queue.saturated = true;
      std::cerr << "[bus] topic " << msg->topic << " queue full; dropping lowest-priority messages\n";
    }
  }

  queue.bands[band_of(msg->priority)].push_back(std::move(msg));
  ++queue.size;
  return true;
}

bool MessageBus::evict_for(TopicQueue& queue, const model::priority incoming) {
  for (std::size_t band = 0; band < kBandCount; ++band) {
    auto& entries = queue.bands[band];
    if (entries.empty()) {
      continue;
    }
    // Nothing pending ranks below the newcomer: drop it instead.
    if (band > band_of(incoming)) {
      return false;
    }
    entries.pop_front();
    --queue.size;
    return true;
  }
  return false;
}

SubscriptionId MessageBus::subscribe(const std::string& topic, Handler handler, const std::string& subscriber_name) {
  if (topic.empty()) {
    throw std::invalid_argument("subscription topic must not be empty");
  }
  if (!handler) {
    throw std::invalid_argument("subscription handler must be callable");
  }

  auto subscription = std::make_shared<Subscription>();
  subscription->id = ++next_subscription_id_;
  subscription->topic = topic;
  subscription->name = subscriber_name.empty() ? "sub-" + std::to_string(subscription->id) : subscriber_name;
  subscription->handler = std::move(handler);

  std::unique_lock<std::shared_mutex> lock(subscriptions_mutex_);
  subscriptions_.emplace(subscription->id, subscription);
  topic_subscribers_[topic].push_back(subscription->id);
  return subscription->id;
}

bool MessageBus::unsubscribe(const SubscriptionId id) {
  std::unique_lock<std::shared_mutex> lock(subscriptions_mutex_);
  const auto it = subscriptions_.find(id);
  if (it == subscriptions_.end()) {
    return false;
  }

  it->second->active = false;
  auto& ids = topic_subscribers_[it->second->topic];
  ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
  subscriptions_.erase(it);
  return true;
}

std::vector<model::message_ptr> MessageBus::pop_round() {
  std::vector<model::message_ptr> round;
  std::lock_guard<std::mutex> lock(queue_mutex_);
  for (auto& [topic, queue] : queues_) {
    if (queue.size == 0) {
      continue;
    }
    for (std::size_t band = kBandCount; band-- > 0;) {
      auto& entries = queue.bands[band];
      if (!entries.empty()) {
        round.push_back(std::move(entries.front()));
        entries.pop_front();
        --queue.size;
        break;
      }
    }
    if (queue.saturated && queue.size < options_.queue_capacity) {
      queue.saturated = false;
    }
  }
  return round;
}

std::vector<std::shared_ptr<MessageBus::Subscription>> MessageBus::subscribers_of(const std::string& topic) const {
  std::vector<std::shared_ptr<Subscription>> out;
  std::shared_lock<std::shared_mutex> lock(subscriptions_mutex_);
  const auto ids_it = topic_subscribers_.find(topic);
  if (ids_it == topic_subscribers_.end()) {
    return out;
  }
  out.reserve(ids_it->second.size());
  for (const auto id : ids_it->second) {
    const auto it = subscriptions_.find(id);
    if (it != subscriptions_.end()) {
      out.push_back(it->second);
    }
  }
  return out;
}

std::size_t MessageBus::dispatch_pending() {
  std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
  std::size_t invocations = 0;

  for (auto round = pop_round(); !round.empty(); round = pop_round()) {
    for (const auto& msg : round) {
      if (msg->expired_at(clock_.now())) {
        ++expired_drops_;
        continue;
      }
      invocations += deliver(msg);
      remember(msg);
    }
  }

  return invocations;
}

std::size_t MessageBus::deliver(const model::message_ptr& msg) {
  const auto subscribers = subscribers_of(msg->topic);
  if (subscribers.empty()) {
    return 0;
  }

  std::vector<std::function<void()>> tasks;
  tasks.reserve(subscribers.size());
  for (const auto& subscription : subscribers) {
    tasks.emplace_back([this, subscription, msg]() { invoke(subscription, *msg); });
  }
  pool_.run_all(std::move(tasks));
  return subscribers.size();
}

void MessageBus::invoke(const std::shared_ptr<Subscription>& subscription, const model::message& msg) {
  if (!subscription->active.load()) {
    return;
  }
  if (msg.expired_at(clock_.now())) {
    ++expired_drops_;
    return;
  }

  try {
    subscription->handler(msg);
    ++delivered_;
  } catch (const std::exception& ex) {
    ++subscription->failures;
    ++handler_failures_;
    std::cerr << "[bus] handler " << subscription->name << " failed on " << msg.topic << " message " << msg.id
              << ": " << ex.what() << '\n';
  } catch (...) {
    ++subscription->failures;
    ++handler_failures_;
    std::cerr << "[bus] handler " << subscription->name << " failed on " << msg.topic << " message " << msg.id
              << ": unknown exception\n";
  }
}

void MessageBus::remember(const model::message_ptr& msg) {
  if (options_.history_limit == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(history_mutex_);
  history_.push_back(msg);
  while (history_.size() > options_.history_limit) {
    history_.pop_front();
  }
}

void MessageBus::start() {
  if (running_.exchange(true)) {
    std::cerr << "[bus] already running\n";
    return;
  }
  dispatcher_ = std::thread([this]() { dispatcher_loop(); });
}

void MessageBus::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  queue_cv_.notify_all();
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
  dispatch_pending();
}

void MessageBus::dispatcher_loop() {
  while (running_.load()) {
    if (dispatch_pending() > 0) {
      continue;
    }

    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, options_.idle_wait, [this]() {
      if (!running_.load()) {
        return true;
      }
      return std::any_of(queues_.begin(), queues_.end(), [](const auto& entry) { return entry.second.size > 0; });
    });
  }
}

BusStats MessageBus::stats() const {
  BusStats out{};
  out.published = published_.load();
  out.delivered = delivered_.load();
  out.expired_drops = expired_drops_.load();
  out.backpressure_drops = backpressure_drops_.load();
  out.handler_failures = handler_failures_.load();
  return out;
}

std::uint64_t MessageBus::subscriber_failures(const SubscriptionId id) const {
  std::shared_lock<std::shared_mutex> lock(subscriptions_mutex_);
  const auto it = subscriptions_.find(id);
  return it == subscriptions_.end() ? 0 : it->second->failures.load();
}

std::size_t MessageBus::pending(const std::string& topic) const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  const auto it = queues_.find(topic);
  return it == queues_.end() ? 0 : it->second.size;
}

std::size_t MessageBus::subscriber_count(const std::string& topic) const {
  std::shared_lock<std::shared_mutex> lock(subscriptions_mutex_);
  const auto it = topic_subscribers_.find(topic);
  return it == topic_subscribers_.end() ? 0 : it->second.size();
}

std::vector<model::message_ptr> MessageBus::history(const std::string& topic, const std::string& sender_id,
                                                    const std::size_t limit) const {
  std::vector<model::message_ptr> out;
  std::lock_guard<std::mutex> lock(history_mutex_);
  for (auto it = history_.rbegin(); it != history_.rend() && out.size() < limit; ++it) {
    const auto& msg = *it;
    if (!topic.empty() && msg->topic != topic) {
      continue;
    }
    if (!sender_id.empty() && msg->sender_id != sender_id) {
      continue;
    }
    out.push_back(msg);
  }
  std::reverse(out.begin(), out.end());
  return out;
}

}  // namespace agent_coord::bus
