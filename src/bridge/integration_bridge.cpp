#include "bridge/integration_bridge.hpp"

#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "bus/topics.hpp"

namespace agent_coord::bridge {
namespace {

constexpr const char* kInboundSender = "validator";

std::uint64_t seed_from(const std::optional<std::uint64_t>& seed) {
  return seed.has_value() ? *seed : std::random_device{}();
}

const char* bridge_status(const breaker_state state) {
  switch (state) {
    case breaker_state::CLOSED:
      return "healthy";
    case breaker_state::HALF_OPEN:
      return "degraded";
    case breaker_state::OPEN:
      return "failed";
  }
  return "failed";
}

}  // namespace

const char* to_string(const forward_outcome outcome) noexcept {
  switch (outcome) {
    case forward_outcome::DELIVERED:
      return "delivered";
    case forward_outcome::DEAD_LETTERED:
      return "dead_lettered";
    case forward_outcome::REJECTED_CONTRACT:
      return "rejected_contract";
    case forward_outcome::CIRCUIT_OPEN:
      return "circuit_open";
    case forward_outcome::CANCELLED:
      return "cancelled";
  }
  return "dead_lettered";
}

IntegrationBridge::IntegrationBridge(BridgeOptions options, ContractRegistry contracts, ValidatorClient& client,
                                     bus::MessageBus& bus, const core::Clock& clock, StateStore* store)
    : options_(std::move(options)),
      contracts_(std::move(contracts)),
      client_(client),
      bus_(bus),
      clock_(clock),
      store_(store),
      breaker_(options_.channel, options_.breaker, clock),
      retry_(options_.retry, seed_from(options_.retry_seed)),
      dead_letters_(store) {
  if (options_.call_timeout <= core::Millis{0}) {
    throw std::invalid_argument("bridge call timeout must be greater than 0");
  }
  std::ostringstream prefix;
  prefix << "brg-" << std::hex << clock.wall_ms() << '-';
  id_prefix_ = prefix.str();
}

void IntegrationBridge::restore() {
  if (store_ == nullptr) {
    return;
  }

  dead_letters_.load();
  if (const auto snapshot = store_->load_breaker(options_.channel); snapshot.has_value()) {
    breaker_.restore(*snapshot);
  }
  breaker_.set_listener([this](const BreakerSnapshot& snapshot) {
    if (!store_->save_breaker(snapshot)) {
      std::cerr << "[bridge] breaker state for " << snapshot.channel << " not persisted\n";
    }
  });
}

std::string IntegrationBridge::next_id(const char* prefix) const {
  return id_prefix_ + prefix + std::to_string(++next_id_);
}

model::message IntegrationBridge::make_message(const std::string& topic, nlohmann::json payload,
                                               const std::string& contract_version) const {
  model::message msg{};
  msg.id = next_id("out-");
  msg.topic = topic;
  msg.payload = std::move(payload);
  msg.priority = model::priority::HIGH;
  msg.sender_id = options_.bridge_id;
  msg.created_at = clock_.now();
  msg.created_wall_ms = clock_.wall_ms();
  msg.ttl = options_.call_timeout;
  if (!contract_version.empty()) {
    msg.contract_version = contract_version;
  }
  return msg;
}

ForwardResult IntegrationBridge::forward(model::message msg) {
  if (msg.id.empty()) {
    msg.id = next_id("out-");
  }
  if (msg.contract_version.empty()) {
    msg.contract_version = std::string(model::kBaselineContractVersion);
  }
  if (msg.created_wall_ms == 0) {
    msg.created_wall_ms = clock_.wall_ms();
  }

  const auto result = deliver(msg);
  if (result.outcome == forward_outcome::DELIVERED) {
    ++processed_;
  } else {
    ++failed_;
  }
  return result;
}

ForwardResult IntegrationBridge::deliver(const model::message& msg) {
  const auto validation = contracts_.validate(msg);
  if (!validation.ok) {
    ++contract_rejections_;
    const std::string reason = "contract: " + validation.reason;
    dead_letter(msg, reason, 0);
    return {forward_outcome::REJECTED_CONTRACT, 0, reason};
  }

  std::uint32_t attempts = 0;
  std::string last_reason;
  const std::uint32_t max_attempts = retry_.max_attempts();
  for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    if (cancelled_.load()) {
      dead_letter(msg, "cancelled", attempts);
      return {forward_outcome::CANCELLED, attempts, "cancelled"};
    }
    if (!breaker_.allow_request()) {
      if (attempts == 0) {
        ++fail_fast_;
      }
      dead_letter(msg, "circuit_open", attempts);
      return {forward_outcome::CIRCUIT_OPEN, attempts, "circuit_open"};
    }

    ++attempts;
    const auto status = client_.send(msg, options_.call_timeout);
    if (status == call_status::OK) {
      breaker_.record_success();
      return {forward_outcome::DELIVERED, attempts, {}};
    }

    breaker_.record_failure();
    last_reason = to_string(status);
    std::cerr << "[bridge] attempt " << attempt << "/" << max_attempts << " for " << msg.id
              << " failed: " << last_reason << '\n';

    if (attempt < max_attempts && !wait_backoff(retry_.delay_before(attempt + 1))) {
      dead_letter(msg, "cancelled", attempts);
      return {forward_outcome::CANCELLED, attempts, "cancelled"};
    }
  }

  const std::string reason = "retries_exhausted: " + last_reason;
  dead_letter(msg, reason, attempts);
  return {forward_outcome::DEAD_LETTERED, attempts, reason};
}

bool IntegrationBridge::wait_backoff(const core::Millis delay) {
  if (delay <= core::Millis{0}) {
    return !cancelled_.load();
  }
  backoff_ms_ += static_cast<std::uint64_t>(delay.count());
  std::unique_lock<std::mutex> lock(cancel_mutex_);
  return !cancel_cv_.wait_for(lock, delay, [this]() { return cancelled_.load(); });
}

void IntegrationBridge::dead_letter(const model::message& msg, const std::string& reason, const std::uint32_t attempts) {
  if (dead_letters_.add(msg, reason, attempts, clock_.wall_ms())) {
    ++dead_lettered_;
  }
}

void IntegrationBridge::cancel() {
  {
    std::lock_guard<std::mutex> lock(cancel_mutex_);
    cancelled_.store(true);
  }
  cancel_cv_.notify_all();
}

void IntegrationBridge::reset_cancel() {
  std::lock_guard<std::mutex> lock(cancel_mutex_);
  cancelled_.store(false);
}

std::size_t IntegrationBridge::poll_inbound() {
  std::size_t published = 0;
  for (std::size_t i = 0; i < options_.max_inbound_per_poll; ++i) {
    auto result = client_.receive(options_.poll_timeout);
    const bool ok = result.status == call_status::OK;
    if (ok != receive_healthy_) {
      receive_healthy_ = ok;
      std::cerr << (ok ? "[bridge] validator channel recovered\n" : "[bridge] validator channel unavailable\n");
    }
    if (!ok || !result.message.has_value()) {
      break;
    }

    auto& msg = *result.message;
    if (msg.id.empty()) {
      msg.id = next_id("in-");
    }
    if (msg.created_wall_ms == 0) {
      msg.created_wall_ms = clock_.wall_ms();
    }

    const auto validation = contracts_.validate(msg);
    if (!validation.ok) {
      ++contract_rejections_;
      dead_letter(msg, "inbound contract: " + validation.reason, 0);
      continue;
    }

    ++received_;
    bus_.publish(bus::topics::kDeploymentNotification, msg.payload, model::priority::HIGH, core::Millis{0},
                 kInboundSender, msg.contract_version);
    ++published;
  }
  return published;
}

ReplayReport IntegrationBridge::replay_dead_letters(const std::vector<std::string>& ids) {
  ReplayReport report{};
  const auto targets = ids.empty() ? dead_letters_.ids() : ids;

  for (const auto& id : targets) {
    const auto entry = dead_letters_.get(id);
    if (!entry.has_value()) {
      report.missing.push_back(id);
      continue;
    }

    ++report.attempted;
    const auto result = deliver(entry->original_message);
    if (result.outcome == forward_outcome::DELIVERED && dead_letters_.remove(id)) {
      ++replayed_;
      ++processed_;
      ++report.replayed;
    } else {
      ++report.failed;
    }
  }

  if (report.attempted > 0) {
    std::cerr << "[bridge] replay: " << report.replayed << " delivered, " << report.failed << " still failing\n";
  }
  return report;
}

bool IntegrationBridge::discard_dead_letter(const std::string& message_id, const std::string& note) {
  if (!dead_letters_.remove(message_id)) {
    return false;
  }
  ++discarded_;
  std::cerr << "[bridge] discarded dead letter " << message_id << (note.empty() ? "" : ": " + note) << '\n';
  return true;
}

std::vector<model::dead_letter_entry> IntegrationBridge::dead_letters(const std::size_t limit) const {
  return dead_letters_.list(limit);
}

BridgeCounters IntegrationBridge::counters() const {
  BridgeCounters out{};
  out.processed = processed_.load();
  out.failed = failed_.load();
  out.dead_lettered = dead_lettered_.load();
  out.fail_fast = fail_fast_.load();
  out.discarded = discarded_.load();
  out.replayed = replayed_.load();
  out.received = received_.load();
  out.contract_rejections = contract_rejections_.load();
  out.backoff_ms = backoff_ms_.load();
  return out;
}

nlohmann::json IntegrationBridge::health() const {
  const auto snapshot = breaker_.snapshot();
  const auto stats = counters();
  return nlohmann::json{{"bridge_id", options_.bridge_id},
                        {"channel", options_.channel},
                        {"client", client_.name()},
                        {"status", bridge_status(snapshot.state)},
                        {"circuit_breaker", to_json(snapshot)},
                        {"dead_letter_queue_size", dead_letters_.size()},
                        {"metrics",
                         {{"processed", stats.processed},
                          {"failed", stats.failed},
                          {"dead_lettered", stats.dead_lettered},
                          {"fail_fast", stats.fail_fast},
                          {"discarded", stats.discarded},
                          {"replayed", stats.replayed},
                          {"received", stats.received},
                          {"contract_rejections", stats.contract_rejections}}},
                        {"last_health_check", core::iso8601_utc(clock_.wall_ms())}};
}

}  // namespace agent_coord::bridge
