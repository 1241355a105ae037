#include <chrono>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "bridge/circuit_breaker.hpp"
#include "bridge/dead_letter_queue.hpp"
#include "bridge/integration_bridge.hpp"
#include "bridge/message_contract.hpp"
#include "bridge/redis_validator_client.hpp"
#include "bridge/retry_policy.hpp"
#include "bridge/validator_client.hpp"
#include "bus/message_bus.hpp"
#include "bus/topics.hpp"
#include "core/clock.hpp"
#include "sinks/redis_connection.hpp"
#include "sinks/redis_state_store.hpp"

using agent_coord::bridge::BreakerOptions;
using agent_coord::bridge::BreakerSnapshot;
using agent_coord::bridge::BridgeOptions;
using agent_coord::bridge::call_status;
using agent_coord::bridge::CircuitBreaker;
using agent_coord::bridge::ContractRegistry;
using agent_coord::bridge::DeadLetterQueue;
using agent_coord::bridge::forward_outcome;
using agent_coord::bridge::IntegrationBridge;
using agent_coord::bridge::MessageContract;
using agent_coord::bridge::OfflineValidatorClient;
using agent_coord::bridge::ReceiveResult;
using agent_coord::bridge::RedisValidatorClient;
using agent_coord::bridge::RetryOptions;
using agent_coord::bridge::RetryPolicy;
using agent_coord::bridge::StateStore;
using agent_coord::bridge::ValidatorClient;
using agent_coord::bridge::breaker_state;
using agent_coord::bus::BusOptions;
using agent_coord::bus::MessageBus;
using agent_coord::core::ManualClock;
using agent_coord::core::Millis;
using agent_coord::model::dead_letter_entry;
using agent_coord::model::message;
using agent_coord::sinks::RedisConnection;
using agent_coord::sinks::RedisOptions;
using agent_coord::sinks::RedisStateStore;

namespace {

struct RedisMockState {
  std::map<std::string, std::map<std::string, std::string>> hashes{};
  std::map<std::string, std::string> strings{};
  std::map<std::string, std::deque<std::string>> lists{};
  std::vector<std::string> last_argv{};
  int command_argv_calls{0};
  int set_timeout_calls{0};
  bool fail_commands{false};
};

RedisMockState g_redis_mock{};

redisReply* mock_reply(const int type) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = type;
  return reply;
}

redisReply* mock_string_reply(const std::string& value, const int type = REDIS_REPLY_STRING) {
  auto* reply = mock_reply(type);
  reply->str = static_cast<char*>(std::malloc(value.size() + 1));
  std::memcpy(reply->str, value.c_str(), value.size() + 1);
  reply->len = value.size();
  return reply;
}

redisReply* mock_array_reply(const std::vector<std::string>& items) {
  auto* reply = mock_reply(REDIS_REPLY_ARRAY);
  reply->elements = items.size();
  reply->element = static_cast<redisReply**>(std::calloc(items.size() + 1, sizeof(redisReply*)));
  for (std::size_t i = 0; i < items.size(); ++i) {
    reply->element[i] = mock_string_reply(items[i]);
  }
  return reply;
}

redisReply* mock_integer_reply(const long long value) {
  auto* reply = mock_reply(REDIS_REPLY_INTEGER);
  reply->integer = value;
  return reply;
}

redisReply* execute_mock_command(const std::vector<std::string>& argv) {
  const std::string& verb = argv.front();
  if (verb == "LPUSH" && argv.size() == 3) {
    auto& list = g_redis_mock.lists[argv[1]];
    list.push_front(argv[2]);
    return mock_integer_reply(static_cast<long long>(list.size()));
  }
  if (verb == "BRPOP" && argv.size() == 3) {
    auto& list = g_redis_mock.lists[argv[1]];
    if (list.empty()) {
      return mock_reply(REDIS_REPLY_NIL);
    }
    const std::string value = list.back();
    list.pop_back();
    return mock_array_reply({argv[1], value});
  }
  if (verb == "HSET" && argv.size() == 4) {
    g_redis_mock.hashes[argv[1]][argv[2]] = argv[3];
    return mock_integer_reply(1);
  }
  if (verb == "HDEL" && argv.size() == 3) {
    return mock_integer_reply(static_cast<long long>(g_redis_mock.hashes[argv[1]].erase(argv[2])));
  }
  if (verb == "HGETALL" && argv.size() == 2) {
    std::vector<std::string> items;
    for (const auto& [field, value] : g_redis_mock.hashes[argv[1]]) {
      items.push_back(field);
      items.push_back(value);
    }
    return mock_array_reply(items);
  }
  if (verb == "SET" && argv.size() == 3) {
    g_redis_mock.strings[argv[1]] = argv[2];
    return mock_string_reply("OK", REDIS_REPLY_STATUS);
  }
  if (verb == "GET" && argv.size() == 2) {
    const auto it = g_redis_mock.strings.find(argv[1]);
    return it == g_redis_mock.strings.end() ? mock_reply(REDIS_REPLY_NIL) : mock_string_reply(it->second);
  }
  if (verb == "AUTH" || verb == "SELECT") {
    return mock_string_reply("OK", REDIS_REPLY_STATUS);
  }
  return mock_string_reply("ERR unknown command", REDIS_REPLY_ERROR);
}

}  // namespace

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

int redisSetTimeout(redisContext*, const struct timeval) {
  g_redis_mock.set_timeout_calls += 1;
  return REDIS_OK;
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t* argvlen) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i], argvlen[i]);
  }
  if (g_redis_mock.fail_commands) {
    return nullptr;
  }
  return execute_mock_command(g_redis_mock.last_argv);
}

void freeReplyObject(void* reply) {
  auto* r = static_cast<redisReply*>(reply);
  if (r == nullptr) {
    return;
  }
  for (std::size_t i = 0; i < r->elements; ++i) {
    freeReplyObject(r->element[i]);
  }
  std::free(r->element);
  std::free(r->str);
  std::free(r);
}

}  // extern "C"

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

void reset_redis_mock() { g_redis_mock = RedisMockState{}; }

BusOptions inline_bus() {
  BusOptions options{};
  options.worker_threads = 0;
  return options;
}

BridgeOptions fast_bridge() {
  BridgeOptions options{};
  options.call_timeout = Millis{50};
  options.poll_timeout = Millis{10};
  options.breaker = BreakerOptions{5, Millis{1000}, 1};
  options.retry = RetryOptions{3, Millis{1}, Millis{4}, 0.0};
  options.retry_seed = 7;
  return options;
}

nlohmann::json trigger_payload() {
  return nlohmann::json{{"trigger_type", "emergency"},
                        {"performance_data", {{"agents_active", 2}}},
                        {"timestamp", "2024-01-31T12:00:00.000Z"}};
}

message message_for(const std::string& id, const std::string& topic, nlohmann::json payload,
                    const std::string& version = "1.0") {
  message msg{};
  msg.id = id;
  msg.topic = topic;
  msg.payload = std::move(payload);
  msg.contract_version = version;
  return msg;
}

// Validator double: send results come from a script, then from `fallback`.
class ScriptedClient final : public ValidatorClient {
 public:
  call_status send(const message& msg, Millis) override {
    sent.push_back(msg.id);
    if (!script.empty()) {
      const auto status = script.front();
      script.pop_front();
      return status;
    }
    return fallback;
  }

  ReceiveResult receive(Millis) override {
    if (inbound.empty()) {
      return {call_status::OK, std::nullopt};
    }
    auto msg = inbound.front();
    inbound.pop_front();
    return {call_status::OK, std::move(msg)};
  }

  [[nodiscard]] std::string name() const override { return "scripted"; }

  std::deque<call_status> script{};
  call_status fallback{call_status::OK};
  std::vector<std::string> sent{};
  std::deque<message> inbound{};
};

class MemoryStore final : public StateStore {
 public:
  bool save_dead_letter(const dead_letter_entry& entry) override {
    entries[entry.original_message.id] = entry;
    return true;
  }
  bool erase_dead_letter(const std::string& message_id) override { return entries.erase(message_id) == 1; }
  std::optional<std::vector<dead_letter_entry>> load_dead_letters() override {
    std::vector<dead_letter_entry> out;
    for (const auto& [_, entry] : entries) {
      out.push_back(entry);
    }
    return out;
  }
  bool save_breaker(const BreakerSnapshot& snapshot) override {
    breaker = snapshot;
    return true;
  }
  std::optional<BreakerSnapshot> load_breaker(const std::string&) override { return breaker; }

  std::map<std::string, dead_letter_entry> entries{};
  std::optional<BreakerSnapshot> breaker{};
};

int test_contract_validation() {
  const auto contracts = ContractRegistry::with_defaults();

  if (!contracts.validate(message_for("m1", "improvement_trigger", trigger_payload())).ok) {
    return fail("test_contract_validation", "baseline trigger should validate");
  }

  auto with_conflicts = trigger_payload();
  with_conflicts["conflicts"] = nlohmann::json::array();
  if (!contracts.validate(message_for("m2", "improvement_trigger", with_conflicts, "1.1")).ok) {
    return fail("test_contract_validation", "1.1 trigger with conflicts should validate");
  }

  const auto* compatible = contracts.find_compatible("improvement_trigger", "1.0");
  if (compatible == nullptr || compatible->version != "1.0") {
    return fail("test_contract_validation", "smallest compatible minor should be chosen");
  }

  auto result = contracts.validate(message_for("m3", "improvement_trigger", trigger_payload(), "1.2"));
  if (result.ok || result.reason != "unsupported_version 1.2") {
    return fail("test_contract_validation", "newer minor should be unsupported");
  }
  result = contracts.validate(message_for("m4", "improvement_trigger", trigger_payload(), "2.0"));
  if (result.ok || result.reason != "unsupported_version 2.0") {
    return fail("test_contract_validation", "different major should be unsupported");
  }
  result = contracts.validate(message_for("m5", "telemetry", trigger_payload()));
  if (result.ok || result.reason != "unknown_topic telemetry") {
    return fail("test_contract_validation", "unknown topic should be reported");
  }

  auto missing = trigger_payload();
  missing.erase("timestamp");
  result = contracts.validate(message_for("m6", "improvement_trigger", missing));
  if (result.ok || result.reason != "missing_field timestamp") {
    return fail("test_contract_validation", "missing required field should be reported");
  }

  auto wrong_type = trigger_payload();
  wrong_type["affected_agents"] = "planner";
  result = contracts.validate(message_for("m7", "improvement_trigger", wrong_type));
  if (result.ok || result.reason != "invalid_type affected_agents (expected array)") {
    return fail("test_contract_validation", "optional field with wrong type should be rejected");
  }

  if (contracts.versions("improvement_trigger") != std::vector<std::string>{"1.0", "1.1"}) {
    return fail("test_contract_validation", "registered versions should be listed");
  }

  ContractRegistry custom;
  custom.add({"ping", "1.0", {}});
  bool threw = false;
  try {
    custom.add({"ping", "1.0", {}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_contract_validation", "duplicate contract should be rejected");
  }
  threw = false;
  try {
    custom.add({"ping", "one", {}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw || agent_coord::bridge::parse_contract_version("1.x").has_value()) {
    return fail("test_contract_validation", "malformed version should be rejected");
  }
  return 0;
}

int test_breaker_state_machine() {
  ManualClock clock;
  CircuitBreaker breaker{"validator", BreakerOptions{3, Millis{1000}, 2}, clock};

  for (int i = 0; i < 2; ++i) {
    breaker.record_failure();
  }
  if (breaker.state() != breaker_state::CLOSED || !breaker.allow_request()) {
    return fail("test_breaker_state_machine", "breaker should stay closed below the threshold");
  }
  breaker.record_failure();
  if (breaker.state() != breaker_state::OPEN || breaker.allow_request()) {
    return fail("test_breaker_state_machine", "threshold failures should open the breaker");
  }

  clock.advance(std::chrono::milliseconds(999));
  if (breaker.allow_request()) {
    return fail("test_breaker_state_machine", "breaker must stay open until the recovery timeout");
  }
  clock.advance(std::chrono::milliseconds(1));
  if (!breaker.allow_request() || breaker.state() != breaker_state::HALF_OPEN) {
    return fail("test_breaker_state_machine", "recovery timeout should move to half_open");
  }
  if (!breaker.allow_request() || breaker.allow_request()) {
    return fail("test_breaker_state_machine", "half_open should allow exactly the probe budget");
  }
  breaker.record_success();
  if (breaker.state() != breaker_state::HALF_OPEN) {
    return fail("test_breaker_state_machine", "one probe success is not enough to close");
  }
  breaker.record_success();
  if (breaker.state() != breaker_state::CLOSED || breaker.snapshot().consecutive_failures != 0) {
    return fail("test_breaker_state_machine", "full probe budget success should close");
  }

  for (int i = 0; i < 3; ++i) {
    breaker.record_failure();
  }
  clock.advance(std::chrono::milliseconds(1000));
  static_cast<void>(breaker.allow_request());
  breaker.record_failure();
  if (breaker.state() != breaker_state::OPEN || breaker.snapshot().times_opened != 3) {
    return fail("test_breaker_state_machine", "half_open failure should reopen");
  }

  bool threw = false;
  try {
    CircuitBreaker invalid{"x", BreakerOptions{0, Millis{1000}, 1}, clock};
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_breaker_state_machine", "zero failure threshold should be rejected");
  }
  return 0;
}

int test_breaker_listener_and_restore() {
  ManualClock clock;
  CircuitBreaker breaker{"validator", BreakerOptions{1, Millis{1000}, 1}, clock};

  std::vector<breaker_state> seen;
  breaker.set_listener([&seen](const BreakerSnapshot& snapshot) { seen.push_back(snapshot.state); });
  breaker.record_failure();
  if (seen.empty() || seen.back() != breaker_state::OPEN) {
    return fail("test_breaker_listener_and_restore", "listener should observe the open transition");
  }

  const auto persisted = agent_coord::bridge::breaker_snapshot_from_json(
      nlohmann::json::parse(agent_coord::bridge::to_json(breaker.snapshot()).dump()));
  if (persisted.state != breaker_state::OPEN || persisted.times_opened != 1 || persisted.channel != "validator") {
    return fail("test_breaker_listener_and_restore", "snapshot should survive serialization");
  }

  clock.advance(std::chrono::milliseconds(400));
  CircuitBreaker restored{"validator", BreakerOptions{1, Millis{1000}, 1}, clock};
  restored.restore(persisted);
  if (restored.allow_request()) {
    return fail("test_breaker_listener_and_restore", "restored breaker keeps the remaining open window");
  }
  clock.advance(std::chrono::milliseconds(600));
  if (!restored.allow_request()) {
    return fail("test_breaker_listener_and_restore", "elapsed downtime should count toward recovery");
  }
  return 0;
}

int test_retry_delays() {
  RetryPolicy exact{RetryOptions{5, Millis{1000}, Millis{60000}, 0.0}, 1};
  if (exact.nominal_delay(1) != Millis{0} || exact.nominal_delay(2) != Millis{1000} ||
      exact.nominal_delay(3) != Millis{2000} || exact.nominal_delay(4) != Millis{4000} ||
      exact.nominal_delay(10) != Millis{60000}) {
    return fail("test_retry_delays", "nominal delays should double and cap at max");
  }
  if (exact.delay_before(3) != Millis{2000}) {
    return fail("test_retry_delays", "zero jitter should return the nominal delay");
  }

  RetryPolicy jittered{RetryOptions{5, Millis{1000}, Millis{60000}, 0.2}, 42};
  for (int i = 0; i < 100; ++i) {
    const auto delay = jittered.delay_before(3);
    if (delay < Millis{1600} || delay > Millis{2400}) {
      return fail("test_retry_delays", "jitter must stay within the configured ratio");
    }
  }
  RetryPolicy capped{RetryOptions{5, Millis{1000}, Millis{1000}, 0.5}, 3};
  for (int i = 0; i < 50; ++i) {
    if (capped.delay_before(4) > Millis{1000}) {
      return fail("test_retry_delays", "jittered delay must never exceed max_delay");
    }
  }

  bool threw = false;
  try {
    RetryPolicy invalid{RetryOptions{3, Millis{5000}, Millis{1000}, 0.2}};
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_retry_delays", "max_delay below base_delay should be rejected");
  }
  return 0;
}

int test_dead_letter_queue_holds_each_message_once() {
  MemoryStore store;
  DeadLetterQueue queue{&store};
  const auto first = message_for("m-1", "improvement_trigger", trigger_payload());
  const auto second = message_for("m-2", "improvement_trigger", trigger_payload());

  if (!queue.add(first, "retries_exhausted: timeout", 3, 1000) || queue.add(first, "circuit_open", 2, 2000)) {
    return fail("test_dead_letter_queue_holds_each_message_once", "second add of an id should update in place");
  }
  queue.add(second, "circuit_open", 0, 1500);

  const auto entry = queue.get("m-1");
  if (queue.size() != 2 || !entry.has_value() || entry->retry_count != 5 || entry->failure_reason != "circuit_open" ||
      entry->first_failed_at_ms != 1000 || entry->last_attempt_at_ms != 2000) {
    return fail("test_dead_letter_queue_holds_each_message_once", "retry count should accumulate");
  }
  const auto listed = queue.list();
  if (listed.size() != 2 || listed.front().original_message.id != "m-1" || queue.list(1).size() != 1) {
    return fail("test_dead_letter_queue_holds_each_message_once", "list should be oldest first and limited");
  }

  if (!queue.remove("m-1") || queue.remove("m-1") || store.entries.count("m-1") != 0) {
    return fail("test_dead_letter_queue_holds_each_message_once", "remove should also erase the persisted entry");
  }

  DeadLetterQueue reloaded{&store};
  if (reloaded.load() != 1 || !reloaded.get("m-2").has_value()) {
    return fail("test_dead_letter_queue_holds_each_message_once", "persisted entries should reload");
  }
  return 0;
}

int test_forward_retries_then_delivers() {
  ManualClock clock;
  MessageBus bus{inline_bus(), clock};
  ScriptedClient client;
  IntegrationBridge bridge{fast_bridge(), ContractRegistry::with_defaults(), client, bus, clock};

  auto result = bridge.forward(bridge.make_message("improvement_trigger", trigger_payload()));
  if (result.outcome != forward_outcome::DELIVERED || result.attempts != 1) {
    return fail("test_forward_retries_then_delivers", "healthy channel should deliver on first attempt");
  }

  client.script = {call_status::TRANSIENT_FAILURE, call_status::TIMEOUT};
  result = bridge.forward(bridge.make_message("improvement_trigger", trigger_payload()));
  if (result.outcome != forward_outcome::DELIVERED || result.attempts != 3) {
    return fail("test_forward_retries_then_delivers", "third attempt should succeed");
  }

  client.fallback = call_status::TIMEOUT;
  auto failing = bridge.make_message("improvement_trigger", trigger_payload());
  const auto failing_id = failing.id;
  result = bridge.forward(std::move(failing));
  if (result.outcome != forward_outcome::DEAD_LETTERED || result.attempts != 3 ||
      result.reason != "retries_exhausted: timeout") {
    return fail("test_forward_retries_then_delivers", "exhausted retries should dead-letter");
  }

  const auto entries = bridge.dead_letters();
  if (entries.size() != 1 || entries.front().original_message.id != failing_id || entries.front().retry_count != 3) {
    return fail("test_forward_retries_then_delivers", "dead letter should keep the original message");
  }
  const auto counters = bridge.counters();
  if (counters.processed != 2 || counters.failed != 1 || counters.dead_lettered != 1 || counters.backoff_ms == 0) {
    return fail("test_forward_retries_then_delivers", "counters should track outcomes and back-off");
  }
  return 0;
}

int test_contract_rejection_never_reaches_channel() {
  ManualClock clock;
  MessageBus bus{inline_bus(), clock};
  ScriptedClient client;
  IntegrationBridge bridge{fast_bridge(), ContractRegistry::with_defaults(), client, bus, clock};

  auto payload = trigger_payload();
  payload.erase("timestamp");
  const auto result = bridge.forward(bridge.make_message("improvement_trigger", payload));
  if (result.outcome != forward_outcome::REJECTED_CONTRACT || !client.sent.empty()) {
    return fail("test_contract_rejection_never_reaches_channel", "invalid message must not be sent");
  }
  const auto entries = bridge.dead_letters();
  if (entries.size() != 1 || entries.front().failure_reason != "contract: missing_field timestamp" ||
      bridge.counters().contract_rejections != 1) {
    return fail("test_contract_rejection_never_reaches_channel", "rejection should be dead-lettered with reason");
  }
  return 0;
}

int test_open_breaker_fails_fast_and_replay_recovers() {
  ManualClock clock;
  MessageBus bus{inline_bus(), clock};
  ScriptedClient client;
  client.fallback = call_status::UNAVAILABLE;
  BridgeOptions options = fast_bridge();
  options.breaker = BreakerOptions{3, Millis{1000}, 1};
  IntegrationBridge bridge{options, ContractRegistry::with_defaults(), client, bus, clock};

  auto result = bridge.forward(bridge.make_message("improvement_trigger", trigger_payload()));
  if (result.outcome != forward_outcome::DEAD_LETTERED || bridge.breaker().state != breaker_state::OPEN) {
    return fail("test_open_breaker_fails_fast_and_replay_recovers", "failures should open the breaker");
  }
  if (bridge.health().at("status") != "failed") {
    return fail("test_open_breaker_fails_fast_and_replay_recovers", "open breaker should report failed");
  }

  const auto sent_before = client.sent.size();
  result = bridge.forward(bridge.make_message("improvement_trigger", trigger_payload()));
  if (result.outcome != forward_outcome::CIRCUIT_OPEN || result.attempts != 0 || client.sent.size() != sent_before) {
    return fail("test_open_breaker_fails_fast_and_replay_recovers", "open breaker should refuse without sending");
  }
  if (bridge.counters().fail_fast != 1 || bridge.dead_letter_depth() != 2) {
    return fail("test_open_breaker_fails_fast_and_replay_recovers", "refused message should be dead-lettered");
  }

  client.fallback = call_status::OK;
  clock.advance(std::chrono::milliseconds(1000));
  const auto report = bridge.replay_dead_letters();
  if (report.attempted != 2 || report.replayed != 2 || bridge.dead_letter_depth() != 0) {
    return fail("test_open_breaker_fails_fast_and_replay_recovers", "replay should drain the queue");
  }
  if (bridge.breaker().state != breaker_state::CLOSED || bridge.health().at("status") != "healthy") {
    return fail("test_open_breaker_fails_fast_and_replay_recovers", "successful probe should close the breaker");
  }
  if (bridge.counters().replayed != 2) {
    return fail("test_open_breaker_fails_fast_and_replay_recovers", "replayed counter should be updated");
  }
  return 0;
}

int test_failed_replay_keeps_single_entry() {
  ManualClock clock;
  MessageBus bus{inline_bus(), clock};
  ScriptedClient client;
  client.fallback = call_status::TRANSIENT_FAILURE;
  BridgeOptions options = fast_bridge();
  options.breaker = BreakerOptions{100, Millis{1000}, 1};
  IntegrationBridge bridge{options, ContractRegistry::with_defaults(), client, bus, clock};

  auto msg = bridge.make_message("improvement_trigger", trigger_payload());
  const auto id = msg.id;
  bridge.forward(std::move(msg));
  const auto report = bridge.replay_dead_letters({id, "missing-id"});

  if (report.failed != 1 || report.missing != std::vector<std::string>{"missing-id"}) {
    return fail("test_failed_replay_keeps_single_entry", "replay report should list failures and unknown ids");
  }
  const auto entries = bridge.dead_letters();
  if (entries.size() != 1 || entries.front().retry_count != 6) {
    return fail("test_failed_replay_keeps_single_entry", "failed replay should accumulate on the same entry");
  }

  if (!bridge.discard_dead_letter(id, "operator dropped") || bridge.discard_dead_letter(id) ||
      bridge.counters().discarded != 1 || bridge.dead_letter_depth() != 0) {
    return fail("test_failed_replay_keeps_single_entry", "discard should remove the entry exactly once");
  }
  return 0;
}

int test_cancel_interrupts_backoff() {
  ManualClock clock;
  MessageBus bus{inline_bus(), clock};
  ScriptedClient client;
  client.fallback = call_status::TIMEOUT;
  BridgeOptions options = fast_bridge();
  options.retry = RetryOptions{3, Millis{5000}, Millis{5000}, 0.0};
  IntegrationBridge bridge{options, ContractRegistry::with_defaults(), client, bus, clock};

  agent_coord::bridge::ForwardResult result{};
  const auto started = std::chrono::steady_clock::now();
  std::thread worker([&bridge, &result]() {
    result = bridge.forward(bridge.make_message("improvement_trigger", trigger_payload()));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  bridge.cancel();
  worker.join();
  const auto elapsed = std::chrono::steady_clock::now() - started;

  if (result.outcome != forward_outcome::CANCELLED || elapsed > std::chrono::seconds(2)) {
    return fail("test_cancel_interrupts_backoff", "cancel should end the back-off wait promptly");
  }
  const auto entries = bridge.dead_letters();
  if (entries.size() != 1 || entries.front().failure_reason != "cancelled") {
    return fail("test_cancel_interrupts_backoff", "cancelled message should be dead-lettered");
  }

  result = bridge.forward(bridge.make_message("improvement_trigger", trigger_payload()));
  if (result.outcome != forward_outcome::CANCELLED || result.attempts != 0) {
    return fail("test_cancel_interrupts_backoff", "forward after cancel should not touch the channel");
  }
  return 0;
}

int test_poll_inbound_publishes_valid_notifications() {
  ManualClock clock;
  MessageBus bus{inline_bus(), clock};
  ScriptedClient client;
  IntegrationBridge bridge{fast_bridge(), ContractRegistry::with_defaults(), client, bus, clock};

  std::vector<std::string> deployments;
  bus.subscribe(agent_coord::bus::topics::kDeploymentNotification, [&deployments](const message& msg) {
    deployments.push_back(msg.payload.at("deployment_id").get<std::string>());
  });

  client.inbound.push_back(message_for("", "deployment_notification",
                                       {{"deployment_id", "dep-7"},
                                        {"status", "deployed"},
                                        {"timestamp", "2024-01-31T12:00:00.000Z"},
                                        {"rollback_available", true}}));
  client.inbound.push_back(message_for("", "deployment_notification", {{"status", "deployed"}}));

  if (bridge.poll_inbound() != 1) {
    return fail("test_poll_inbound_publishes_valid_notifications", "one valid notification expected");
  }
  bus.dispatch_pending();
  if (deployments != std::vector<std::string>{"dep-7"}) {
    return fail("test_poll_inbound_publishes_valid_notifications", "notification should reach the bus");
  }
  const auto entries = bridge.dead_letters();
  if (entries.size() != 1 || entries.front().failure_reason.rfind("inbound contract: ", 0) != 0 ||
      entries.front().original_message.id.empty()) {
    return fail("test_poll_inbound_publishes_valid_notifications", "invalid inbound message should be dead-lettered");
  }
  if (bridge.counters().received != 1 || bridge.counters().contract_rejections != 1) {
    return fail("test_poll_inbound_publishes_valid_notifications", "inbound counters should be updated");
  }
  return 0;
}

int test_health_report_fields() {
  ManualClock clock;
  MessageBus bus{inline_bus(), clock};
  OfflineValidatorClient client;
  IntegrationBridge bridge{fast_bridge(), ContractRegistry::with_defaults(), client, bus, clock};

  bridge.forward(bridge.make_message("improvement_trigger", trigger_payload()));
  const auto health = bridge.health();
  if (health.at("bridge_id") != "supervisor_bridge" || health.at("client") != "offline" ||
      health.at("dead_letter_queue_size") != 1 || health.at("metrics").at("failed") != 1) {
    return fail("test_health_report_fields", "health should describe the bridge");
  }
  const auto checked = health.at("last_health_check").get<std::string>();
  if (checked.empty() || checked.back() != 'Z' || health.at("circuit_breaker").at("channel") != "validator") {
    return fail("test_health_report_fields", "health should carry breaker state and an ISO timestamp");
  }
  return 0;
}

int test_redis_state_survives_restart() {
  reset_redis_mock();
  ManualClock clock;
  MessageBus bus{inline_bus(), clock};
  RedisConnection connection{RedisOptions{}};
  RedisStateStore store{connection};
  OfflineValidatorClient client;
  BridgeOptions options = fast_bridge();
  options.breaker = BreakerOptions{3, Millis{1000}, 1};

  std::string id;
  {
    IntegrationBridge bridge{options, ContractRegistry::with_defaults(), client, bus, clock, &store};
    bridge.restore();
    auto msg = bridge.make_message("improvement_trigger", trigger_payload());
    id = msg.id;
    bridge.forward(std::move(msg));
  }

  if (g_redis_mock.hashes["coord:dlq"].count(id) != 1 || g_redis_mock.strings.count("coord:breaker:validator") != 1) {
    return fail("test_redis_state_survives_restart", "dead letter and breaker state should be persisted");
  }

  IntegrationBridge restarted{options, ContractRegistry::with_defaults(), client, bus, clock, &store};
  restarted.restore();
  const auto entries = restarted.dead_letters();
  if (entries.size() != 1 || entries.front().original_message.id != id ||
      entries.front().original_message.topic != "improvement_trigger" ||
      restarted.breaker().state != breaker_state::OPEN) {
    return fail("test_redis_state_survives_restart", "restart should restore queue and breaker");
  }

  g_redis_mock.hashes["coord:dlq"]["broken"] = "{not json";
  DeadLetterQueue tolerant{&store};
  if (tolerant.load() != 1) {
    return fail("test_redis_state_survives_restart", "unreadable entries should be skipped");
  }
  return 0;
}

int test_redis_store_reports_failures() {
  reset_redis_mock();
  RedisConnection connection{RedisOptions{}};
  RedisStateStore store{connection};

  g_redis_mock.fail_commands = true;
  dead_letter_entry entry{};
  entry.original_message = message_for("m-9", "improvement_trigger", trigger_payload());
  if (store.save_dead_letter(entry) || store.load_dead_letters().has_value() || store.errors() != 2) {
    return fail("test_redis_store_reports_failures", "failed commands should be reported and counted");
  }

  g_redis_mock.fail_commands = false;
  if (!store.save_dead_letter(entry) || store.errors() != 2) {
    return fail("test_redis_store_reports_failures", "store should recover once redis answers");
  }
  return 0;
}

int test_redis_validator_channel() {
  reset_redis_mock();
  RedisOptions redis_options{};
  redis_options.key_prefix = "test";
  RedisConnection connection{redis_options};
  RedisValidatorClient client{connection};

  const auto outgoing = message_for("out-1", "improvement_trigger", trigger_payload());
  if (client.send(outgoing, Millis{100}) != call_status::OK) {
    return fail("test_redis_validator_channel", "LPUSH should succeed");
  }
  const auto& inbox = g_redis_mock.lists["test:validator:inbox"];
  if (inbox.size() != 1 || nlohmann::json::parse(inbox.front()).at("id") != "out-1") {
    return fail("test_redis_validator_channel", "message should be pushed as JSON onto the inbox");
  }
  if (g_redis_mock.set_timeout_calls < 2) {
    return fail("test_redis_validator_channel", "bounded calls should set and restore the socket timeout");
  }

  auto empty = client.receive(Millis{10});
  if (empty.status != call_status::OK || empty.message.has_value() || g_redis_mock.last_argv.at(2) != "0.010") {
    return fail("test_redis_validator_channel", "empty outbox should time out quietly");
  }

  auto& outbox = g_redis_mock.lists["test:validator:outbox"];
  outbox.push_front(nlohmann::json{{"topic", "deployment_notification"},
                                   {"payload", {{"deployment_id", "d"}}},
                                   {"contract_version", "1.0"}}
                        .dump());
  outbox.push_front("not json");

  auto received = client.receive(Millis{10});
  if (!received.message.has_value() || received.message->topic != "deployment_notification" ||
      received.message->payload.at("deployment_id") != "d") {
    return fail("test_redis_validator_channel", "response should be decoded");
  }
  received = client.receive(Millis{10});
  if (!received.message.has_value() || received.message->contract_version != "0.0" ||
      received.message->payload.at("raw") != "not json") {
    return fail("test_redis_validator_channel", "unreadable response should be quarantined");
  }

  g_redis_mock.fail_commands = true;
  if (client.send(outgoing, Millis{100}) != call_status::UNAVAILABLE ||
      client.receive(Millis{10}).status != call_status::UNAVAILABLE) {
    return fail("test_redis_validator_channel", "unreachable redis should report unavailable");
  }
  g_redis_mock.fail_commands = false;
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_contract_validation(); rc != 0) return rc;
  if (int rc = test_breaker_state_machine(); rc != 0) return rc;
  if (int rc = test_breaker_listener_and_restore(); rc != 0) return rc;
  if (int rc = test_retry_delays(); rc != 0) return rc;
  if (int rc = test_dead_letter_queue_holds_each_message_once(); rc != 0) return rc;
  if (int rc = test_forward_retries_then_delivers(); rc != 0) return rc;
  if (int rc = test_contract_rejection_never_reaches_channel(); rc != 0) return rc;
  if (int rc = test_open_breaker_fails_fast_and_replay_recovers(); rc != 0) return rc;
  if (int rc = test_failed_replay_keeps_single_entry(); rc != 0) return rc;
  if (int rc = test_cancel_interrupts_backoff(); rc != 0) return rc;
  if (int rc = test_poll_inbound_publishes_valid_notifications(); rc != 0) return rc;
  if (int rc = test_health_report_fields(); rc != 0) return rc;
  if (int rc = test_redis_state_survives_restart(); rc != 0) return rc;
  if (int rc = test_redis_store_reports_failures(); rc != 0) return rc;
  if (int rc = test_redis_validator_channel(); rc != 0) return rc;

  std::cout << "[PASS] bridge unit tests\n";
  return 0;
}
