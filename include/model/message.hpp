#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/clock.hpp"

namespace agent_coord::model {

enum class priority : std::uint8_t {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    CRITICAL = 3,
};

inline constexpr std::string_view kBaselineContractVersion = "1.0";

// Unit of exchange on the bus and across the bridge.
// Immutable once published; the bus shares it between subscribers.
struct message {
    std::string id;
    std::string topic;
    nlohmann::json payload;
    model::priority priority{model::priority::NORMAL};
    std::string sender_id;
    core::TimePoint created_at{};
    std::uint64_t created_wall_ms{0};
    core::Millis ttl{0};
    std::string contract_version{kBaselineContractVersion};

    [[nodiscard]] bool expired_at(const core::TimePoint now) const noexcept {
        return now - created_at > ttl;
    }
};

using message_ptr = std::shared_ptr<const message>;

const char* to_string(model::priority value) noexcept;
std::optional<model::priority> priority_from_string(std::string_view value) noexcept;

// Wire form used by the bridge and the persistent store. The monotonic
// timestamp is not carried; created_wall_ms is.
nlohmann::json to_json(const message& msg);
message message_from_json(const nlohmann::json& json);

}  // namespace agent_coord::model
