#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/clock.hpp"

namespace agent_coord::model {

enum class emergency_type : std::uint8_t {
    FAILURE_RATE = 0,
    LATENCY = 1,
    DOWNTIME = 2,
    RESOURCE_EXHAUSTION = 3,
    RATE_LIMIT = 4,
};

inline constexpr std::size_t kEmergencyTypeCount = 5;

struct emergency_event {
    std::string id;
    emergency_type type{emergency_type::FAILURE_RATE};
    float severity{0.0F};
    double observed_value{0.0};
    double threshold{0.0};
    core::TimePoint detected_at{};
    std::uint64_t detected_wall_ms{0};
    core::TimePoint cooldown_until{};
    std::set<std::string> affected_agents;
};

const char* to_string(emergency_type value) noexcept;
std::optional<emergency_type> emergency_type_from_string(std::string_view value) noexcept;

nlohmann::json to_json(const emergency_event& event);

}  // namespace agent_coord::model
