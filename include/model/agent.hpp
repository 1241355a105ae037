#pragma once

#include <cstdint>
#include <set>
#include <string>

#include "core/clock.hpp"

namespace agent_coord::model {

enum class agent_status : std::uint8_t {
    ACTIVE = 0,
    DEGRADED = 1,
    OFFLINE = 2,
};

struct agent_registration {
    std::string agent_id;
    std::set<std::string> capabilities;
    agent_status status{agent_status::ACTIVE};
    core::TimePoint last_heartbeat{};
};

struct status_transition {
    std::string agent_id;
    agent_status from;
    agent_status to;
    core::TimePoint at;
};

const char* to_string(agent_status value) noexcept;

}  // namespace agent_coord::model
