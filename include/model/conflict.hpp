#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/clock.hpp"

namespace agent_coord::model {

struct action_request {
    std::string source_id;
    std::string resource_id;
    std::string action;
    double priority_score{0.0};
    core::TimePoint requested_at{};
};

enum class request_outcome : std::uint8_t {
    WON = 0,
    LOST = 1,
};

struct competing_request {
    action_request request;
    request_outcome outcome{request_outcome::LOST};
};

struct conflict_record {
    std::string id;
    std::string resource_id;
    std::vector<competing_request> competing_requests;
    action_request resolution;
    core::TimePoint resolved_at{};
};

const char* to_string(request_outcome value) noexcept;

nlohmann::json to_json(const conflict_record& record);

}  // namespace agent_coord::model
