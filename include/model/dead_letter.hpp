#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "model/message.hpp"

namespace agent_coord::model {

// Wall-clock timestamps so entries stay meaningful across restarts.
struct dead_letter_entry {
    message original_message;
    std::string failure_reason;
    std::uint32_t retry_count{0};
    std::uint64_t first_failed_at_ms{0};
    std::uint64_t last_attempt_at_ms{0};
};

nlohmann::json to_json(const dead_letter_entry& entry);
dead_letter_entry dead_letter_from_json(const nlohmann::json& json);

}  // namespace agent_coord::model
