#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "model/emergency.hpp"

namespace agent_coord::emergency {

struct ScoringInput {
  model::emergency_type type{model::emergency_type::FAILURE_RATE};
  double value{0.0};
  double threshold{0.0};
  std::size_t affected_agents{0};
};

struct ScoringStep {
  std::string name;
  std::function<bool()> available;
  std::function<std::optional<float>(const ScoringInput&)> score;
};

struct ScoringResult {
  float score{0.0F};
  std::string source;
};

// Walks the chain in order and takes the first available step that yields a
// score; falls back to `default_score` when none does.
ScoringResult score_with_fallback(const std::vector<ScoringStep>& chain, const ScoringInput& input,
                                  float default_score);

// clamp01(value / (2 * threshold)); no score when threshold <= 0.
std::optional<float> threshold_ratio_score(const ScoringInput& input);

}  // namespace agent_coord::emergency
