#include "emergency/fallback_chain.hpp"

#include "core/math.hpp"

namespace agent_coord::emergency {

ScoringResult score_with_fallback(const std::vector<ScoringStep>& chain, const ScoringInput& input,
                                  const float default_score) {
  for (const auto& step : chain) {
    if (step.available && !step.available()) {
      continue;
    }
    if (!step.score) {
      continue;
    }
    if (const auto score = step.score(input); score.has_value()) {
      return {core::clamp01(*score), step.name};
    }
  }
  return {core::clamp01(default_score), "default"};
}

std::optional<float> threshold_ratio_score(const ScoringInput& input) {
  if (input.threshold <= 0.0) {
    return std::nullopt;
  }
  return core::clamp01(static_cast<float>(input.value / (2.0 * input.threshold)));
}

}  // namespace agent_coord::emergency
