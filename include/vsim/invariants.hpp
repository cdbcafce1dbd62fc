#pragma once
#include <algorithm>
#include <cmath>

#include "vsim/agent.hpp"

namespace vsim {

inline constexpr float clamp_axis(float v) noexcept {
  return std::clamp(v, kAxisMin, kAxisMax);
}

inline constexpr float clamp_unit(float v) noexcept {
  return std::clamp(v, 0.0f, 1.0f);
}

inline bool in_unit(float v) noexcept {
  return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

inline bool opinion_in_bounds(const OpinionState& o) noexcept {
  for (const float a : o.axes) {
    if (!std::isfinite(a) || a < kAxisMin || a > kAxisMax) return false;
  }
  return in_unit(o.confidence) && in_unit(o.volatility);
}

inline bool behavior_in_bounds(const BehaviorState& b) noexcept {
  return in_unit(b.openness) && in_unit(b.conscientiousness) && in_unit(b.neuroticism) &&
         in_unit(b.change_resistance) && in_unit(b.susceptibility) &&
         in_unit(b.satisfaction) && in_unit(b.anxiety) && in_unit(b.anger) && in_unit(b.hope);
}

inline bool social_in_bounds(const SocialSummary& s) noexcept {
  return in_unit(s.influence) && in_unit(s.susceptibility) &&
         in_unit(s.echo_chamber) && in_unit(s.diversity_exposure);
}

inline bool agent_in_bounds(const Agent& a) noexcept {
  return opinion_in_bounds(a.opinion) && behavior_in_bounds(a.behavior) && social_in_bounds(a.social);
}

} // namespace vsim
