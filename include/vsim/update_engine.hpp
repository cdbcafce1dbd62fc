#pragma once
#include <span>

#include "vsim/agent.hpp"
#include "vsim/events.hpp"
#include "vsim/types.hpp"

namespace vsim {

struct UpdateParams {
  // Exponential drift of every axis toward neutral, per tick, scaled by
  // (1 - stability). Replaces a time-driven oscillation with a plain rate.
  float axis_decay_per_tick{0.0015f};

  // Confidence: decays toward neutral after being left untouched, rises when
  // movement reinforces the current lean.
  float neutral_confidence{0.5f};
  Tick  confidence_idle_ticks{60};
  float confidence_decay_per_tick{0.004f};
  float reinforce_gain{0.02f};       // per axis point moved with the lean
  float contradict_loss{0.01f};      // per axis point moved against the lean

  // Affect recovery toward baselines, per tick.
  float affect_recovery_per_tick{0.003f};
  float baseline_satisfaction{0.47f};
  float baseline_anxiety{0.31f};
  float baseline_anger{0.24f};
  float baseline_hope{0.51f};
  float affect_gain{0.05f};          // per unit intensity of a matching event

  // Volatility EMA over per-update movement (normalised by axis span).
  float volatility_alpha{0.2f};
  float volatility_scale{10.0f};

  // External analysis request rule.
  float analysis_volatility{0.35f};  // volatile at or above
  float analysis_confidence{0.25f};  // unconfident at or below
  Tick  analysis_refresh_ticks{1800};
};

struct UpdateOutcome {
  OpinionState  opinion{};
  BehaviorState behavior{};
  float moved{0.0f};          // total absolute axis movement this update
  bool  needs_analysis{false};
};

// Full update. Pure: reads only the arguments, returns the agent's new state.
// Every axis is clamped after each addition, never before.
UpdateOutcome apply_update(const OpinionState& opinion,
                           const BehaviorState& behavior,
                           const SocialSummary& social,
                           const Demographics& demographics,
                           std::span<const ActiveEvent> events,
                           Tick elapsed,
                           Tick now,
                           const UpdateParams& p);

inline UpdateOutcome apply_update(const Agent& a, std::span<const ActiveEvent> events,
                                  Tick now, const UpdateParams& p) {
  const Tick elapsed = (now > a.opinion.last_updated) ? now - a.opinion.last_updated : 0;
  return apply_update(a.opinion, a.behavior, a.social, a.demographics, events, elapsed, now, p);
}

// Cheap Dormant path: confidence and affect decay only; axes untouched.
UpdateOutcome apply_aging(const OpinionState& opinion,
                          const BehaviorState& behavior,
                          Tick elapsed,
                          Tick now,
                          const UpdateParams& p);

// Per-tick susceptibility factor of a single agent, in [0, 1].
float effective_susceptibility(const BehaviorState& b, const SocialSummary& s) noexcept;

} // namespace vsim
