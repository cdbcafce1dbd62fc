#include "vsim/update_engine.hpp"

#include <algorithm>
#include <cmath>

#include "vsim/invariants.hpp"

namespace vsim {

namespace {

// x toward target by exp(-rate * ticks); exact for any elapsed count.
inline float decay_toward(float x, float target, float rate, Tick ticks) noexcept {
  if (ticks == 0 || rate <= 0.0f) return x;
  const float keep = std::exp(-rate * static_cast<float>(ticks));
  return target + (x - target) * keep;
}

inline float sign_of(float x) noexcept {
  return (x > 0.0f) ? 1.0f : ((x < 0.0f) ? -1.0f : 0.0f);
}

void age_confidence(OpinionState& o, Tick elapsed, const UpdateParams& p) noexcept {
  if (elapsed <= p.confidence_idle_ticks) return;
  const Tick idle = elapsed - p.confidence_idle_ticks;
  o.confidence = clamp_unit(decay_toward(o.confidence, p.neutral_confidence, p.confidence_decay_per_tick, idle));
}

void recover_affect(BehaviorState& b, Tick elapsed, const UpdateParams& p) noexcept {
  const float r = p.affect_recovery_per_tick;
  b.satisfaction = clamp_unit(decay_toward(b.satisfaction, p.baseline_satisfaction, r, elapsed));
  b.anxiety      = clamp_unit(decay_toward(b.anxiety, p.baseline_anxiety, r, elapsed));
  b.anger        = clamp_unit(decay_toward(b.anger, p.baseline_anger, r, elapsed));
  b.hope         = clamp_unit(decay_toward(b.hope, p.baseline_hope, r, elapsed));
}

} // namespace

float effective_susceptibility(const BehaviorState& b, const SocialSummary& s) noexcept {
  // Trait, social and openness components averaged; echo chambers damp it,
  // diverse exposure restores part of it.
  const float base = (b.susceptibility + s.susceptibility + b.openness) / 3.0f;
  const float damp = 1.0f - 0.5f * s.echo_chamber + 0.25f * s.diversity_exposure * s.echo_chamber;
  return clamp_unit(base * damp);
}

UpdateOutcome apply_update(const OpinionState& opinion,
                           const BehaviorState& behavior,
                           const SocialSummary& social,
                           const Demographics& demographics,
                           std::span<const ActiveEvent> events,
                           Tick elapsed,
                           Tick now,
                           const UpdateParams& p) {
  UpdateOutcome out{};
  out.opinion = opinion;
  out.behavior = behavior;
  OpinionState& o = out.opinion;
  BehaviorState& b = out.behavior;

  // Drift toward neutral; stable personalities drift slower.
  const float stability = clamp_unit((b.conscientiousness + (1.0f - b.neuroticism)) * 0.5f);
  const float drift_rate = p.axis_decay_per_tick * (1.0f - 0.7f * stability) * (1.0f - 0.3f * o.confidence);
  float moved = 0.0f;
  for (auto& v : o.axes) {
    const float before = v;
    v = clamp_axis(decay_toward(v, 0.0f, drift_rate, elapsed));
    moved += std::fabs(v - before);
  }

  const float susceptibility = effective_susceptibility(b, social);
  const float resistance = clamp_unit(b.change_resistance);

  bool touched = false;
  float reinforce = 0.0f;
  float contradict = 0.0f;

  for (const auto& ev : events) {
    if (!matches(ev.filter, demographics)) continue;
    // clamp passes NaN through; such an event would poison the axis
    if (!std::isfinite(ev.target) || !std::isfinite(ev.intensity)) continue;
    const float intensity = clamp_unit(ev.intensity);
    if (intensity <= 0.0f) continue;

    float& v = o.axes[axis_index(ev.axis)];
    const float target = clamp_axis(ev.target);
    const float step = (target - v) * intensity * susceptibility * (1.0f - resistance);
    const float before = v;
    v = clamp_axis(v + step);  // clamp after every addition
    const float delta = v - before;
    moved += std::fabs(delta);
    touched = true;

    const float lean = sign_of(before);
    if (lean != 0.0f && sign_of(delta) == lean) reinforce += std::fabs(delta);
    else if (lean != 0.0f && delta != 0.0f) contradict += std::fabs(delta);

    // Pull toward the voter's lean lifts satisfaction/hope, push away raises anger/anxiety.
    const float g = p.affect_gain * intensity;
    if (sign_of(target) == lean || lean == 0.0f) {
      b.satisfaction = clamp_unit(b.satisfaction + g);
      b.hope = clamp_unit(b.hope + 0.6f * g);
      b.anger = clamp_unit(b.anger - 0.4f * g);
    } else {
      b.satisfaction = clamp_unit(b.satisfaction - g);
      b.anger = clamp_unit(b.anger + 1.2f * g);
      b.anxiety = clamp_unit(b.anxiety + 0.7f * g);
    }
  }

  if (touched) {
    o.confidence = clamp_unit(o.confidence + p.reinforce_gain * reinforce - p.contradict_loss * contradict);
  } else {
    age_confidence(o, elapsed, p);
    recover_affect(b, elapsed, p);
  }

  const float span = kAxisMax - kAxisMin;
  const float sample = clamp_unit(moved / span * p.volatility_scale);
  o.volatility = clamp_unit((1.0f - p.volatility_alpha) * o.volatility + p.volatility_alpha * sample);
  o.last_updated = now;

  const bool stale_analysis = !o.analysed || (now - std::min(now, o.last_analysis)) >= p.analysis_refresh_ticks;
  const bool unsettled = o.volatility >= p.analysis_volatility || o.confidence <= p.analysis_confidence;
  out.needs_analysis = unsettled && stale_analysis;
  out.moved = moved;
  return out;
}

UpdateOutcome apply_aging(const OpinionState& opinion,
                          const BehaviorState& behavior,
                          Tick elapsed,
                          Tick now,
                          const UpdateParams& p) {
  UpdateOutcome out{};
  out.opinion = opinion;
  out.behavior = behavior;
  age_confidence(out.opinion, elapsed, p);
  recover_affect(out.behavior, elapsed, p);
  out.opinion.volatility = clamp_unit(out.opinion.volatility * std::exp(-p.volatility_alpha * static_cast<float>(elapsed) / 60.0f));
  out.opinion.last_updated = now;
  return out;
}

} // namespace vsim
