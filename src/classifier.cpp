#include "vsim/classifier.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>

#include "vsim/worker_pool.hpp"

namespace vsim {

RelevanceInputs RelevanceClassifier::inputs_for(const AgentStore& store, AgentId id, Tick now) noexcept {
  const Agent& a = store[id];
  const RelevanceState& r = store.relevance(id);
  const Position f = store.focus();

  RelevanceInputs in{};
  const float dx = a.demographics.position.x - f.x;
  const float dy = a.demographics.position.y - f.y;
  in.distance = std::sqrt(dx * dx + dy * dy);
  in.ticks_since_update = (now > a.opinion.last_updated) ? now - a.opinion.last_updated : 0;
  in.volatility = a.opinion.volatility;
  in.analysis_boost = r.analysis_boost;
  in.pinned = r.pinned;
  return in;
}

float RelevanceClassifier::score(const RelevanceInputs& in) const noexcept {
  const float max_d = std::max(cfg_.max_distance, 1e-3f);
  const float closeness = 1.0f - std::min(in.distance / max_d, 1.0f);

  const float half_life = std::max(cfg_.recency_half_life, 1.0f);
  const float recency = std::exp2(-static_cast<float>(in.ticks_since_update) / half_life);

  const float vol = std::clamp(in.volatility, 0.0f, 1.0f);
  const float boost = std::clamp(in.analysis_boost, 0.0f, 1.0f);

  return cfg_.w_distance * closeness + cfg_.w_recency * recency +
         cfg_.w_volatility * vol + cfg_.w_boost * boost;
}

Tier RelevanceClassifier::target_tier(const RelevanceInputs& in, float s) const noexcept {
  if (in.pinned) return Tier::High;
  if (s >= cfg_.high_threshold) return Tier::High;
  if (s >= cfg_.medium_threshold) return Tier::Medium;
  if (s >= cfg_.low_threshold) return Tier::Low;
  return Tier::Dormant;
}

Tier RelevanceClassifier::next_tier(Tier current, Tier target) noexcept {
  if (target > current) return step_up(current);
  if (target < current) return step_down(current);
  return current;
}

bool RelevanceClassifier::classify_one_(AgentStore& store, AgentId id, Tick now, int& step) const noexcept {
  step = 0;
  const RelevanceInputs in = inputs_for(store, id, now);
  if (!std::isfinite(in.distance) || !std::isfinite(in.volatility) || !std::isfinite(in.analysis_boost)) {
    return false;
  }

  RelevanceState& r = store.relevance_mut(id);
  const float s = score(in);
  const Tier next = next_tier(r.tier, target_tier(in, s));

  if (next > r.tier) step = 1;
  else if (next < r.tier) step = -1;

  r.tier = next;
  r.last_score = s;
  r.analysis_boost *= cfg_.boost_decay;
  return true;
}

ClassifyResult RelevanceClassifier::classify(AgentStore& store, Tick now, WorkerPool* pool) const {
  std::atomic<std::size_t> promotions{0};
  std::atomic<std::size_t> demotions{0};
  std::atomic<std::size_t> faults{0};

  // Each agent's tier depends only on its own record, so ranges are independent.
  auto run_range = [&](std::size_t begin, std::size_t end) {
    std::size_t up = 0, down = 0, bad = 0;
    for (std::size_t i = begin; i < end; ++i) {
      int step = 0;
      if (!classify_one_(store, static_cast<AgentId>(i), now, step)) {
        ++bad;
        continue;
      }
      if (step > 0) ++up;
      else if (step < 0) ++down;
    }
    promotions += up;
    demotions += down;
    faults += bad;
  };

  if (pool) pool->parallel_for(store.size(), run_range);
  else run_range(0, store.size());

  ClassifyResult res{};
  res.promotions = promotions.load();
  res.demotions = demotions.load();
  res.faults = faults.load();
  if (res.faults > 0) res.degradation = Degradation::ClassificationFault;
  return res;
}

} // namespace vsim
