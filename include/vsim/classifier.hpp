#pragma once
#include <cstddef>

#include "vsim/agent_store.hpp"
#include "vsim/types.hpp"

namespace vsim {

class WorkerPool;

// Scoring weights and tier thresholds. None of these come from a documented
// formula; they are tuning knobs.
struct ClassifierConfig {
  float w_distance{0.45f};
  float w_recency{0.20f};
  float w_volatility{0.35f};
  float w_boost{0.25f};

  float max_distance{500.0f};        // closeness is 0 at or beyond this
  float recency_half_life{120.0f};   // ticks

  float low_threshold{0.15f};        // below => Dormant
  float medium_threshold{0.40f};
  float high_threshold{0.70f};

  float boost_decay{0.8f};           // analysis_boost multiplier per pass
};

struct RelevanceInputs {
  float distance{0.0f};
  Tick  ticks_since_update{0};
  float volatility{0.0f};
  float analysis_boost{0.0f};
  bool  pinned{false};
};

struct ClassifyResult {
  std::size_t promotions{0};
  std::size_t demotions{0};
  std::size_t faults{0};
  Degradation degradation{Degradation::None};
};

class RelevanceClassifier {
public:
  RelevanceClassifier() = default;
  explicit RelevanceClassifier(ClassifierConfig cfg) : cfg_(cfg) {}

  const ClassifierConfig& config() const noexcept { return cfg_; }
  ClassifierConfig& config_mut() noexcept { return cfg_; }

  static RelevanceInputs inputs_for(const AgentStore& store, AgentId id, Tick now) noexcept;

  // Weighted sum in [0, w_distance + w_recency + w_volatility + w_boost].
  float score(const RelevanceInputs& in) const noexcept;

  // Tier the score maps to, ignoring the one-step rule. Pinned => High.
  Tier target_tier(const RelevanceInputs& in, float score) const noexcept;

  // One tier step toward target per pass.
  static Tier next_tier(Tier current, Tier target) noexcept;

  // One classification pass over the whole population. Agents with non-finite
  // inputs keep their tier and are counted as faults.
  ClassifyResult classify(AgentStore& store, Tick now, WorkerPool* pool = nullptr) const;

private:
  bool classify_one_(AgentStore& store, AgentId id, Tick now, int& step) const noexcept;

  ClassifierConfig cfg_{};
};

} // namespace vsim
