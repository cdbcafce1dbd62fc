#pragma once
#include <cstddef>
#include <span>
#include <vector>

#include "vsim/analysis_service.hpp"
#include "vsim/types.hpp"

namespace vsim {

// Quantisation of the bucket key. Coarser bins => bigger cohorts, fewer calls,
// less per-voter accuracy.
struct ClusterConfig {
  uint8_t age_bin{10};
  uint8_t income_bin{20};
  float   axis_bin{25.0f};
  float   satisfaction_bin{0.25f};
  std::size_t max_cohort{50};
};

struct ClusterCandidate {
  AgentId id{kInvalidAgent};
  Generation generation{0};
  AnalysisKind kind{AnalysisKind::General};
  FeatureSnapshot features{};
};

struct Cohort {
  CacheKey key{};
  AnalysisKind kind{AnalysisKind::General};
  AgentId representative{kInvalidAgent};
  FeatureSnapshot features{};               // the representative's snapshot
  std::vector<AgentId> members;             // arrival order
  std::vector<Generation> generations;      // parallel to members
  std::vector<FeatureSnapshot> member_features;
};

class SimilarityClusterer {
public:
  SimilarityClusterer() = default;
  explicit SimilarityClusterer(ClusterConfig cfg) : cfg_(cfg) {}

  const ClusterConfig& config() const noexcept { return cfg_; }

  // Deterministic fingerprint of the bucketed features plus the analysis kind.
  CacheKey bucket_key(const FeatureSnapshot& f, AnalysisKind kind) const noexcept;

  // Cohorts in order of first arrival of their key; oversized buckets split by
  // arrival order into chunks of max_cohort (chunks share the key).
  std::vector<Cohort> cluster(std::span<const ClusterCandidate> candidates) const;

private:
  void pick_representative_(Cohort& c) const;

  ClusterConfig cfg_{};
};

} // namespace vsim
