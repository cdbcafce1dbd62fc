#include "vsim/clusterer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

#include "vsim/rng.hpp"

namespace vsim {

namespace {

inline int64_t bin(float v, float width) noexcept {
  if (width <= 0.0f || !std::isfinite(v)) return 0;
  return static_cast<int64_t>(std::floor(v / width));
}

inline float sq(float x) noexcept { return x * x; }

// Normalised feature distance used for the representative choice.
float feature_distance2(const FeatureSnapshot& f, const std::array<float, 6>& c) noexcept {
  return sq(static_cast<float>(f.age) / 100.0f - c[0]) +
         sq(static_cast<float>(f.education) / 5.0f - c[1]) +
         sq(static_cast<float>(f.income) / 100.0f - c[2]) +
         sq(f.axes[0] / 100.0f - c[3]) +
         sq(f.axes[1] / 100.0f - c[4]) +
         sq(f.satisfaction - c[5]);
}

} // namespace

CacheKey SimilarityClusterer::bucket_key(const FeatureSnapshot& f, AnalysisKind kind) const noexcept {
  uint64_t h = static_cast<uint64_t>(kind) + 1;
  h = mix64(h, static_cast<uint64_t>(cfg_.age_bin ? f.age / cfg_.age_bin : f.age));
  h = mix64(h, static_cast<uint64_t>(f.education));
  h = mix64(h, static_cast<uint64_t>(cfg_.income_bin ? f.income / cfg_.income_bin : f.income));
  h = mix64(h, static_cast<uint64_t>(bin(f.axes[axis_index(Axis::Economic)], cfg_.axis_bin)));
  h = mix64(h, static_cast<uint64_t>(bin(f.axes[axis_index(Axis::Social)], cfg_.axis_bin)));
  h = mix64(h, static_cast<uint64_t>(bin(f.satisfaction, cfg_.satisfaction_bin)));
  return h;
}

void SimilarityClusterer::pick_representative_(Cohort& c) const {
  std::array<float, 6> centroid{};
  for (const auto& f : c.member_features) {
    centroid[0] += static_cast<float>(f.age) / 100.0f;
    centroid[1] += static_cast<float>(f.education) / 5.0f;
    centroid[2] += static_cast<float>(f.income) / 100.0f;
    centroid[3] += f.axes[0] / 100.0f;
    centroid[4] += f.axes[1] / 100.0f;
    centroid[5] += f.satisfaction;
  }
  const float n = static_cast<float>(c.member_features.size());
  for (auto& x : centroid) x /= n;

  float best = std::numeric_limits<float>::infinity();
  std::size_t best_i = 0;
  for (std::size_t i = 0; i < c.members.size(); ++i) {
    const float d = feature_distance2(c.member_features[i], centroid);
    if (d < best || (d == best && c.members[i] < c.members[best_i])) {
      best = d;
      best_i = i;
    }
  }
  c.representative = c.members[best_i];
  c.features = c.member_features[best_i];
}

std::vector<Cohort> SimilarityClusterer::cluster(std::span<const ClusterCandidate> candidates) const {
  std::vector<Cohort> out;
  const std::size_t cap = std::max<std::size_t>(1, cfg_.max_cohort);

  // key -> index of the cohort currently being filled for that key
  std::unordered_map<CacheKey, std::size_t> open;
  open.reserve(candidates.size());

  for (const auto& cand : candidates) {
    const CacheKey key = bucket_key(cand.features, cand.kind);
    auto it = open.find(key);
    if (it == open.end() || out[it->second].members.size() >= cap) {
      Cohort c{};
      c.key = key;
      c.kind = cand.kind;
      out.push_back(std::move(c));
      open[key] = out.size() - 1;
      it = open.find(key);
    }
    Cohort& c = out[it->second];
    c.members.push_back(cand.id);
    c.generations.push_back(cand.generation);
    c.member_features.push_back(cand.features);
  }

  for (auto& c : out) pick_representative_(c);
  return out;
}

} // namespace vsim
