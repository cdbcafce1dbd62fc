#pragma once
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vsim/agent.hpp"
#include "vsim/types.hpp"

namespace vsim {

// What the external service sees of an agent (or a cohort representative).
struct FeatureSnapshot {
  uint8_t    age{40};
  uint8_t    education{3};
  uint8_t    income{50};
  bool       urban{false};
  AxisValues axes{};
  float      confidence{0.5f};
  float      volatility{0.0f};
  float      satisfaction{0.5f};
};

inline FeatureSnapshot snapshot_of(const Agent& a) noexcept {
  FeatureSnapshot f{};
  f.age = a.demographics.age;
  f.education = a.demographics.education;
  f.income = a.demographics.income;
  f.urban = a.demographics.urban;
  f.axes = a.opinion.axes;
  f.confidence = a.opinion.confidence;
  f.volatility = a.opinion.volatility;
  f.satisfaction = a.behavior.satisfaction;
  return f;
}

struct AnalysisResult {
  AnalysisKind kind{AnalysisKind::General};
  AxisValues target_axes{};   // positions the analysis predicts the voter drifts to
  float confidence{0.0f};     // [0, 1]
  float engagement{0.0f};     // [0, 1]
  float salience{0.0f};       // [0, 1], how much attention the voter deserves
  bool  degraded{false};      // produced by the fallback path
};

// One element of an external batch.
struct AnalysisItem {
  CacheKey key{};
  AnalysisKind kind{AnalysisKind::General};
  FeatureSnapshot features{};
};

struct ServiceReply {
  bool ok{false};
  std::string error{};
  std::vector<AnalysisResult> results{};  // one per item, same order
};

// External per-agent analysis service. analyze() is called from gateway worker
// threads, one batch at a time per call, and must return within `deadline`.
class AnalysisService {
public:
  virtual ~AnalysisService() = default;

  virtual ServiceReply analyze(std::span<const AnalysisItem> batch, Millis deadline) = 0;
  virtual std::string_view name() const noexcept = 0;
};

// Deterministic degraded result: keep the voter where they are, low confidence,
// no attention boost. Never touches the network.
AnalysisResult fallback_result(const AnalysisItem& item) noexcept;

// A cohort result as seen by one member: confidence raised for the most
// educated, lowered for very volatile voters. Pure in its inputs, so members
// with equal features get equal results.
AnalysisResult customize_result(const AnalysisResult& shared, const FeatureSnapshot& member) noexcept;

} // namespace vsim
