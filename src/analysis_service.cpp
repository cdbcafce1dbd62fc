#include "vsim/analysis_service.hpp"

#include "vsim/invariants.hpp"

namespace vsim {

AnalysisResult fallback_result(const AnalysisItem& item) noexcept {
  AnalysisResult r{};
  r.kind = item.kind;
  r.target_axes = item.features.axes;
  r.confidence = 0.25f;
  r.engagement = 0.5f;
  r.salience = 0.0f;
  r.degraded = true;
  return r;
}

AnalysisResult customize_result(const AnalysisResult& shared, const FeatureSnapshot& member) noexcept {
  AnalysisResult r = shared;
  if (r.degraded) return r;
  if (member.education >= 5) r.confidence *= 1.1f;
  if (member.volatility > 0.7f) r.confidence *= 0.9f;
  r.confidence = clamp_unit(r.confidence);
  return r;
}

} // namespace vsim
