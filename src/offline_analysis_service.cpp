#include "vsim/offline_analysis_service.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include "vsim/invariants.hpp"

namespace vsim {

namespace {

// Where a voter with these demographics would sit with no other input.
AxisValues demographic_prior(const FeatureSnapshot& f) noexcept {
  const float age = (static_cast<float>(f.age) - 45.0f) / 30.0f;           // ~[-1, 2]
  const float edu = (static_cast<float>(f.education) - 3.0f) / 2.0f;       // [-1, 1]
  const float inc = (static_cast<float>(f.income) - 50.0f) / 50.0f;        // [-1, 1]
  const float urb = f.urban ? 1.0f : -1.0f;

  AxisValues p{};
  p[axis_index(Axis::Economic)]      = 40.0f * inc - 10.0f * edu;
  p[axis_index(Axis::Social)]        = -30.0f * age + 20.0f * edu + 15.0f * urb;
  p[axis_index(Axis::Immigration)]   = -25.0f * age + 25.0f * edu + 20.0f * urb;
  p[axis_index(Axis::Environmental)] = -20.0f * age + 15.0f * edu + 10.0f * urb - 10.0f * inc;
  for (auto& v : p) v = clamp_axis(v);
  return p;
}

} // namespace

AnalysisResult OfflineAnalysisService::evaluate(const AnalysisItem& item, float prior_weight) noexcept {
  const FeatureSnapshot& f = item.features;
  const AxisValues prior = demographic_prior(f);
  const float w = clamp_unit(prior_weight);

  AnalysisResult r{};
  r.kind = item.kind;
  float spread = 0.0f;
  for (std::size_t i = 0; i < kAxisCount; ++i) {
    r.target_axes[i] = clamp_axis(f.axes[i] + w * (prior[i] - f.axes[i]));
    spread += std::fabs(prior[i] - f.axes[i]);
  }
  spread /= static_cast<float>(kAxisCount) * (kAxisMax - kAxisMin);

  r.confidence = clamp_unit(0.5f * f.confidence + 0.5f * (1.0f - spread) - 0.2f * f.volatility);
  r.engagement = clamp_unit(0.3f + 0.05f * static_cast<float>(f.education) +
                            0.8f * std::fabs(f.satisfaction - 0.5f));
  r.salience = clamp_unit(0.6f * f.volatility + 0.8f * spread);
  if (item.kind == AnalysisKind::InfluenceAnalysis || item.kind == AnalysisKind::BehaviorPrediction) {
    r.salience = clamp_unit(r.salience + 0.1f);
  }
  r.degraded = false;
  return r;
}

bool OfflineAnalysisService::take_failure_() noexcept {
  uint32_t n = fail_next_.load(std::memory_order_relaxed);
  while (n > 0) {
    if (fail_next_.compare_exchange_weak(n, n - 1, std::memory_order_relaxed)) return true;
  }
  return false;
}

ServiceReply OfflineAnalysisService::analyze(std::span<const AnalysisItem> batch, Millis deadline) {
  calls_.fetch_add(1, std::memory_order_relaxed);
  items_.fetch_add(batch.size(), std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lk(mu_);
    sizes_.push_back(batch.size());
  }

  ServiceReply reply;
  if (cfg_.latency.count() > 0) {
    std::this_thread::sleep_for(std::min(cfg_.latency, deadline));
    if (cfg_.latency >= deadline) {
      reply.error = "deadline exceeded";
      return reply;
    }
  }
  if (!available_.load(std::memory_order_relaxed)) {
    reply.error = "service unavailable";
    return reply;
  }
  if (take_failure_()) {
    reply.error = "injected failure";
    return reply;
  }

  reply.results.reserve(batch.size());
  for (const auto& item : batch) reply.results.push_back(evaluate(item, cfg_.prior_weight));
  if (truncate_.load(std::memory_order_relaxed) && !reply.results.empty()) reply.results.pop_back();
  reply.ok = true;
  return reply;
}

std::vector<std::size_t> OfflineAnalysisService::batch_sizes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sizes_;
}

} // namespace vsim
