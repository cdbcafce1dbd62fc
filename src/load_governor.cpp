#include "vsim/load_governor.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace vsim {

LoadState LoadGovernor::classify(double avg_ms, double p95_ms) const noexcept {
  if (avg_ms > cfg_.critical_tick_ms) return LoadState::Critical;
  if (avg_ms > cfg_.target_tick_ms * 1.5 || p95_ms > cfg_.target_tick_ms * 2.0) return LoadState::Warning;
  if (avg_ms < cfg_.target_tick_ms * 0.8) return LoadState::Excellent;
  return LoadState::Good;
}

bool LoadGovernor::record(double tick_ms) {
  if (!cfg_.enabled || !std::isfinite(tick_ms)) return false;

  samples_.push_back(tick_ms);
  while (samples_.size() > cfg_.window) samples_.pop_front();
  ++since_eval_;
  if (samples_.size() < cfg_.min_samples || since_eval_ < cfg_.evaluate_every) return false;
  since_eval_ = 0;

  const double avg = std::accumulate(samples_.begin(), samples_.end(), 0.0) / static_cast<double>(samples_.size());
  std::vector<double> sorted(samples_.begin(), samples_.end());
  std::sort(sorted.begin(), sorted.end());
  const auto idx = static_cast<std::size_t>(0.95 * static_cast<double>(sorted.size() - 1));
  const double p95 = sorted[idx];

  state_ = classify(avg, p95);
  switch (state_) {
    case LoadState::Critical:  scale_ *= 0.7; break;
    case LoadState::Warning:   scale_ *= 0.9; break;
    case LoadState::Excellent: scale_ *= 1.05; break;
    case LoadState::Good:      scale_ += (1.0 - scale_) * 0.1; break;
  }
  scale_ = std::clamp(scale_, cfg_.min_budget_scale, 1.0);
  return true;
}

std::size_t LoadGovernor::apply(std::size_t budget) const noexcept {
  if (budget == 0) return 0;
  const auto scaled = static_cast<std::size_t>(std::llround(static_cast<double>(budget) * scale_));
  return std::max<std::size_t>(1, scaled);
}

} // namespace vsim
