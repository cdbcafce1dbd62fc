#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string_view>

namespace vsim {

enum class LoadState : uint8_t { Excellent = 0, Good = 1, Warning = 2, Critical = 3 };

inline std::string_view to_string(LoadState s) noexcept {
  switch (s) {
    case LoadState::Excellent: return "excellent";
    case LoadState::Good:      return "good";
    case LoadState::Warning:   return "warning";
    case LoadState::Critical:  return "critical";
  }
  return "?";
}

struct GovernorConfig {
  bool enabled{false};
  double target_tick_ms{16.67};
  double critical_tick_ms{33.33};
  std::size_t window{60};            // samples kept
  std::size_t min_samples{30};       // no decision before this many
  std::size_t evaluate_every{30};    // samples between decisions
  double min_budget_scale{0.25};
};

// Scales the per-tick budget from measured tick wall time. Critical shrinks the
// scale by 0.7, Warning by 0.9, Excellent grows it by 1.05, Good eases it back
// toward 1. The scale never leaves [min_budget_scale, 1].
class LoadGovernor {
public:
  LoadGovernor() = default;
  explicit LoadGovernor(GovernorConfig cfg) : cfg_(cfg) {}

  const GovernorConfig& config() const noexcept { return cfg_; }

  // Returns true if this sample triggered a decision.
  bool record(double tick_ms);

  double scale() const noexcept { return scale_; }
  LoadState state() const noexcept { return state_; }

  // Effective budget for `budget`; at least 1 when budget > 0.
  std::size_t apply(std::size_t budget) const noexcept;

  // Classification of a window of samples (exposed for tests).
  LoadState classify(double avg_ms, double p95_ms) const noexcept;

private:
  GovernorConfig cfg_{};
  std::deque<double> samples_;
  std::size_t since_eval_{0};
  double scale_{1.0};
  LoadState state_{LoadState::Good};
};

} // namespace vsim
