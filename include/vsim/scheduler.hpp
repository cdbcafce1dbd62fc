#pragma once
#include <array>
#include <cstddef>
#include <vector>

#include "vsim/agent_store.hpp"
#include "vsim/types.hpp"

namespace vsim {

struct SchedulerConfig {
  std::size_t budget{1000};          // full updates per tick

  Tick medium_interval{4};           // Medium due after this many ticks
  Tick low_sample_rate{16};          // Low: 1-in-N slot per tick
  Tick dormant_interval{180};        // Dormant: aging-only update period

  // Staleness ceilings, indexed by tier (Dormant, Low, Medium, High). An agent
  // whose ticks-since-update reaches its ceiling is force-included.
  std::array<Tick, kTierCount> staleness_ceiling{180, 120, 30, 1};
};

enum class UpdateKind : uint8_t { Full = 0, AgingOnly = 1 };

struct WorkingSet {
  Tick tick{0};
  std::vector<AgentId> full;    // ascending id order
  std::vector<AgentId> aging;   // ascending id order

  std::size_t budget{0};
  std::size_t forced{0};        // included only because of a staleness ceiling
  std::size_t overflow{0};      // full updates beyond budget

  Degradation degradation{Degradation::None};

  std::size_t size() const noexcept { return full.size() + aging.size(); }
};

class TieredScheduler {
public:
  TieredScheduler() = default;
  explicit TieredScheduler(SchedulerConfig cfg) : cfg_(cfg) {}

  const SchedulerConfig& config() const noexcept { return cfg_; }
  SchedulerConfig& config_mut() noexcept { return cfg_; }

  bool config_valid() const noexcept;

  // Single-threaded, deterministic: same population + tick => same set.
  // budget_override (if non-zero) replaces cfg.budget for this tick.
  WorkingSet select(const AgentStore& store, Tick tick, std::size_t budget_override = 0) const;

  // Degraded mode: every agent treated as Low, contiguous round robin window of
  // `budget` ids starting at (tick * budget) mod size.
  WorkingSet select_fallback(const AgentStore& store, Tick tick, std::size_t budget_override = 0) const;

  Tick ceiling(Tier t) const noexcept { return cfg_.staleness_ceiling[tier_index(t)]; }

private:
  SchedulerConfig cfg_{};
};

} // namespace vsim
