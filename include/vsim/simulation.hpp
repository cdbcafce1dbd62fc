#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vsim/agent_store.hpp"
#include "vsim/analysis_service.hpp"
#include "vsim/classifier.hpp"
#include "vsim/clusterer.hpp"
#include "vsim/events.hpp"
#include "vsim/gateway.hpp"
#include "vsim/load_governor.hpp"
#include "vsim/scheduler.hpp"
#include "vsim/telemetry.hpp"
#include "vsim/update_engine.hpp"
#include "vsim/worker_pool.hpp"

namespace vsim {

struct SimulationConfig {
  ClassifierConfig classifier{};
  SchedulerConfig scheduler{};
  UpdateParams update{};
  ClusterConfig cluster{};
  GatewayConfig gateway{};
  GovernorConfig governor{};

  Tick classify_interval{10};      // ticks between classification passes (1 = every tick)
  std::size_t worker_threads{0};   // classification/update pool; 0 runs inline
  Millis tick_duration{Millis{16}};  // gateway clock advance per tick

  // Write-back: fraction of the way each axis moves toward the analysed target,
  // scaled by the result's confidence.
  float result_blend{0.5f};

  std::size_t health_window{60};   // ticks considered by health()
};

struct TickReport {
  Tick tick{0};
  bool classified{false};
  ClassifyResult classify{};

  std::size_t budget{0};
  std::size_t full_updates{0};
  std::size_t aging_updates{0};
  std::size_t forced{0};
  std::size_t overflow{0};

  std::size_t flagged{0};
  std::size_t cohorts_submitted{0};
  std::size_t results_applied{0};
  std::size_t results_discarded{0};  // stale generation or cancelled
  std::size_t degraded_results{0};

  // First degradation seen this tick, in tick-flow order.
  Degradation degradation{Degradation::None};
};

struct RunStats {
  uint64_t ticks{0};
  uint64_t full_updates{0};
  uint64_t aging_updates{0};
  uint64_t forced{0};
  uint64_t overflow{0};
  uint64_t cohorts_submitted{0};
  uint64_t results_applied{0};
  uint64_t degraded_ticks{0};
};

enum class Health : uint8_t { Healthy = 0, Degraded = 1, Critical = 2 };

inline std::string_view to_string(Health h) noexcept {
  switch (h) {
    case Health::Healthy:  return "healthy";
    case Health::Degraded: return "degraded";
    case Health::Critical: return "critical";
  }
  return "?";
}

// Fixed-step driver: drain analysis results, classify, select, update in
// parallel, cluster and submit, emit telemetry. All agent state is written on
// the calling thread or inside range-partitioned parallel sections.
class Simulation {
public:
  Simulation(AgentStore store, AnalysisService& service, SimulationConfig cfg = {},
             TelemetrySink* sink = nullptr);

  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;

  const AgentStore& store() const noexcept { return store_; }
  AgentStore& store_mut() noexcept { return store_; }

  const SimulationConfig& config() const noexcept { return cfg_; }
  const AnalysisGateway& gateway() const noexcept { return gateway_; }
  AnalysisGateway& gateway_mut() noexcept { return gateway_; }
  const LoadGovernor& governor() const noexcept { return governor_; }

  Tick tick() const noexcept { return tick_; }
  Millis now() const noexcept { return Millis{static_cast<Millis::rep>(tick_) * cfg_.tick_duration.count()}; }

  // One tick against a read-only event list.
  TickReport step(std::span<const ActiveEvent> events);
  RunStats run(Tick ticks, EventSource& events);

  // Replace the voter in slot `id`. Pending analysis for the old voter is
  // detached; its ticket is cancelled once no live member remains.
  bool recycle_agent(AgentId id, const Demographics& d);

  bool pin(AgentId id, bool pinned = true) { return store_.pin(id, pinned); }

  // Analyses submitted and not yet written back or discarded.
  std::size_t pending_analyses() const noexcept { return pending_.size(); }
  bool analysis_pending(AgentId id) const noexcept { return pending_.count(id) != 0; }

  // Over the last health_window ticks: any degraded tick or an open circuit
  // => Degraded; half or more degraded => Critical.
  Health health() const noexcept;

  const TickReport& last_report() const noexcept { return last_; }

private:
  struct Pending {
    CohortHandle ticket;
    Generation generation{0};
  };

  void drain_results_(TickReport& r);
  void write_back_(AgentId id, const AnalysisResult& shared, const FeatureSnapshot& features);
  void update_working_set_(const WorkingSet& ws, std::span<const ActiveEvent> events,
                           std::vector<uint8_t>& flags);
  void request_analysis_(const WorkingSet& ws, const std::vector<uint8_t>& flags, TickReport& r);
  void emit_(const TickReport& r, double tick_ms);
  void log_(LogLevel level, std::string_view msg) const;
  void log_abort_(std::string_view stage, const std::exception& e) const;

  static void note_(TickReport& r, Degradation d) noexcept {
    if (r.degradation == Degradation::None) r.degradation = d;
  }

  SimulationConfig cfg_;
  TelemetrySink* sink_{nullptr};

  AgentStore store_;
  RelevanceClassifier classifier_;
  TieredScheduler scheduler_;
  SimilarityClusterer clusterer_;
  AnalysisGateway gateway_;
  LoadGovernor governor_;

  std::unordered_map<AgentId, Pending> pending_;
  std::deque<bool> recent_degraded_;

  Tick tick_{0};
  TickReport last_{};

  // declared last: joined before the state its tasks touch is destroyed
  std::unique_ptr<WorkerPool> pool_;
};

} // namespace vsim
