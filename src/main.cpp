#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "vsim/events.hpp"
#include "vsim/offline_analysis_service.hpp"
#include "vsim/population.hpp"
#include "vsim/simulation.hpp"
#include "vsim/snapshot.hpp"
#include "vsim/telemetry.hpp"

namespace {

// Keeps per-tick telemetry for the CSV and forwards log lines to stderr.
class RecordingSink final : public vsim::TelemetrySink {
public:
  explicit RecordingSink(vsim::TelemetrySink& logs) : logs_(logs) {}

  void on_tick(const vsim::TickTelemetry& t) override { ticks.push_back(t); }
  void log(vsim::LogLevel level, std::string_view msg) override { logs_.log(level, msg); }

  std::vector<vsim::TickTelemetry> ticks;

private:
  vsim::TelemetrySink& logs_;
};

} // namespace

static void write_tiers_csv(const std::string& path, const std::vector<vsim::TickTelemetry>& ticks) {
  std::ofstream f(path);
  f << "tick,dormant,low,medium,high,budget,full,aging,forced,overflow,flagged,cohorts,applied,hit_ratio,circuit,degradation\n";
  for (const auto& t : ticks) {
    f << t.tick << ","
      << t.tiers[vsim::tier_index(vsim::Tier::Dormant)] << ","
      << t.tiers[vsim::tier_index(vsim::Tier::Low)] << ","
      << t.tiers[vsim::tier_index(vsim::Tier::Medium)] << ","
      << t.tiers[vsim::tier_index(vsim::Tier::High)] << ","
      << t.budget << "," << t.full_updates << "," << t.aging_updates << ","
      << t.forced << "," << t.overflow << "," << t.flagged << ","
      << t.cohorts_submitted << "," << t.results_applied << ","
      << t.cache_hit_ratio << "," << vsim::to_string(t.circuit) << ","
      << vsim::to_string(t.degradation) << "\n";
  }
}

static void usage() {
  std::cout
    << "Usage:\n"
    << "  vsim_cli [seed] [ticks] [agents] [threads]\n"
    << "  vsim_cli --load <snapshot.csv> [ticks] [threads]\n";
}

int main(int argc, char** argv) {
  uint64_t seed = 1;
  vsim::Tick ticks = 600;
  std::size_t agents = 10'000;
  std::size_t threads = 4;
  std::string load_path;

  try {
    int pos = 1;
    if (argc >= 2 && std::string(argv[1]) == "--help") { usage(); return 0; }
    if (argc >= 3 && std::string(argv[1]) == "--load") {
      load_path = argv[2];
      pos = 3;
      if (argc > pos) ticks = std::stoull(argv[pos++]);
      if (argc > pos) threads = static_cast<std::size_t>(std::stoul(argv[pos++]));
    } else {
      if (argc > pos) seed = static_cast<uint64_t>(std::stoull(argv[pos++]));
      if (argc > pos) ticks = std::stoull(argv[pos++]);
      if (argc > pos) agents = static_cast<std::size_t>(std::stoul(argv[pos++]));
      if (argc > pos) threads = static_cast<std::size_t>(std::stoul(argv[pos++]));
    }
  } catch (const std::exception&) {
    usage();
    return 1;
  }

  vsim::StreamTelemetrySink logs(std::cerr, vsim::LogLevel::Warn);
  RecordingSink sink(logs);

  vsim::AgentStore store(&sink);
  if (!load_path.empty()) {
    const auto res = vsim::load_snapshot_csv(store, load_path);
    if (!res.ok) {
      std::cerr << "snapshot load failed at line " << res.line << ": " << res.error << "\n";
      return 1;
    }
  } else {
    vsim::seed_population(store, agents, seed);
  }
  // the camera sits at the origin; a handful of voters are followed closely
  for (vsim::AgentId id = 0; id < store.size() && id < 50; ++id) store.pin(id);

  vsim::SimulationConfig cfg{};
  cfg.worker_threads = threads;
  cfg.governor.enabled = true;

  vsim::OfflineAnalysisService service;
  vsim::Simulation sim(std::move(store), service, cfg, &sink);

  // an economic shock for the low-income urban population, then an
  // environmental campaign aimed at the highly educated
  vsim::ScriptedEventSource events;
  vsim::ActiveEvent shock{};
  shock.id = 1;
  shock.axis = vsim::Axis::Economic;
  shock.target = -80.0f;
  shock.intensity = 0.6f;
  shock.filter.max_income = 40;
  shock.filter.urban_only = true;
  events.add(ticks / 10, ticks / 2, shock);

  vsim::ActiveEvent campaign{};
  campaign.id = 2;
  campaign.axis = vsim::Axis::Environmental;
  campaign.target = 70.0f;
  campaign.intensity = 0.4f;
  campaign.filter.min_education = 4;
  events.add(ticks / 3, ticks, campaign);

  const auto stats = sim.run(ticks, events);

  write_tiers_csv("tiers.csv", sink.ticks);
  const auto snap = vsim::save_snapshot_csv(sim.store(), std::string("snapshot.csv"));
  if (!snap.ok) std::cerr << "snapshot save failed: " << snap.error << "\n";

  const auto& gs = sim.gateway().stats();
  std::cout << "agents=" << sim.store().size()
            << " ticks=" << stats.ticks
            << " full=" << stats.full_updates
            << " aging=" << stats.aging_updates
            << " forced=" << stats.forced
            << " overflow=" << stats.overflow
            << " cohorts=" << stats.cohorts_submitted
            << " applied=" << stats.results_applied
            << " degraded_ticks=" << stats.degraded_ticks
            << "\n";
  std::cout << "gateway calls=" << gs.external_calls
            << " batches=" << gs.batches_dispatched
            << " mean_batch=" << gs.mean_batch_size()
            << " hit_ratio=" << gs.cache_hit_ratio()
            << " efficiency=" << gs.batching_efficiency()
            << " cache_entries=" << sim.gateway().cache().size()
            << " circuit=" << vsim::to_string(sim.gateway().circuit_state())
            << " health=" << vsim::to_string(sim.health())
            << " budget_scale=" << sim.governor().scale()
            << "\n";
  return 0;
}
