#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include "vsim/events.hpp"
#include "vsim/http_analysis_service.hpp"
#include "vsim/population.hpp"
#include "vsim/simulation.hpp"
#include "vsim/telemetry.hpp"

// Same run as vsim_cli, but analysis goes to an OpenAI-compatible
// chat-completions endpoint. The bearer token is read from VSIM_API_KEY.

static void usage() {
  std::cout
    << "Usage:\n"
    << "  vsim_http_cli <base_url> [model] [ticks] [agents] [seed]\n"
    << "  e.g. vsim_http_cli http://127.0.0.1:8000/v1 meta/llama-3.1-8b-instruct 300 2000\n";
}

int main(int argc, char** argv) {
  if (argc < 2 || std::string(argv[1]) == "--help") {
    usage();
    return argc < 2 ? 1 : 0;
  }

  vsim::HttpServiceConfig http{};
  http.base_url = argv[1];
  if (const char* key = std::getenv("VSIM_API_KEY")) http.api_key = key;

  vsim::Tick ticks = 300;
  std::size_t agents = 2'000;
  uint64_t seed = 1;
  try {
    if (argc > 2) http.model = argv[2];
    if (argc > 3) ticks = std::stoull(argv[3]);
    if (argc > 4) agents = static_cast<std::size_t>(std::stoul(argv[4]));
    if (argc > 5) seed = static_cast<uint64_t>(std::stoull(argv[5]));
  } catch (const std::exception&) {
    usage();
    return 1;
  }

  vsim::StreamTelemetrySink logs(std::cerr, vsim::LogLevel::Info);

  vsim::AgentStore store(&logs);
  vsim::seed_population(store, agents, seed);
  for (vsim::AgentId id = 0; id < store.size() && id < 50; ++id) store.pin(id);

  vsim::SimulationConfig cfg{};
  cfg.worker_threads = 4;
  // remote models answer in seconds, not milliseconds
  cfg.gateway.call_timeout = vsim::Millis{30'000};
  cfg.gateway.circuit.cooldown = vsim::Millis{10'000};

  vsim::HttpAnalysisService service(std::move(http));
  vsim::Simulation sim(std::move(store), service, cfg, &logs);

  vsim::ScriptedEventSource events;
  vsim::ActiveEvent shock{};
  shock.id = 1;
  shock.axis = vsim::Axis::Economic;
  shock.target = -80.0f;
  shock.intensity = 0.6f;
  shock.filter.max_income = 40;
  events.add(0, ticks, shock);

  const auto stats = sim.run(ticks, events);
  // results still in flight when the run ends are dropped with the gateway

  const auto& gs = sim.gateway().stats();
  std::cout << "service=" << service.name()
            << " ticks=" << stats.ticks
            << " cohorts=" << stats.cohorts_submitted
            << " applied=" << stats.results_applied
            << " calls=" << gs.external_calls
            << " failures=" << gs.failures
            << " timeouts=" << gs.timeouts
            << " circuit=" << vsim::to_string(sim.gateway().circuit_state())
            << " health=" << vsim::to_string(sim.health())
            << "\n";
  return 0;
}
