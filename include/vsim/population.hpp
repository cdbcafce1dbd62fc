#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

#include "vsim/agent.hpp"
#include "vsim/agent_store.hpp"
#include "vsim/rng.hpp"

namespace vsim {

struct PopulationConfig {
  // Age groups of 15 years starting at 18.
  std::array<double, 6> age_groups{0.16, 0.12, 0.13, 0.20, 0.18, 0.21};
  // Education levels 1..5.
  std::array<double, 5> education{0.28, 0.20, 0.25, 0.15, 0.12};
  // Regions 0..11.
  std::array<double, 12> regions{0.21, 0.15, 0.10, 0.08, 0.07, 0.06, 0.06, 0.05, 0.04, 0.04, 0.04, 0.10};
  double urban_share{0.66};

  // Agents are scattered uniformly in a square of this half-width around the origin.
  float world_half_extent{1000.0f};
};

// Demographics drawn from the configured distributions.
Demographics sample_demographics(Rng& rng, const PopulationConfig& cfg);

// Initial opinions and traits consistent with the demographics.
Agent sample_agent(Rng& rng, const PopulationConfig& cfg);

// Appends n agents to the store. Same seed => same population.
void seed_population(AgentStore& store, std::size_t n, uint64_t seed,
                     const PopulationConfig& cfg = {}, Tick now = 0);

} // namespace vsim
