#include "vsim/population.hpp"

#include <algorithm>

#include "vsim/invariants.hpp"

namespace vsim {

namespace {

float unit(Rng& rng, double mean, double sd) {
  return clamp_unit(static_cast<float>(rng.normal(mean, sd)));
}

} // namespace

Demographics sample_demographics(Rng& rng, const PopulationConfig& cfg) {
  Demographics d{};
  const int group = static_cast<int>(rng.pick(cfg.age_groups));
  d.age = static_cast<uint8_t>(std::min(99, 18 + group * 15 + rng.uniform_int(0, 14)));
  d.education = static_cast<uint8_t>(1 + rng.pick(cfg.education));
  d.income = static_cast<uint8_t>(rng.uniform_int(10, 90));
  d.region = static_cast<uint8_t>(rng.pick(cfg.regions));
  d.urban = rng.uniform01() < cfg.urban_share;

  const double e = static_cast<double>(cfg.world_half_extent);
  d.position.x = static_cast<float>((rng.uniform01() * 2.0 - 1.0) * e);
  d.position.y = static_cast<float>((rng.uniform01() * 2.0 - 1.0) * e);
  return d;
}

Agent sample_agent(Rng& rng, const PopulationConfig& cfg) {
  Agent a{};
  a.demographics = sample_demographics(rng, cfg);
  const Demographics& d = a.demographics;

  // demographic leaning plus individual spread
  const float economic = d.income > 60 ? 20.0f : -20.0f;
  const float social = d.age < 40 ? 15.0f : -15.0f;
  const float immigration = d.urban ? 10.0f : -25.0f;
  const float environmental = d.education > 3 ? 25.0f : -10.0f;

  auto& ax = a.opinion.axes;
  ax[axis_index(Axis::Economic)] = clamp_axis(economic + static_cast<float>(rng.uniform_int(-30, 30)));
  ax[axis_index(Axis::Social)] = clamp_axis(social + static_cast<float>(rng.uniform_int(-30, 30)));
  ax[axis_index(Axis::Immigration)] = clamp_axis(immigration + static_cast<float>(rng.uniform_int(-40, 40)));
  ax[axis_index(Axis::Environmental)] = clamp_axis(environmental + static_cast<float>(rng.uniform_int(-30, 30)));
  a.opinion.confidence = static_cast<float>(rng.uniform_int(120, 200)) / 255.0f;

  auto& b = a.behavior;
  b.openness = unit(rng, 0.5, 0.15);
  b.conscientiousness = unit(rng, 0.5, 0.15);
  b.neuroticism = unit(rng, 0.5, 0.15);
  b.change_resistance = clamp_unit(0.3f + 0.004f * static_cast<float>(d.age - 18) +
                                   static_cast<float>(rng.normal(0.0, 0.1)));
  b.susceptibility = clamp_unit(1.0f - b.change_resistance * 0.7f - b.openness * 0.1f +
                                static_cast<float>(rng.normal(0.0, 0.05)));

  auto& s = a.social;
  s.influence = unit(rng, 0.3, 0.15);
  s.susceptibility = unit(rng, 0.5, 0.15);
  s.echo_chamber = unit(rng, d.urban ? 0.25 : 0.4, 0.1);
  s.diversity_exposure = clamp_unit(1.0f - s.echo_chamber + static_cast<float>(rng.normal(0.0, 0.05)));
  return a;
}

void seed_population(AgentStore& store, std::size_t n, uint64_t seed, const PopulationConfig& cfg, Tick now) {
  store.reserve(store.size() + n);
  Rng rng(seed);
  for (std::size_t i = 0; i < n; ++i) store.add(sample_agent(rng, cfg), now);
}

} // namespace vsim
