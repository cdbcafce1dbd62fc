#pragma once
#include <cstdint>

#include "vsim/types.hpp"

namespace vsim {

struct Position {
  float x{0.0f};
  float y{0.0f};
};

// Fixed at seeding (or recycling) time.
struct Demographics {
  uint8_t  age{40};          // 18..99
  uint8_t  education{3};     // 1..5
  uint8_t  income{50};       // percentile 0..100
  uint8_t  region{0};
  bool     urban{false};
  Position position{};
};

struct OpinionState {
  AxisValues axes{};          // each in [kAxisMin, kAxisMax]
  float confidence{0.5f};     // [0, 1]
  float volatility{0.0f};     // [0, 1], EMA of recent axis movement
  Tick  last_updated{0};
  Tick  last_analysis{0};
  bool  analysed{false};
};

// Personality traits and affect; every field in [0, 1].
struct BehaviorState {
  float openness{0.5f};
  float conscientiousness{0.5f};
  float neuroticism{0.5f};
  float change_resistance{0.5f};
  float susceptibility{0.5f};

  float satisfaction{0.47f};
  float anxiety{0.31f};
  float anger{0.24f};
  float hope{0.51f};
};

// Aggregate of the agent's social neighbourhood, not a graph.
struct SocialSummary {
  float influence{0.3f};
  float susceptibility{0.5f};
  float echo_chamber{0.3f};
  float diversity_exposure{0.5f};
};

struct Agent {
  AgentId       id{kInvalidAgent};
  Demographics  demographics{};
  OpinionState  opinion{};
  BehaviorState behavior{};
  SocialSummary social{};
};

} // namespace vsim
