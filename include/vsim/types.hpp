#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vsim {

using AgentId    = uint32_t;  // stable index into the agent store
using Generation = uint32_t;  // bumped every time a slot is recycled
using Tick       = uint64_t;
using CacheKey   = uint64_t;
using Millis     = std::chrono::milliseconds;

inline constexpr AgentId kInvalidAgent = 0xFFFF'FFFFu;

enum class Tier : uint8_t { Dormant = 0, Low = 1, Medium = 2, High = 3 };

inline constexpr std::size_t kTierCount = 4;

using TierCounts = std::array<std::size_t, kTierCount>;

inline constexpr std::size_t tier_index(Tier t) noexcept {
  return static_cast<std::size_t>(t);
}

inline constexpr Tier step_up(Tier t) noexcept {
  return (t == Tier::High) ? t : static_cast<Tier>(static_cast<uint8_t>(t) + 1);
}

inline constexpr Tier step_down(Tier t) noexcept {
  return (t == Tier::Dormant) ? t : static_cast<Tier>(static_cast<uint8_t>(t) - 1);
}

inline std::string_view to_string(Tier t) noexcept {
  switch (t) {
    case Tier::Dormant: return "DORMANT";
    case Tier::Low:     return "LOW";
    case Tier::Medium:  return "MEDIUM";
    case Tier::High:    return "HIGH";
  }
  return "?";
}

enum class Axis : uint8_t { Economic = 0, Social = 1, Immigration = 2, Environmental = 3 };

inline constexpr std::size_t kAxisCount = 4;

inline constexpr float kAxisMin = -100.0f;
inline constexpr float kAxisMax = 100.0f;

using AxisValues = std::array<float, kAxisCount>;

inline constexpr std::size_t axis_index(Axis a) noexcept {
  return static_cast<std::size_t>(a);
}

enum class AnalysisKind : uint8_t {
  General = 0,
  PartyRecommendation = 1,
  VotingPrediction = 2,
  IssueAnalysis = 3,
  InfluenceAnalysis = 4,
  BehaviorPrediction = 5
};

inline std::string_view to_string(AnalysisKind k) noexcept {
  switch (k) {
    case AnalysisKind::General:             return "general";
    case AnalysisKind::PartyRecommendation: return "party_recommendation";
    case AnalysisKind::VotingPrediction:    return "voting_prediction";
    case AnalysisKind::IssueAnalysis:       return "issue_analysis";
    case AnalysisKind::InfluenceAnalysis:   return "influence_analysis";
    case AnalysisKind::BehaviorPrediction:  return "behavior_prediction";
  }
  return "general";
}

// Recoverable quality loss; never stops a tick.
enum class Degradation : uint8_t {
  None = 0,
  ClassificationFault,
  SchedulingFault,
  ExternalFailure,
  Timeout,
  CacheAnomaly
};

inline std::string_view to_string(Degradation d) noexcept {
  switch (d) {
    case Degradation::None:                return "none";
    case Degradation::ClassificationFault: return "classification_fault";
    case Degradation::SchedulingFault:     return "scheduling_fault";
    case Degradation::ExternalFailure:     return "external_failure";
    case Degradation::Timeout:             return "timeout";
    case Degradation::CacheAnomaly:        return "cache_anomaly";
  }
  return "unknown";
}

enum class CircuitState : uint8_t { Closed = 0, Open = 1, HalfOpen = 2 };

inline std::string_view to_string(CircuitState s) noexcept {
  switch (s) {
    case CircuitState::Closed:   return "CLOSED";
    case CircuitState::Open:     return "OPEN";
    case CircuitState::HalfOpen: return "HALF_OPEN";
  }
  return "?";
}

} // namespace vsim
