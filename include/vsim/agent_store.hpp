#pragma once
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include "vsim/agent.hpp"
#include "vsim/telemetry.hpp"
#include "vsim/types.hpp"

namespace vsim {

// Classification state kept beside each record.
struct RelevanceState {
  Tier  tier{Tier::Low};       // new agents start Low, never Dormant
  bool  pinned{false};         // always-High request from the application
  float analysis_boost{0.0f};  // [0, 1], raised by analysis results, decays per pass
  float last_score{0.0f};
};

// Indexable arena of agents. Ids are stable indices; slots are recycled, never
// freed, so ids held by the scheduler or the gateway stay valid across ticks.
class AgentStore {
public:
  explicit AgentStore(TelemetrySink* sink = nullptr) : sink_(sink) {}

  void reserve(std::size_t n);

  AgentId add(const Demographics& d, Tick now = 0);
  AgentId add(Agent a, Tick now = 0);  // a.id is ignored and reassigned

  // Reinitialise a slot for a new voter; bumps the generation so stale
  // references (pending analysis) can be recognised.
  bool recycle(AgentId id, const Demographics& d, Tick now);

  std::size_t size() const noexcept { return agents_.size(); }
  bool contains(AgentId id) const noexcept { return id < agents_.size(); }

  // nullptr (plus a logged fault) for out-of-range ids
  const Agent* find(AgentId id) const;
  Agent* find_mut(AgentId id);

  // Unchecked access for hot loops that iterate [0, size()).
  const Agent& operator[](AgentId id) const noexcept { return agents_[id]; }
  Agent& operator[](AgentId id) noexcept { return agents_[id]; }

  std::span<Agent> agents() noexcept { return agents_; }
  std::span<const Agent> agents() const noexcept { return agents_; }

  // ---- relevance ----
  Tier tier(AgentId id) const noexcept { return contains(id) ? relevance_[id].tier : Tier::Dormant; }
  const RelevanceState& relevance(AgentId id) const noexcept { return relevance_[id]; }
  RelevanceState& relevance_mut(AgentId id) noexcept { return relevance_[id]; }
  std::span<RelevanceState> relevance_all() noexcept { return relevance_; }
  std::span<const RelevanceState> relevance_all() const noexcept { return relevance_; }

  bool pin(AgentId id, bool pinned = true);
  bool is_pinned(AgentId id) const noexcept { return contains(id) && relevance_[id].pinned; }

  Generation generation(AgentId id) const noexcept { return contains(id) ? generations_[id] : 0; }

  // Partitioned views; ascending id order.
  std::vector<AgentId> ids_in_tier(Tier t) const;
  TierCounts tier_counts() const noexcept;

  template <class F>
  void for_each_in_tier(Tier t, F&& f) const {
    for (AgentId id = 0; id < agents_.size(); ++id) {
      if (relevance_[id].tier == t) f(agents_[id]);
    }
  }

  // ---- focus (for distance-to-focus) ----
  void set_focus(Position p) noexcept { focus_ = p; }
  Position focus() const noexcept { return focus_; }

  void set_sink(TelemetrySink* sink) noexcept { sink_ = sink; }

private:
  void fault_(AgentId id, std::string_view op) const;

  std::vector<Agent> agents_;
  std::vector<RelevanceState> relevance_;
  std::vector<Generation> generations_;

  Position focus_{};
  TelemetrySink* sink_{nullptr};
};

} // namespace vsim
