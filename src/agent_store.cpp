#include "vsim/agent_store.hpp"

#include <cassert>
#include <string>

namespace vsim {

void AgentStore::reserve(std::size_t n) {
  agents_.reserve(n);
  relevance_.reserve(n);
  generations_.reserve(n);
}

AgentId AgentStore::add(const Demographics& d, Tick now) {
  Agent a{};
  a.demographics = d;
  return add(a, now);
}

AgentId AgentStore::add(Agent a, Tick now) {
  const auto id = static_cast<AgentId>(agents_.size());
  a.id = id;
  a.opinion.last_updated = now;
  agents_.push_back(a);
  relevance_.push_back(RelevanceState{});
  generations_.push_back(0);
  return id;
}

bool AgentStore::recycle(AgentId id, const Demographics& d, Tick now) {
  if (!contains(id)) {
    fault_(id, "recycle");
    return false;
  }
  Agent fresh{};
  fresh.id = id;
  fresh.demographics = d;
  fresh.opinion.last_updated = now;
  agents_[id] = fresh;
  relevance_[id] = RelevanceState{};
  ++generations_[id];
  return true;
}

const Agent* AgentStore::find(AgentId id) const {
  if (!contains(id)) {
    fault_(id, "find");
    return nullptr;
  }
  return &agents_[id];
}

Agent* AgentStore::find_mut(AgentId id) {
  if (!contains(id)) {
    fault_(id, "find_mut");
    return nullptr;
  }
  return &agents_[id];
}

bool AgentStore::pin(AgentId id, bool pinned) {
  if (!contains(id)) {
    fault_(id, "pin");
    return false;
  }
  relevance_[id].pinned = pinned;
  return true;
}

std::vector<AgentId> AgentStore::ids_in_tier(Tier t) const {
  std::vector<AgentId> out;
  for (AgentId id = 0; id < agents_.size(); ++id) {
    if (relevance_[id].tier == t) out.push_back(id);
  }
  return out;
}

TierCounts AgentStore::tier_counts() const noexcept {
  TierCounts c{};
  for (const auto& r : relevance_) ++c[tier_index(r.tier)];
  return c;
}

void AgentStore::fault_(AgentId id, std::string_view op) const {
  // Programming fault: abort in debug builds, log and let the caller skip otherwise.
  assert(false && "agent id out of range");
  if (sink_) {
    std::string msg = "agent store: ";
    msg += op;
    msg += " with out-of-range id ";
    msg += std::to_string(id);
    msg += " (size ";
    msg += std::to_string(agents_.size());
    msg += ")";
    sink_->log(LogLevel::Error, msg);
  }
}

} // namespace vsim
