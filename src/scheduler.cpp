#include "vsim/scheduler.hpp"

#include <algorithm>
#include <utility>

namespace vsim {

namespace {

inline Tick since(const Agent& a, Tick tick) noexcept {
  return (tick > a.opinion.last_updated) ? tick - a.opinion.last_updated : 0;
}

} // namespace

bool TieredScheduler::config_valid() const noexcept {
  if (cfg_.low_sample_rate == 0 || cfg_.dormant_interval == 0 || cfg_.medium_interval == 0) return false;
  for (const Tick c : cfg_.staleness_ceiling) {
    if (c == 0) return false;
  }
  return true;
}

WorkingSet TieredScheduler::select(const AgentStore& store, Tick tick, std::size_t budget_override) const {
  if (!config_valid()) {
    auto ws = select_fallback(store, tick, budget_override);
    ws.degradation = Degradation::SchedulingFault;
    return ws;
  }

  WorkingSet ws{};
  ws.tick = tick;
  ws.budget = (budget_override > 0) ? budget_override : cfg_.budget;

  const std::size_t n = store.size();
  std::vector<uint8_t> chosen(n, 0);

  auto take_full = [&](AgentId id) {
    chosen[id] = 1;
    ws.full.push_back(id);
  };
  auto remaining = [&]() -> std::size_t {
    return (ws.full.size() < ws.budget) ? ws.budget - ws.full.size() : 0;
  };

  // 1) High tier and pinned agents: every tick.
  for (AgentId id = 0; id < n; ++id) {
    const auto& r = store.relevance(id);
    if (r.tier == Tier::High || r.pinned) take_full(id);
  }

  // 2) Medium: due ones, stalest first (round robin by age), ties by id.
  if (remaining() > 0) {
    std::vector<std::pair<Tick, AgentId>> due;
    for (AgentId id = 0; id < n; ++id) {
      if (chosen[id] || store.relevance(id).tier != Tier::Medium) continue;
      const Tick age = since(store[id], tick);
      if (age >= cfg_.medium_interval) due.emplace_back(age, id);
    }
    std::sort(due.begin(), due.end(), [](const auto& a, const auto& b) {
      if (a.first != b.first) return a.first > b.first;
      return a.second < b.second;
    });
    for (const auto& [age, id] : due) {
      if (remaining() == 0) break;
      take_full(id);
    }
  }

  // 3) Low: fixed 1-in-N sampling slot. The scan start rotates with the tick so
  // a tight budget does not always favour low ids.
  if (remaining() > 0 && n > 0) {
    const std::size_t start = static_cast<std::size_t>((tick * static_cast<Tick>(ws.budget)) % n);
    for (std::size_t k = 0; k < n && remaining() > 0; ++k) {
      const auto id = static_cast<AgentId>((start + k) % n);
      if (chosen[id] || store.relevance(id).tier != Tier::Low) continue;
      if ((static_cast<Tick>(id) + tick) % cfg_.low_sample_rate == 0) take_full(id);
    }
  }

  // 4) Dormant: cheap aging on a long interval; not charged to the budget.
  for (AgentId id = 0; id < n; ++id) {
    if (chosen[id] || store.relevance(id).tier != Tier::Dormant) continue;
    if (since(store[id], tick) >= cfg_.dormant_interval) {
      chosen[id] = 1;
      ws.aging.push_back(id);
    }
  }

  // 5) Staleness ceilings: force-include regardless of budget.
  for (AgentId id = 0; id < n; ++id) {
    if (chosen[id]) continue;
    const Tier t = store.relevance(id).tier;
    if (since(store[id], tick) < ceiling(t)) continue;
    chosen[id] = 1;
    ++ws.forced;
    if (t == Tier::Dormant) ws.aging.push_back(id);
    else ws.full.push_back(id);
  }

  std::sort(ws.full.begin(), ws.full.end());
  std::sort(ws.aging.begin(), ws.aging.end());
  ws.overflow = (ws.full.size() > ws.budget) ? ws.full.size() - ws.budget : 0;
  return ws;
}

WorkingSet TieredScheduler::select_fallback(const AgentStore& store, Tick tick, std::size_t budget_override) const {
  WorkingSet ws{};
  ws.tick = tick;
  ws.budget = (budget_override > 0) ? budget_override : cfg_.budget;
  ws.degradation = Degradation::SchedulingFault;

  const std::size_t n = store.size();
  if (n == 0 || ws.budget == 0) return ws;

  const std::size_t count = std::min(n, ws.budget);
  const std::size_t start = static_cast<std::size_t>((tick * static_cast<Tick>(ws.budget)) % n);

  ws.full.reserve(count);
  for (std::size_t k = 0; k < count; ++k) {
    ws.full.push_back(static_cast<AgentId>((start + k) % n));
  }
  std::sort(ws.full.begin(), ws.full.end());
  return ws;
}

} // namespace vsim
