#pragma once
#include <cstdint>
#include <map>
#include <vector>

#include "vsim/agent.hpp"
#include "vsim/types.hpp"

namespace vsim {

// Which agents an event reaches; inclusive ranges.
struct DemographicFilter {
  uint8_t min_age{0};
  uint8_t max_age{255};
  uint8_t min_education{0};
  uint8_t max_education{255};
  uint8_t min_income{0};
  uint8_t max_income{255};
  bool    urban_only{false};
  bool    rural_only{false};
};

inline constexpr bool matches(const DemographicFilter& f, const Demographics& d) noexcept {
  if (d.age < f.min_age || d.age > f.max_age) return false;
  if (d.education < f.min_education || d.education > f.max_education) return false;
  if (d.income < f.min_income || d.income > f.max_income) return false;
  if (f.urban_only && !d.urban) return false;
  if (f.rural_only && d.urban) return false;
  return true;
}

struct ActiveEvent {
  uint32_t id{};
  Axis     axis{Axis::Economic};
  float    target{0.0f};      // axis position the event pulls toward
  float    intensity{0.0f};   // [0, 1]
  DemographicFilter filter{};
};

// Supplies the read-only active event list for a tick.
class EventSource {
public:
  virtual ~EventSource() = default;
  virtual std::vector<ActiveEvent> active_events(Tick tick) = 0;
};

class NoEvents final : public EventSource {
public:
  std::vector<ActiveEvent> active_events(Tick) override { return {}; }
};

// Events active in [start, end) ticks.
class ScriptedEventSource final : public EventSource {
public:
  void add(Tick start, Tick end, ActiveEvent ev) { script_.emplace(start, Entry{end, ev}); }

  std::vector<ActiveEvent> active_events(Tick tick) override {
    std::vector<ActiveEvent> out;
    for (auto it = script_.begin(); it != script_.end() && it->first <= tick; ++it) {
      if (tick < it->second.end) out.push_back(it->second.ev);
    }
    return out;
  }

private:
  struct Entry {
    Tick end{};
    ActiveEvent ev{};
  };
  std::multimap<Tick, Entry> script_;
};

} // namespace vsim
