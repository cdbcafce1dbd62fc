#include "vsim/snapshot.hpp"

#include <charconv>
#include <cmath>
#include <exception>
#include <fstream>
#include <iomanip>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "vsim/invariants.hpp"

namespace vsim {

namespace {

constexpr std::string_view kHeader =
  "id,age,education,income,region,urban,x,y,"
  "economic,social,immigration,environmental,confidence,volatility,last_updated,"
  "openness,conscientiousness,neuroticism,change_resistance,susceptibility,"
  "satisfaction,anxiety,anger,hope,"
  "influence,social_susceptibility,echo_chamber,diversity_exposure,"
  "tier,pinned";

constexpr std::size_t kColumns = 30;

std::vector<std::string_view> split(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  for (;;) {
    const auto pos = s.find(',', start);
    if (pos == std::string_view::npos) {
      out.push_back(s.substr(start));
      return out;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

template <class T>
bool parse_int(std::string_view s, T& out) {
  const auto* end = s.data() + s.size();
  auto [p, ec] = std::from_chars(s.data(), end, out);
  return ec == std::errc{} && p == end;
}

bool parse_float(std::string_view s, float& out) {
  // from_chars for floats is not everywhere yet; stof on a copy
  try {
    std::size_t used = 0;
    const std::string tmp(s);
    out = std::stof(tmp, &used);
    return used == tmp.size();
  } catch (const std::exception&) {
    return false;
  }
}

} // namespace

SnapshotResult save_snapshot_csv(const AgentStore& store, std::ostream& os) {
  SnapshotResult r{};
  os << std::setprecision(9) << kHeader << "\n";
  for (const auto& a : store.agents()) {
    const auto& d = a.demographics;
    const auto& o = a.opinion;
    const auto& b = a.behavior;
    const auto& s = a.social;
    const auto& rel = store.relevance(a.id);
    os << a.id << "," << int(d.age) << "," << int(d.education) << "," << int(d.income) << ","
       << int(d.region) << "," << (d.urban ? 1 : 0) << "," << d.position.x << "," << d.position.y << ",";
    for (const float v : o.axes) os << v << ",";
    os << o.confidence << "," << o.volatility << "," << o.last_updated << ","
       << b.openness << "," << b.conscientiousness << "," << b.neuroticism << ","
       << b.change_resistance << "," << b.susceptibility << ","
       << b.satisfaction << "," << b.anxiety << "," << b.anger << "," << b.hope << ","
       << s.influence << "," << s.susceptibility << "," << s.echo_chamber << "," << s.diversity_exposure << ","
       << tier_index(rel.tier) << "," << (rel.pinned ? 1 : 0) << "\n";
    ++r.rows;
  }
  r.ok = static_cast<bool>(os);
  if (!r.ok) r.error = "write failed";
  return r;
}

SnapshotResult save_snapshot_csv(const AgentStore& store, const std::string& path) {
  std::ofstream f(path);
  if (!f) {
    SnapshotResult r{};
    r.error = "cannot open " + path;
    return r;
  }
  return save_snapshot_csv(store, f);
}

SnapshotResult load_snapshot_csv(AgentStore& store, std::istream& is) {
  SnapshotResult r{};
  std::string line;
  if (!std::getline(is, line) || std::string_view(line) != kHeader) {
    r.line = 1;
    r.error = "missing or unexpected header";
    return r;
  }

  std::vector<std::pair<Agent, RelevanceState>> rows;
  std::size_t lineno = 1;
  auto fail = [&](std::string msg) {
    r.line = lineno;
    r.error = std::move(msg);
    return r;
  };

  while (std::getline(is, line)) {
    ++lineno;
    if (line.empty()) continue;
    const auto f = split(line);
    if (f.size() != kColumns) return fail("expected 30 columns");

    Agent a{};
    RelevanceState rel{};
    unsigned age = 0, edu = 0, inc = 0, region = 0, urban = 0, tier = 0, pinned = 0;
    uint32_t id = 0;
    Tick last = 0;
    auto& d = a.demographics;
    auto& o = a.opinion;
    auto& b = a.behavior;
    auto& s = a.social;

    const bool parsed =
      parse_int(f[0], id) && parse_int(f[1], age) && parse_int(f[2], edu) && parse_int(f[3], inc) &&
      parse_int(f[4], region) && parse_int(f[5], urban) &&
      parse_float(f[6], d.position.x) && parse_float(f[7], d.position.y) &&
      parse_float(f[8], o.axes[0]) && parse_float(f[9], o.axes[1]) &&
      parse_float(f[10], o.axes[2]) && parse_float(f[11], o.axes[3]) &&
      parse_float(f[12], o.confidence) && parse_float(f[13], o.volatility) && parse_int(f[14], last) &&
      parse_float(f[15], b.openness) && parse_float(f[16], b.conscientiousness) &&
      parse_float(f[17], b.neuroticism) && parse_float(f[18], b.change_resistance) &&
      parse_float(f[19], b.susceptibility) && parse_float(f[20], b.satisfaction) &&
      parse_float(f[21], b.anxiety) && parse_float(f[22], b.anger) && parse_float(f[23], b.hope) &&
      parse_float(f[24], s.influence) && parse_float(f[25], s.susceptibility) &&
      parse_float(f[26], s.echo_chamber) && parse_float(f[27], s.diversity_exposure) &&
      parse_int(f[28], tier) && parse_int(f[29], pinned);
    if (!parsed) return fail("malformed field");

    if (age < 18 || age > 99 || edu < 1 || edu > 5 || inc > 100 || region > 255 || urban > 1 ||
        tier >= kTierCount || pinned > 1) {
      return fail("demographic or tier value out of range");
    }
    d.age = static_cast<uint8_t>(age);
    d.education = static_cast<uint8_t>(edu);
    d.income = static_cast<uint8_t>(inc);
    d.region = static_cast<uint8_t>(region);
    d.urban = urban == 1;
    o.last_updated = last;
    if (!std::isfinite(d.position.x) || !std::isfinite(d.position.y)) return fail("non-finite position");
    if (!agent_in_bounds(a)) return fail("state value out of range");

    rel.tier = static_cast<Tier>(tier);
    rel.pinned = pinned == 1;
    rows.emplace_back(a, rel);
  }

  store.reserve(store.size() + rows.size());
  for (const auto& [a, rel] : rows) {
    const AgentId id = store.add(a, a.opinion.last_updated);
    store.relevance_mut(id).tier = rel.tier;
    store.relevance_mut(id).pinned = rel.pinned;
  }
  r.rows = rows.size();
  r.ok = true;
  return r;
}

SnapshotResult load_snapshot_csv(AgentStore& store, const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    SnapshotResult r{};
    r.error = "cannot open " + path;
    return r;
  }
  return load_snapshot_csv(store, f);
}

} // namespace vsim
