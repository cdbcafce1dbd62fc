#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>

#include "vsim/agent_store.hpp"

namespace vsim {

struct SnapshotResult {
  bool ok{false};
  std::size_t rows{0};
  std::size_t line{0};   // 1-based line of the first error
  std::string error{};
};

// One CSV row per agent: demographics, opinion, traits, social summary and
// relevance state. Generations and pending analyses are not saved.
SnapshotResult save_snapshot_csv(const AgentStore& store, std::ostream& os);
SnapshotResult save_snapshot_csv(const AgentStore& store, const std::string& path);

// Appends the rows to `store` (ids are reassigned in file order). Rows with
// out-of-range values are rejected; nothing is added after the first bad row.
SnapshotResult load_snapshot_csv(AgentStore& store, std::istream& is);
SnapshotResult load_snapshot_csv(AgentStore& store, const std::string& path);

} // namespace vsim
