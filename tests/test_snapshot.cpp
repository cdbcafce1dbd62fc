#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <string>

#include "vsim/population.hpp"
#include "vsim/snapshot.hpp"

TEST(Snapshot, SavedPopulationLoadsBack) {
  vsim::AgentStore src;
  vsim::seed_population(src, 50, 5);
  src.relevance_mut(3).tier = vsim::Tier::High;
  src.pin(4);
  src[7].opinion.last_updated = 900;

  std::stringstream buf;
  const auto saved = vsim::save_snapshot_csv(src, buf);
  ASSERT_TRUE(saved.ok);
  EXPECT_EQ(saved.rows, 50u);

  vsim::AgentStore dst;
  const auto loaded = vsim::load_snapshot_csv(dst, buf);
  ASSERT_TRUE(loaded.ok) << loaded.error << " at line " << loaded.line;
  ASSERT_EQ(dst.size(), 50u);

  EXPECT_EQ(dst.tier(3), vsim::Tier::High);
  EXPECT_TRUE(dst.is_pinned(4));
  EXPECT_EQ(dst[7].opinion.last_updated, 900u);
  for (vsim::AgentId id = 0; id < 50; ++id) {
    EXPECT_EQ(dst[id].demographics.age, src[id].demographics.age);
    EXPECT_EQ(dst[id].demographics.urban, src[id].demographics.urban);
    EXPECT_EQ(dst[id].opinion.axes, src[id].opinion.axes);
    EXPECT_EQ(dst[id].behavior.change_resistance, src[id].behavior.change_resistance);
  }
}

TEST(Snapshot, RejectsUnknownHeader) {
  std::istringstream in("id,age\n0,40\n");
  vsim::AgentStore store;
  const auto r = vsim::load_snapshot_csv(store, in);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.line, 1u);
  EXPECT_EQ(store.size(), 0u);
}

TEST(Snapshot, BadRowLeavesStoreUntouched) {
  vsim::AgentStore src;
  vsim::seed_population(src, 3, 1);
  std::stringstream buf;
  ASSERT_TRUE(vsim::save_snapshot_csv(src, buf).ok);

  // age 7 on the second data row
  std::string text = buf.str();
  std::istringstream lines(text);
  std::string header, row1, row2, row3;
  std::getline(lines, header);
  std::getline(lines, row1);
  std::getline(lines, row2);
  std::getline(lines, row3);
  const auto first_comma = row2.find(',');
  const auto second_comma = row2.find(',', first_comma + 1);
  row2.replace(first_comma + 1, second_comma - first_comma - 1, "7");

  std::istringstream in(header + "\n" + row1 + "\n" + row2 + "\n" + row3 + "\n");
  vsim::AgentStore store;
  const auto r = vsim::load_snapshot_csv(store, in);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.line, 3u);
  EXPECT_EQ(store.size(), 0u);
}

TEST(Snapshot, RejectsOutOfRangeOpinion) {
  vsim::AgentStore src;
  vsim::seed_population(src, 1, 1);
  src[0].opinion.confidence = 1.5f;
  std::stringstream buf;
  ASSERT_TRUE(vsim::save_snapshot_csv(src, buf).ok);

  vsim::AgentStore store;
  const auto r = vsim::load_snapshot_csv(store, buf);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.line, 2u);
}

TEST(Snapshot, RejectsNonFinitePosition) {
  for (const float bad : {std::numeric_limits<float>::quiet_NaN(), std::numeric_limits<float>::infinity()}) {
    vsim::AgentStore src;
    vsim::seed_population(src, 2, 3);
    src[1].demographics.position.y = bad;
    std::stringstream buf;
    ASSERT_TRUE(vsim::save_snapshot_csv(src, buf).ok);

    vsim::AgentStore store;
    const auto r = vsim::load_snapshot_csv(store, buf);
    EXPECT_FALSE(r.ok) << "position y " << bad;
    EXPECT_EQ(r.line, 3u);
    EXPECT_EQ(store.size(), 0u);
  }
}
