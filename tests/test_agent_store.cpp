#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "vsim/agent_store.hpp"
#include "vsim/telemetry.hpp"

namespace {

class CaptureSink final : public vsim::TelemetrySink {
public:
  void log(vsim::LogLevel level, std::string_view msg) override {
    levels.push_back(level);
    lines.emplace_back(msg);
  }
  std::vector<vsim::LogLevel> levels;
  std::vector<std::string> lines;
};

} // namespace

TEST(AgentStore, AddAssignsSequentialIdsAndStartsLow) {
  vsim::AgentStore store;
  vsim::Demographics d{};
  d.age = 30;

  const auto a = store.add(d, 5);
  const auto b = store.add(d, 5);

  EXPECT_EQ(a, 0u);
  EXPECT_EQ(b, 1u);
  EXPECT_EQ(store.size(), 2u);
  EXPECT_EQ(store[b].id, b);
  EXPECT_EQ(store[a].opinion.last_updated, 5u);
  EXPECT_EQ(store.tier(a), vsim::Tier::Low);
  EXPECT_EQ(store.generation(a), 0u);
}

TEST(AgentStore, AddIgnoresIncomingId) {
  vsim::AgentStore store;
  vsim::Agent a{};
  a.id = 77;
  const auto id = store.add(a);
  EXPECT_EQ(id, 0u);
  EXPECT_EQ(store[id].id, 0u);
}

TEST(AgentStore, RecycleBumpsGenerationAndResetsState) {
  vsim::AgentStore store;
  const auto id = store.add(vsim::Demographics{}, 0);
  store.relevance_mut(id).tier = vsim::Tier::High;
  store.relevance_mut(id).analysis_boost = 0.9f;
  ASSERT_TRUE(store.pin(id));
  store[id].opinion.axes[0] = 60.0f;

  vsim::Demographics d{};
  d.age = 71;
  ASSERT_TRUE(store.recycle(id, d, 42));

  EXPECT_EQ(store.generation(id), 1u);
  EXPECT_EQ(store[id].demographics.age, 71);
  EXPECT_EQ(store[id].opinion.axes[0], 0.0f);
  EXPECT_EQ(store[id].opinion.last_updated, 42u);
  EXPECT_EQ(store.tier(id), vsim::Tier::Low);
  EXPECT_FALSE(store.is_pinned(id));
  EXPECT_EQ(store.relevance(id).analysis_boost, 0.0f);
}

TEST(AgentStore, TierCountsPartitionThePopulation) {
  vsim::AgentStore store;
  for (int i = 0; i < 10; ++i) store.add(vsim::Demographics{});
  store.relevance_mut(0).tier = vsim::Tier::Dormant;
  store.relevance_mut(1).tier = vsim::Tier::High;
  store.relevance_mut(2).tier = vsim::Tier::Medium;
  store.relevance_mut(3).tier = vsim::Tier::Medium;

  const auto c = store.tier_counts();
  EXPECT_EQ(c[vsim::tier_index(vsim::Tier::Dormant)], 1u);
  EXPECT_EQ(c[vsim::tier_index(vsim::Tier::Low)], 6u);
  EXPECT_EQ(c[vsim::tier_index(vsim::Tier::Medium)], 2u);
  EXPECT_EQ(c[vsim::tier_index(vsim::Tier::High)], 1u);

  const auto medium = store.ids_in_tier(vsim::Tier::Medium);
  ASSERT_EQ(medium.size(), 2u);
  EXPECT_EQ(medium[0], 2u);
  EXPECT_EQ(medium[1], 3u);

  std::size_t seen = 0;
  store.for_each_in_tier(vsim::Tier::Low, [&](const vsim::Agent&) { ++seen; });
  EXPECT_EQ(seen, 6u);
}

TEST(AgentStore, OutOfRangeIdIsAProgrammingFault) {
  vsim::AgentStore store;
  store.add(vsim::Demographics{});

  EXPECT_FALSE(store.contains(1));
  EXPECT_EQ(store.tier(1), vsim::Tier::Dormant);
  EXPECT_DEBUG_DEATH(store.find(1), "");
}

#ifdef NDEBUG
TEST(AgentStore, OutOfRangeIdIsLoggedAndSkippedInRelease) {
  CaptureSink sink;
  vsim::AgentStore store(&sink);
  store.add(vsim::Demographics{});

  EXPECT_EQ(store.find(3), nullptr);
  EXPECT_FALSE(store.pin(3));
  EXPECT_FALSE(store.recycle(3, vsim::Demographics{}, 0));

  ASSERT_EQ(sink.lines.size(), 3u);
  EXPECT_EQ(sink.levels[0], vsim::LogLevel::Error);
  EXPECT_NE(sink.lines[0].find("out-of-range id 3"), std::string::npos);
}
#endif
