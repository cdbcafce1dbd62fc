#include <gtest/gtest.h>

#include "vsim/result_cache.hpp"

namespace {

vsim::AnalysisResult result(float confidence) {
  vsim::AnalysisResult r{};
  r.confidence = confidence;
  r.target_axes = {1.0f, 2.0f, 3.0f, 4.0f};
  return r;
}

using vsim::Millis;

} // namespace

TEST(ResultCache, HitWithinTtlMissAfter) {
  vsim::CacheConfig cfg{};
  cfg.ttl = Millis{1000};
  vsim::ResultCache cache(cfg);

  EXPECT_FALSE(cache.lookup(7, Millis{0}).has_value());
  cache.insert(7, result(0.8f), Millis{100});

  auto hit = cache.lookup(7, Millis{1099});
  ASSERT_TRUE(hit.has_value());
  EXPECT_FLOAT_EQ(hit->confidence, 0.8f);
  EXPECT_EQ(hit->target_axes, result(0.8f).target_axes);

  // expired exactly at ttl, and never served afterwards
  EXPECT_FALSE(cache.lookup(7, Millis{1100}).has_value());
  EXPECT_EQ(cache.size(), 0u);

  const auto& s = cache.stats();
  EXPECT_EQ(s.hits, 1u);
  EXPECT_EQ(s.misses, 2u);
  EXPECT_EQ(s.expired, 1u);
  EXPECT_NEAR(s.hit_ratio(), 1.0 / 3.0, 1e-9);
}

TEST(ResultCache, EvictsLeastRecentlyUsed) {
  vsim::CacheConfig cfg{};
  cfg.capacity = 2;
  vsim::ResultCache cache(cfg);

  cache.insert(1, result(0.1f), Millis{0});
  cache.insert(2, result(0.2f), Millis{0});
  ASSERT_TRUE(cache.lookup(1, Millis{1}).has_value());  // 2 is now least recent
  cache.insert(3, result(0.3f), Millis{2});

  EXPECT_EQ(cache.size(), 2u);
  EXPECT_TRUE(cache.contains_fresh(1, Millis{3}));
  EXPECT_FALSE(cache.contains_fresh(2, Millis{3}));
  EXPECT_TRUE(cache.contains_fresh(3, Millis{3}));
  EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST(ResultCache, ReinsertRefreshesTimestamp) {
  vsim::CacheConfig cfg{};
  cfg.ttl = Millis{100};
  vsim::ResultCache cache(cfg);

  cache.insert(5, result(0.1f), Millis{0});
  cache.insert(5, result(0.9f), Millis{90});
  auto r = cache.lookup(5, Millis{150});
  ASSERT_TRUE(r.has_value());
  EXPECT_FLOAT_EQ(r->confidence, 0.9f);
  EXPECT_EQ(cache.size(), 1u);
}

TEST(ResultCache, EraseAndClear) {
  vsim::ResultCache cache;
  cache.insert(1, result(0.5f), Millis{0});
  cache.insert(2, result(0.5f), Millis{0});
  EXPECT_TRUE(cache.erase(1));
  EXPECT_FALSE(cache.erase(1));
  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(cache.contains_fresh(2, Millis{0}));
}
