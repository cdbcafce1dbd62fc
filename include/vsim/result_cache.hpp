#pragma once
#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <unordered_map>

#include "vsim/analysis_service.hpp"
#include "vsim/types.hpp"

namespace vsim {

struct CacheConfig {
  std::size_t capacity{500};
  Millis ttl{Millis{60'000}};
};

struct CacheStats {
  uint64_t hits{0};
  uint64_t misses{0};
  uint64_t expired{0};     // lookups that found an entry past its TTL
  uint64_t evictions{0};   // LRU evictions above capacity

  double hit_ratio() const noexcept {
    const uint64_t total = hits + misses;
    return total ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
  }
};

// Fixed-TTL result cache with LRU eviction. Expiry is lazy: an entry past its TTL
// is dropped when looked up and reported as a miss; it is never served.
// Not thread-safe; the gateway's polling thread is its only user.
class ResultCache {
public:
  ResultCache() = default;
  explicit ResultCache(CacheConfig cfg) : cfg_(cfg) {}

  const CacheConfig& config() const noexcept { return cfg_; }

  std::optional<AnalysisResult> lookup(CacheKey key, Millis now);

  // Lookup without touching stats or recency.
  bool contains_fresh(CacheKey key, Millis now) const noexcept;

  void insert(CacheKey key, const AnalysisResult& result, Millis now);
  bool erase(CacheKey key) noexcept;
  void clear() noexcept;

  std::size_t size() const noexcept { return loc_.size(); }
  const CacheStats& stats() const noexcept { return stats_; }

private:
  struct Entry {
    CacheKey key{};
    AnalysisResult result{};
    Millis created{};
  };

  using Lru = std::list<Entry>;  // front = most recently used

  bool expired_(const Entry& e, Millis now) const noexcept { return now - e.created >= cfg_.ttl; }
  void evict_over_capacity_();

  CacheConfig cfg_{};
  Lru lru_;
  std::unordered_map<CacheKey, Lru::iterator> loc_;
  CacheStats stats_{};
};

} // namespace vsim
