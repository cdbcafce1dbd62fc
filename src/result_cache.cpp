#include "vsim/result_cache.hpp"

namespace vsim {

std::optional<AnalysisResult> ResultCache::lookup(CacheKey key, Millis now) {
  auto it = loc_.find(key);
  if (it == loc_.end()) {
    ++stats_.misses;
    return std::nullopt;
  }
  if (expired_(*it->second, now)) {
    lru_.erase(it->second);
    loc_.erase(it);
    ++stats_.expired;
    ++stats_.misses;
    return std::nullopt;
  }
  lru_.splice(lru_.begin(), lru_, it->second);
  ++stats_.hits;
  return it->second->result;
}

bool ResultCache::contains_fresh(CacheKey key, Millis now) const noexcept {
  auto it = loc_.find(key);
  return it != loc_.end() && !expired_(*it->second, now);
}

void ResultCache::insert(CacheKey key, const AnalysisResult& result, Millis now) {
  if (cfg_.capacity == 0) return;
  auto it = loc_.find(key);
  if (it != loc_.end()) {
    it->second->result = result;
    it->second->created = now;
    lru_.splice(lru_.begin(), lru_, it->second);
    return;
  }
  lru_.push_front(Entry{key, result, now});
  loc_[key] = lru_.begin();
  evict_over_capacity_();
}

bool ResultCache::erase(CacheKey key) noexcept {
  auto it = loc_.find(key);
  if (it == loc_.end()) return false;
  lru_.erase(it->second);
  loc_.erase(it);
  return true;
}

void ResultCache::clear() noexcept {
  lru_.clear();
  loc_.clear();
}

void ResultCache::evict_over_capacity_() {
  while (loc_.size() > cfg_.capacity && !lru_.empty()) {
    loc_.erase(lru_.back().key);
    lru_.pop_back();
    ++stats_.evictions;
  }
}

} // namespace vsim
