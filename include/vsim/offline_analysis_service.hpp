#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

#include "vsim/analysis_service.hpp"

namespace vsim {

struct OfflineServiceConfig {
  // How far the predicted position leans toward the demographic prior, [0, 1].
  float prior_weight{0.3f};
  // Simulated round trip; zero answers immediately.
  Millis latency{Millis{0}};
};

// Rule-based stand-in for the external service. Answers are a pure function of
// the item, so equal items always get equal results. Failures can be injected
// for drills and tests.
class OfflineAnalysisService final : public AnalysisService {
public:
  OfflineAnalysisService() = default;
  explicit OfflineAnalysisService(OfflineServiceConfig cfg) : cfg_(cfg) {}

  ServiceReply analyze(std::span<const AnalysisItem> batch, Millis deadline) override;
  std::string_view name() const noexcept override { return "offline"; }

  // Every call fails while unavailable.
  void set_available(bool on) noexcept { available_.store(on, std::memory_order_relaxed); }
  // The next n calls fail, then the service recovers on its own.
  void fail_next(uint32_t n) noexcept { fail_next_.store(n, std::memory_order_relaxed); }
  // Drop the last result of every reply (count mismatch).
  void set_truncate_replies(bool on) noexcept { truncate_.store(on, std::memory_order_relaxed); }

  uint64_t calls() const noexcept { return calls_.load(std::memory_order_relaxed); }
  uint64_t items_seen() const noexcept { return items_.load(std::memory_order_relaxed); }
  std::vector<std::size_t> batch_sizes() const;

  // Deterministic analysis of a single item.
  static AnalysisResult evaluate(const AnalysisItem& item, float prior_weight) noexcept;

private:
  bool take_failure_() noexcept;

  OfflineServiceConfig cfg_{};
  std::atomic<bool> available_{true};
  std::atomic<bool> truncate_{false};
  std::atomic<uint32_t> fail_next_{0};
  std::atomic<uint64_t> calls_{0};
  std::atomic<uint64_t> items_{0};

  mutable std::mutex mu_;
  std::vector<std::size_t> sizes_;
};

} // namespace vsim
