#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "vsim/analysis_service.hpp"
#include "vsim/circuit_breaker.hpp"
#include "vsim/clusterer.hpp"
#include "vsim/result_cache.hpp"
#include "vsim/telemetry.hpp"
#include "vsim/types.hpp"

namespace vsim {

class WorkerPool;

struct GatewayConfig {
  std::size_t max_batch{50};
  Millis batch_window{Millis{100}};
  Millis call_timeout{Millis{5'000}};

  // Bounded concurrency of external calls; 0 runs calls inline on the polling
  // thread (results still surface on the next poll).
  std::size_t worker_threads{3};

  CacheConfig cache{};
  CircuitConfig circuit{};
};

enum class TicketState : uint8_t { Collecting = 0, Dispatched = 1, Resolved = 2, Failed = 3, Cancelled = 4 };

inline std::string_view to_string(TicketState s) noexcept {
  switch (s) {
    case TicketState::Collecting: return "collecting";
    case TicketState::Dispatched: return "dispatched";
    case TicketState::Resolved:   return "resolved";
    case TicketState::Failed:     return "failed";
    case TicketState::Cancelled:  return "cancelled";
  }
  return "?";
}

// Future-like handle for one submitted cohort. Failed tickets still carry a
// (fallback) result; nothing is left unresolved.
class CohortTicket {
public:
  explicit CohortTicket(Cohort c) : cohort_(std::move(c)) {}

  TicketState state() const noexcept { return state_.load(std::memory_order_acquire); }
  bool ready() const noexcept {
    const auto s = state();
    return s == TicketState::Resolved || s == TicketState::Failed;
  }
  bool cancelled() const noexcept { return state() == TicketState::Cancelled; }

  // Cancelled tickets never deliver. No effect once ready.
  void cancel() noexcept;

  const Cohort& cohort() const noexcept { return cohort_; }
  const AnalysisResult& result() const noexcept { return result_; }
  bool from_cache() const noexcept { return from_cache_; }
  Degradation degradation() const noexcept { return degradation_; }

private:
  friend class AnalysisGateway;

  bool settle_(TicketState s, const AnalysisResult& r, Degradation d, bool cached) noexcept;

  Cohort cohort_;
  AnalysisResult result_{};
  Degradation degradation_{Degradation::None};
  bool from_cache_{false};
  std::atomic<TicketState> state_{TicketState::Collecting};
};

using CohortHandle = std::shared_ptr<CohortTicket>;

struct GatewayStats {
  uint64_t submitted{0};
  uint64_t cancelled{0};
  uint64_t cache_hits{0};
  uint64_t cache_misses{0};
  uint64_t coalesced{0};           // misses that shared an item with an equal key
  uint64_t batches_dispatched{0};
  uint64_t external_calls{0};
  uint64_t items_sent{0};
  uint64_t members_served{0};      // agents covered by resolved tickets
  uint64_t failures{0};            // failed external calls (incl. timeouts)
  uint64_t timeouts{0};
  uint64_t short_circuited{0};     // batches answered by fallback, circuit open
  uint64_t fallback_resolutions{0};
  std::size_t last_batch_size{0};
  uint64_t batched_total{0};

  double cache_hit_ratio() const noexcept {
    const uint64_t t = cache_hits + cache_misses;
    return t ? static_cast<double>(cache_hits) / static_cast<double>(t) : 0.0;
  }
  double mean_batch_size() const noexcept {
    return batches_dispatched ? static_cast<double>(batched_total) / static_cast<double>(batches_dispatched) : 0.0;
  }
  // Agents served per external item; > 1 means cohorts/caching saved calls.
  double batching_efficiency() const noexcept {
    return items_sent ? static_cast<double>(members_served) / static_cast<double>(items_sent) : 0.0;
  }
};

// Batches cohort requests, answers from cache where possible, calls the external
// service on a bounded pool and falls back when the circuit is open or a call
// fails. submit() and poll() belong to one thread (the simulation thread), which
// is the only writer of the cache and circuit state; workers only run calls and
// post completions.
class AnalysisGateway {
public:
  AnalysisGateway(AnalysisService& service, GatewayConfig cfg = {}, TelemetrySink* sink = nullptr);
  ~AnalysisGateway();

  AnalysisGateway(const AnalysisGateway&) = delete;
  AnalysisGateway& operator=(const AnalysisGateway&) = delete;

  // Non-blocking. Joins the collecting batch; a full batch dispatches at once.
  CohortHandle submit(Cohort cohort, Millis now);

  // Drives the state machine: applies completions, call timeouts and the
  // collection window. Returns tickets that became ready since the last poll
  // (cancelled ones excluded).
  std::vector<CohortHandle> poll(Millis now);

  // Dispatch whatever is collecting regardless of the window.
  void flush(Millis now);

  std::size_t collecting() const noexcept { return collecting_.size(); }
  std::size_t in_flight() const noexcept { return in_flight_.size(); }

  const GatewayStats& stats() const noexcept { return stats_; }
  const GatewayConfig& config() const noexcept { return cfg_; }
  CircuitState circuit_state() const noexcept { return breaker_.state(); }
  const CircuitBreaker& breaker() const noexcept { return breaker_; }
  const ResultCache& cache() const noexcept { return cache_; }

private:
  struct InFlight {
    uint64_t id{};
    Millis dispatched{};
    bool trial{false};  // the single half-open probe of the circuit
    std::vector<AnalysisItem> items;
    std::vector<std::vector<CohortHandle>> waiting;  // per item
  };

  struct Completion {
    uint64_t batch_id{};
    ServiceReply reply{};
  };

  void dispatch_(Millis now);
  void apply_completions_(Millis now);
  void apply_timeouts_(Millis now);
  void succeed_(InFlight& b, ServiceReply& reply, Millis now);
  void fail_(InFlight& b, Degradation why, std::string_view detail, Millis now);
  void settle_(const CohortHandle& t, TicketState s, const AnalysisResult& r, Degradation d, bool cached);
  void log_(LogLevel level, std::string_view msg) const;

  AnalysisService& service_;
  GatewayConfig cfg_;
  TelemetrySink* sink_{nullptr};

  ResultCache cache_;
  CircuitBreaker breaker_;
  GatewayStats stats_{};

  std::vector<CohortHandle> collecting_;
  Millis window_opened_{0};

  uint64_t next_batch_id_{1};
  std::map<uint64_t, InFlight> in_flight_;

  std::mutex done_mu_;
  std::deque<Completion> done_;

  std::vector<CohortHandle> ready_;

  // declared last: destroyed first, joining workers before the queues go away
  std::unique_ptr<WorkerPool> pool_;
};

} // namespace vsim
