#include "vsim/gateway.hpp"

#include <exception>
#include <sstream>
#include <string>
#include <utility>

#include "vsim/worker_pool.hpp"

namespace vsim {

void CohortTicket::cancel() noexcept {
  auto s = state_.load(std::memory_order_acquire);
  while (s == TicketState::Collecting || s == TicketState::Dispatched) {
    if (state_.compare_exchange_weak(s, TicketState::Cancelled, std::memory_order_acq_rel)) return;
  }
}

bool CohortTicket::settle_(TicketState s, const AnalysisResult& r, Degradation d, bool cached) noexcept {
  auto cur = state_.load(std::memory_order_acquire);
  if (cur != TicketState::Collecting && cur != TicketState::Dispatched) return false;
  // result fields are written before the state is published
  result_ = r;
  degradation_ = d;
  from_cache_ = cached;
  return state_.compare_exchange_strong(cur, s, std::memory_order_acq_rel);
}

AnalysisGateway::AnalysisGateway(AnalysisService& service, GatewayConfig cfg, TelemetrySink* sink)
  : service_(service),
    cfg_(cfg),
    sink_(sink),
    cache_(cfg.cache),
    breaker_(cfg.circuit),
    pool_(std::make_unique<WorkerPool>(cfg.worker_threads)) {
  if (cfg_.max_batch == 0) cfg_.max_batch = 1;
}

AnalysisGateway::~AnalysisGateway() {
  // join workers before in_flight_ and done_ are torn down
  pool_.reset();
}

CohortHandle AnalysisGateway::submit(Cohort cohort, Millis now) {
  auto t = std::make_shared<CohortTicket>(std::move(cohort));
  ++stats_.submitted;

  if (collecting_.empty()) window_opened_ = now;
  collecting_.push_back(t);
  if (collecting_.size() >= cfg_.max_batch) dispatch_(now);
  return t;
}

std::vector<CohortHandle> AnalysisGateway::poll(Millis now) {
  apply_completions_(now);
  apply_timeouts_(now);
  if (!collecting_.empty() && now - window_opened_ >= cfg_.batch_window) dispatch_(now);
  // an inline pool finishes the call inside dispatch_
  apply_completions_(now);

  std::vector<CohortHandle> out;
  out.swap(ready_);
  return out;
}

void AnalysisGateway::flush(Millis now) {
  if (!collecting_.empty()) dispatch_(now);
}

void AnalysisGateway::dispatch_(Millis now) {
  std::vector<CohortHandle> batch;
  batch.swap(collecting_);

  InFlight b;
  b.id = next_batch_id_++;
  b.dispatched = now;

  std::unordered_map<CacheKey, std::size_t> item_of;
  std::size_t live = 0;

  for (auto& t : batch) {
    if (t->cancelled()) {
      ++stats_.cancelled;
      continue;
    }
    ++live;
    const Cohort& c = t->cohort();
    if (auto hit = cache_.lookup(c.key, now)) {
      ++stats_.cache_hits;
      settle_(t, TicketState::Resolved, *hit, Degradation::None, true);
      continue;
    }
    ++stats_.cache_misses;

    auto it = item_of.find(c.key);
    if (it != item_of.end()) {
      ++stats_.coalesced;
      b.waiting[it->second].push_back(t);
      continue;
    }
    item_of.emplace(c.key, b.items.size());
    b.items.push_back(AnalysisItem{c.key, c.kind, c.features});
    b.waiting.push_back({t});
  }

  if (live == 0) return;
  ++stats_.batches_dispatched;
  stats_.last_batch_size = live;
  stats_.batched_total += live;

  if (b.items.empty()) return;

  if (!breaker_.try_acquire(now)) {
    ++stats_.short_circuited;
    for (std::size_t i = 0; i < b.items.size(); ++i) {
      const AnalysisResult fb = fallback_result(b.items[i]);
      for (auto& t : b.waiting[i]) settle_(t, TicketState::Failed, fb, Degradation::ExternalFailure, false);
    }
    return;
  }
  b.trial = breaker_.state() == CircuitState::HalfOpen;

  for (auto& w : b.waiting) {
    for (auto& t : w) {
      auto s = TicketState::Collecting;
      // lost race means cancelled; left in place and skipped on settle
      t->state_.compare_exchange_strong(s, TicketState::Dispatched, std::memory_order_acq_rel);
    }
  }

  ++stats_.external_calls;
  stats_.items_sent += b.items.size();

  const uint64_t id = b.id;
  auto items = b.items;
  in_flight_.emplace(id, std::move(b));

  const Millis deadline = cfg_.call_timeout;
  pool_->enqueue([this, id, items = std::move(items), deadline]() {
    Completion c;
    c.batch_id = id;
    try {
      c.reply = service_.analyze(items, deadline);
    } catch (const std::exception& e) {
      c.reply.ok = false;
      c.reply.error = e.what();
    }
    std::lock_guard<std::mutex> lk(done_mu_);
    done_.push_back(std::move(c));
  });
}

void AnalysisGateway::apply_completions_(Millis now) {
  std::deque<Completion> done;
  {
    std::lock_guard<std::mutex> lk(done_mu_);
    done.swap(done_);
  }
  for (auto& c : done) {
    auto it = in_flight_.find(c.batch_id);
    if (it == in_flight_.end()) {
      // already timed out and resolved to fallback
      log_(LogLevel::Debug, "late reply for batch " + std::to_string(c.batch_id) + " ignored");
      continue;
    }
    if (!c.reply.ok) {
      fail_(it->second, Degradation::ExternalFailure, c.reply.error, now);
    } else if (c.reply.results.size() != it->second.items.size()) {
      std::ostringstream os;
      os << "expected " << it->second.items.size() << " results, got " << c.reply.results.size();
      fail_(it->second, Degradation::ExternalFailure, os.str(), now);
    } else {
      succeed_(it->second, c.reply, now);
    }
    in_flight_.erase(it);
  }
}

void AnalysisGateway::apply_timeouts_(Millis now) {
  for (auto it = in_flight_.begin(); it != in_flight_.end();) {
    if (now - it->second.dispatched >= cfg_.call_timeout) {
      ++stats_.timeouts;
      fail_(it->second, Degradation::Timeout, "call timed out", now);
      it = in_flight_.erase(it);
    } else {
      ++it;
    }
  }
}

void AnalysisGateway::succeed_(InFlight& b, ServiceReply& reply, Millis now) {
  const auto before = breaker_.state();
  breaker_.record_success(b.trial);
  if (before != CircuitState::Closed && breaker_.state() == CircuitState::Closed) {
    log_(LogLevel::Info, "circuit closed after successful trial");
  }
  for (std::size_t i = 0; i < b.items.size(); ++i) {
    AnalysisResult& r = reply.results[i];
    r.kind = b.items[i].kind;
    r.degraded = false;
    cache_.insert(b.items[i].key, r, now);
    for (auto& t : b.waiting[i]) settle_(t, TicketState::Resolved, r, Degradation::None, false);
  }
}

void AnalysisGateway::fail_(InFlight& b, Degradation why, std::string_view detail, Millis now) {
  ++stats_.failures;
  const auto before = breaker_.state();
  breaker_.record_failure(now, b.trial);
  if (before != CircuitState::Open && breaker_.state() == CircuitState::Open) {
    log_(LogLevel::Warn, "circuit opened after " + std::to_string(breaker_.consecutive_failures()) +
                             " consecutive failures");
  }

  std::ostringstream os;
  os << "batch " << b.id << " failed (" << to_string(why) << "): " << detail;
  log_(LogLevel::Warn, os.str());

  for (std::size_t i = 0; i < b.items.size(); ++i) {
    const AnalysisResult fb = fallback_result(b.items[i]);
    for (auto& t : b.waiting[i]) settle_(t, TicketState::Failed, fb, why, false);
  }
}

void AnalysisGateway::settle_(const CohortHandle& t, TicketState s, const AnalysisResult& r,
                              Degradation d, bool cached) {
  if (!t->settle_(s, r, d, cached)) {
    if (t->cancelled()) ++stats_.cancelled;
    return;
  }
  if (s == TicketState::Failed) ++stats_.fallback_resolutions;
  stats_.members_served += t->cohort().members.size();
  ready_.push_back(t);
}

void AnalysisGateway::log_(LogLevel level, std::string_view msg) const {
  if (sink_) sink_->log(level, msg);
}

} // namespace vsim
