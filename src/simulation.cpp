#include "vsim/simulation.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <sstream>
#include <string>
#include <utility>

#include "vsim/invariants.hpp"

namespace vsim {

namespace {

AnalysisKind kind_for(const Agent& a, const UpdateParams& p) noexcept {
  return a.opinion.volatility >= p.analysis_volatility ? AnalysisKind::BehaviorPrediction
                                                       : AnalysisKind::VotingPrediction;
}

bool result_finite(const AnalysisResult& r) noexcept {
  for (const float v : r.target_axes) {
    if (!std::isfinite(v)) return false;
  }
  return std::isfinite(r.confidence) && std::isfinite(r.engagement) && std::isfinite(r.salience);
}

} // namespace

Simulation::Simulation(AgentStore store, AnalysisService& service, SimulationConfig cfg, TelemetrySink* sink)
  : cfg_(cfg),
    sink_(sink),
    store_(std::move(store)),
    classifier_(cfg.classifier),
    scheduler_(cfg.scheduler),
    clusterer_(cfg.cluster),
    gateway_(service, cfg.gateway, sink),
    governor_(cfg.governor),
    pool_(std::make_unique<WorkerPool>(cfg.worker_threads)) {
  if (cfg_.classify_interval == 0) cfg_.classify_interval = 1;
  if (sink_) store_.set_sink(sink_);
}

TickReport Simulation::step(std::span<const ActiveEvent> events) {
  const auto t0 = std::chrono::steady_clock::now();
  TickReport r{};
  r.tick = tick_;

  // Any fault in classification or selection runs this tick on the fallback
  // round robin instead.
  bool fallback = false;
  try {
    drain_results_(r);

    if (tick_ % cfg_.classify_interval == 0) {
      r.classified = true;
      r.classify = classifier_.classify(store_, tick_, pool_.get());
      note_(r, r.classify.degradation);
      if (r.classify.faults > 0) {
        fallback = true;
        log_(LogLevel::Warn, "classification: " + std::to_string(r.classify.faults) +
                                 " agents kept their tier (non-finite inputs)");
      }
    }
  } catch (const std::exception& e) {
    fallback = true;
    log_abort_("classification", e);
    note_(r, Degradation::ClassificationFault);
  }

  const std::size_t budget = governor_.apply(scheduler_.config().budget);
  WorkingSet ws{};
  try {
    ws = fallback ? scheduler_.select_fallback(store_, tick_, budget) : scheduler_.select(store_, tick_, budget);
  } catch (const std::exception& e) {
    log_abort_("selection", e);
    ws = scheduler_.select_fallback(store_, tick_, budget);
  }
  if (ws.degradation != Degradation::None) {
    log_(LogLevel::Warn, "scheduler running in fallback round robin");
    note_(r, ws.degradation);
  }
  r.budget = ws.budget;
  r.full_updates = ws.full.size();
  r.aging_updates = ws.aging.size();
  r.forced = ws.forced;
  r.overflow = ws.overflow;

  try {
    std::vector<uint8_t> flags;
    update_working_set_(ws, events, flags);
    request_analysis_(ws, flags, r);
  } catch (const std::exception& e) {
    log_abort_("update", e);
    note_(r, Degradation::SchedulingFault);
  }

  const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
  if (governor_.record(ms) && governor_.state() != LoadState::Good) {
    std::ostringstream os;
    os << "load " << to_string(governor_.state()) << ", budget scale " << governor_.scale();
    log_(LogLevel::Info, os.str());
  }

  recent_degraded_.push_back(r.degradation != Degradation::None);
  while (recent_degraded_.size() > std::max<std::size_t>(1, cfg_.health_window)) recent_degraded_.pop_front();

  emit_(r, ms);
  last_ = r;
  ++tick_;
  return r;
}

RunStats Simulation::run(Tick ticks, EventSource& events) {
  RunStats s{};
  for (Tick i = 0; i < ticks; ++i) {
    const auto evs = events.active_events(tick_);
    const TickReport r = step(evs);
    s.ticks++;
    s.full_updates += r.full_updates;
    s.aging_updates += r.aging_updates;
    s.forced += r.forced;
    s.overflow += r.overflow;
    s.cohorts_submitted += r.cohorts_submitted;
    s.results_applied += r.results_applied;
    if (r.degradation != Degradation::None) s.degraded_ticks++;
  }
  return s;
}

void Simulation::drain_results_(TickReport& r) {
  for (const auto& t : gateway_.poll(now())) {
    const Cohort& c = t->cohort();
    const bool degraded = t->state() == TicketState::Failed || t->result().degraded;
    if (degraded) {
      ++r.degraded_results;
      note_(r, t->degradation() != Degradation::None ? t->degradation() : Degradation::ExternalFailure);
    }

    for (std::size_t j = 0; j < c.members.size(); ++j) {
      const AgentId id = c.members[j];
      auto it = pending_.find(id);
      if (it == pending_.end() || it->second.ticket != t) {
        ++r.results_discarded;
        continue;
      }
      const Generation gen = it->second.generation;
      pending_.erase(it);

      if (!store_.contains(id) || store_.generation(id) != gen) {
        ++r.results_discarded;
        continue;
      }
      // degraded answers leave the voter as is; the next flag asks again
      if (degraded) continue;
      if (!result_finite(t->result())) {
        note_(r, Degradation::CacheAnomaly);
        ++r.results_discarded;
        continue;
      }
      write_back_(id, t->result(), c.member_features[j]);
      ++r.results_applied;
    }
  }
}

void Simulation::write_back_(AgentId id, const AnalysisResult& shared, const FeatureSnapshot& features) {
  const AnalysisResult res = customize_result(shared, features);
  Agent& a = store_[id];

  const float k = clamp_unit(cfg_.result_blend * res.confidence);
  for (std::size_t i = 0; i < kAxisCount; ++i) {
    auto& v = a.opinion.axes[i];
    v = clamp_axis(v + k * (res.target_axes[i] - v));
  }
  a.opinion.confidence = clamp_unit(0.5f * (a.opinion.confidence + res.confidence));
  a.opinion.last_analysis = tick_;
  a.opinion.analysed = true;

  // attention is raised through the score, so the tier still moves one step per pass
  auto& rel = store_.relevance_mut(id);
  rel.analysis_boost = std::max(rel.analysis_boost, clamp_unit(res.salience * (0.5f + 0.5f * res.engagement)));
}

void Simulation::update_working_set_(const WorkingSet& ws, std::span<const ActiveEvent> events,
                                     std::vector<uint8_t>& flags) {
  flags.assign(ws.full.size(), 0);
  const Tick now = tick_;
  const UpdateParams& p = cfg_.update;

  pool_->parallel_for(ws.full.size(), [&](std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
      Agent& a = store_[ws.full[i]];
      const UpdateOutcome out = apply_update(a, events, now, p);
      a.opinion = out.opinion;
      a.behavior = out.behavior;
      flags[i] = out.needs_analysis ? 1 : 0;
    }
  });

  pool_->parallel_for(ws.aging.size(), [&](std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
      Agent& a = store_[ws.aging[i]];
      const Tick elapsed = now > a.opinion.last_updated ? now - a.opinion.last_updated : 0;
      const UpdateOutcome out = apply_aging(a.opinion, a.behavior, elapsed, now, p);
      a.opinion = out.opinion;
      a.behavior = out.behavior;
    }
  });
}

void Simulation::request_analysis_(const WorkingSet& ws, const std::vector<uint8_t>& flags, TickReport& r) {
  std::vector<ClusterCandidate> candidates;
  for (std::size_t i = 0; i < ws.full.size(); ++i) {
    if (!flags[i]) continue;
    ++r.flagged;
    const AgentId id = ws.full[i];
    if (pending_.count(id)) continue;
    const Agent& a = store_[id];
    candidates.push_back(ClusterCandidate{id, store_.generation(id), kind_for(a, cfg_.update), snapshot_of(a)});
  }
  if (candidates.empty()) return;

  for (auto& cohort : clusterer_.cluster(candidates)) {
    const CohortHandle h = gateway_.submit(std::move(cohort), now());
    const Cohort& c = h->cohort();
    for (std::size_t j = 0; j < c.members.size(); ++j) {
      pending_[c.members[j]] = Pending{h, c.generations[j]};
    }
    ++r.cohorts_submitted;
  }
}

bool Simulation::recycle_agent(AgentId id, const Demographics& d) {
  if (!store_.recycle(id, d, tick_)) return false;

  auto it = pending_.find(id);
  if (it == pending_.end()) return true;
  const CohortHandle t = it->second.ticket;
  pending_.erase(it);

  for (const AgentId m : t->cohort().members) {
    auto p = pending_.find(m);
    if (p != pending_.end() && p->second.ticket == t) return true;
  }
  t->cancel();
  log_(LogLevel::Debug, "cancelled analysis for recycled agent " + std::to_string(id));
  return true;
}

Health Simulation::health() const noexcept {
  const auto degraded = static_cast<std::size_t>(std::count(recent_degraded_.begin(), recent_degraded_.end(), true));
  if (degraded > 0 && degraded * 2 >= recent_degraded_.size()) return Health::Critical;
  if (degraded > 0 || gateway_.circuit_state() != CircuitState::Closed) return Health::Degraded;
  return Health::Healthy;
}

void Simulation::emit_(const TickReport& r, double tick_ms) {
  if (!sink_) return;
  TickTelemetry t{};
  t.tick = r.tick;
  t.tiers = store_.tier_counts();
  t.budget = r.budget;
  t.full_updates = r.full_updates;
  t.aging_updates = r.aging_updates;
  t.forced = r.forced;
  t.overflow = r.overflow;
  t.flagged = r.flagged;
  t.cohorts_submitted = r.cohorts_submitted;
  t.results_applied = r.results_applied;
  t.cache_hit_ratio = gateway_.stats().cache_hit_ratio();
  t.last_batch_size = gateway_.stats().last_batch_size;
  t.circuit = gateway_.circuit_state();
  t.degradation = r.degradation;
  t.tick_ms = tick_ms;
  sink_->on_tick(t);
}

void Simulation::log_(LogLevel level, std::string_view msg) const {
  if (sink_) sink_->log(level, msg);
}

void Simulation::log_abort_(std::string_view stage, const std::exception& e) const {
  std::ostringstream os;
  os << "tick " << tick_ << " " << stage << " aborted: " << e.what();
  log_(LogLevel::Error, os.str());
}

} // namespace vsim
