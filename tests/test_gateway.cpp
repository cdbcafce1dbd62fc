#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include "vsim/clusterer.hpp"
#include "vsim/gateway.hpp"
#include "vsim/offline_analysis_service.hpp"

using vsim::Millis;

namespace {

vsim::Cohort cohort(vsim::CacheKey key, vsim::AgentId first_member = 0, std::size_t members = 1) {
  vsim::Cohort c{};
  c.key = key;
  c.kind = vsim::AnalysisKind::VotingPrediction;
  c.features.age = 30;
  c.features.axes = {10.0f, -10.0f, 20.0f, 0.0f};
  c.features.volatility = 0.5f;
  for (std::size_t i = 0; i < members; ++i) {
    c.members.push_back(first_member + static_cast<vsim::AgentId>(i));
    c.generations.push_back(0);
    c.member_features.push_back(c.features);
  }
  c.representative = first_member;
  return c;
}

vsim::GatewayConfig inline_config() {
  vsim::GatewayConfig cfg{};
  cfg.worker_threads = 0;
  return cfg;
}

// Blocks every call until released; counts calls that have started.
class GatedService final : public vsim::AnalysisService {
public:
  GatedService() : gate_(open_.get_future().share()) {}

  vsim::ServiceReply analyze(std::span<const vsim::AnalysisItem> batch, Millis) override {
    started.fetch_add(1);
    gate_.wait();
    vsim::ServiceReply r;
    for (const auto& item : batch) r.results.push_back(vsim::OfflineAnalysisService::evaluate(item, 0.3f));
    r.ok = true;
    return r;
  }
  std::string_view name() const noexcept override { return "gated"; }

  void release() { open_.set_value(); }

  std::atomic<int> started{0};

private:
  std::promise<void> open_;
  std::shared_future<void> gate_;
};

// Key 1 blocks on `early` and succeeds, key 4 blocks on `trial` and fails,
// any other key fails at once.
class KeyedService final : public vsim::AnalysisService {
public:
  KeyedService() : early_(early_open_.get_future().share()), trial_(trial_open_.get_future().share()) {}

  vsim::ServiceReply analyze(std::span<const vsim::AnalysisItem> batch, Millis) override {
    vsim::ServiceReply r;
    if (batch.empty()) return r;
    const vsim::CacheKey key = batch[0].key;
    if (key == 1) {
      early_.wait();
      for (const auto& item : batch) r.results.push_back(vsim::OfflineAnalysisService::evaluate(item, 0.3f));
      r.ok = true;
      return r;
    }
    if (key == 4) trial_.wait();
    r.error = "refused";
    return r;
  }
  std::string_view name() const noexcept override { return "keyed"; }

  void release_early() { early_open_.set_value(); }
  void release_trial() { trial_open_.set_value(); }

private:
  std::promise<void> early_open_;
  std::promise<void> trial_open_;
  std::shared_future<void> early_;
  std::shared_future<void> trial_;
};

template <class Done>
void poll_until(vsim::AnalysisGateway& gw, Millis now, Done done) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (!done() && std::chrono::steady_clock::now() < deadline) {
    gw.poll(now);
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

} // namespace

TEST(Gateway, WindowDispatchesPartialBatchAfter100ms) {
  vsim::OfflineAnalysisService svc;
  vsim::AnalysisGateway gw(svc, inline_config());

  std::vector<vsim::CohortHandle> handles;
  for (int i = 0; i < 37; ++i) {
    handles.push_back(gw.submit(cohort(1000 + static_cast<vsim::CacheKey>(i)), Millis{i}));
    EXPECT_TRUE(gw.poll(Millis{i}).empty());
  }
  EXPECT_TRUE(gw.poll(Millis{99}).empty());
  EXPECT_EQ(svc.calls(), 0u);
  EXPECT_EQ(gw.collecting(), 37u);

  const auto ready = gw.poll(Millis{100});
  EXPECT_EQ(svc.batch_sizes(), (std::vector<std::size_t>{37}));
  EXPECT_EQ(ready.size(), 37u);
  for (const auto& h : handles) {
    EXPECT_EQ(h->state(), vsim::TicketState::Resolved);
    EXPECT_FALSE(h->result().degraded);
  }
  EXPECT_EQ(gw.stats().last_batch_size, 37u);
}

TEST(Gateway, FullBatchesDispatchImmediately) {
  vsim::OfflineAnalysisService svc;
  vsim::AnalysisGateway gw(svc, inline_config());

  for (int i = 0; i < 120; ++i) gw.submit(cohort(static_cast<vsim::CacheKey>(i)), Millis{0});
  EXPECT_EQ(svc.batch_sizes(), (std::vector<std::size_t>{50, 50}));
  EXPECT_EQ(gw.collecting(), 20u);

  const auto ready = gw.poll(Millis{100});
  EXPECT_EQ(svc.batch_sizes(), (std::vector<std::size_t>{50, 50, 20}));
  EXPECT_EQ(ready.size(), 120u);
  EXPECT_EQ(gw.stats().batches_dispatched, 3u);
  EXPECT_DOUBLE_EQ(gw.stats().mean_batch_size(), 40.0);
}

TEST(Gateway, CachedKeyIsNotRequestedAgainWithinTtl) {
  vsim::OfflineAnalysisService svc;
  vsim::AnalysisGateway gw(svc, inline_config());

  auto first = gw.submit(cohort(42), Millis{0});
  gw.poll(Millis{100});
  ASSERT_EQ(first->state(), vsim::TicketState::Resolved);
  EXPECT_EQ(svc.calls(), 1u);

  auto second = gw.submit(cohort(42, 5), Millis{10'000});
  const auto ready = gw.poll(Millis{10'100});
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_TRUE(second->from_cache());
  EXPECT_EQ(second->result().target_axes, first->result().target_axes);
  EXPECT_EQ(svc.calls(), 1u);
  EXPECT_EQ(gw.stats().cache_hits, 1u);

  // past the 60 s ttl the service is asked again
  auto third = gw.submit(cohort(42), Millis{70'000});
  gw.poll(Millis{70'100});
  EXPECT_FALSE(third->from_cache());
  EXPECT_EQ(svc.calls(), 2u);
}

TEST(Gateway, EqualKeysInOneBatchShareOneItem) {
  vsim::OfflineAnalysisService svc;
  vsim::AnalysisGateway gw(svc, inline_config());

  auto a = gw.submit(cohort(9, 0, 3), Millis{0});
  auto b = gw.submit(cohort(9, 3, 2), Millis{0});
  gw.poll(Millis{100});

  EXPECT_EQ(svc.items_seen(), 1u);
  EXPECT_EQ(gw.stats().coalesced, 1u);
  ASSERT_TRUE(a->ready());
  ASSERT_TRUE(b->ready());
  EXPECT_EQ(a->result().target_axes, b->result().target_axes);
  EXPECT_EQ(gw.stats().members_served, 5u);
  EXPECT_DOUBLE_EQ(gw.stats().batching_efficiency(), 5.0);
}

TEST(Gateway, IdenticalVotersClusterIntoOneCallWithOneResult) {
  vsim::SimilarityClusterer clusterer;
  std::vector<vsim::ClusterCandidate> cands;
  for (vsim::AgentId id = 0; id < 12; ++id) {
    vsim::ClusterCandidate c{};
    c.id = id;
    c.kind = vsim::AnalysisKind::BehaviorPrediction;
    c.features.axes = {40.0f, 10.0f, 0.0f, -5.0f};
    c.features.volatility = 0.6f;
    cands.push_back(c);
  }
  auto cohorts = clusterer.cluster(cands);
  ASSERT_EQ(cohorts.size(), 1u);

  vsim::OfflineAnalysisService svc;
  vsim::AnalysisGateway gw(svc, inline_config());
  auto h = gw.submit(std::move(cohorts[0]), Millis{0});
  gw.poll(Millis{100});

  EXPECT_EQ(svc.calls(), 1u);
  EXPECT_EQ(svc.items_seen(), 1u);
  ASSERT_EQ(h->state(), vsim::TicketState::Resolved);
  EXPECT_EQ(h->cohort().members.size(), 12u);
  for (const auto& f : h->cohort().member_features) {
    const auto mine = vsim::customize_result(h->result(), f);
    EXPECT_EQ(mine.target_axes, h->result().target_axes);
    EXPECT_EQ(mine.confidence, vsim::customize_result(h->result(), h->cohort().features).confidence);
  }
}

TEST(Gateway, CircuitOpensAfterFiveFailuresAndAdmitsOneTrial) {
  vsim::OfflineAnalysisService svc;
  svc.set_available(false);
  auto cfg = inline_config();
  cfg.max_batch = 1;  // every submit dispatches; completions land on poll
  vsim::AnalysisGateway gw(svc, cfg);

  vsim::CacheKey key = 1;
  for (int i = 0; i < 5; ++i) {
    auto h = gw.submit(cohort(key++), Millis{i * 10});
    gw.poll(Millis{i * 10});
    EXPECT_EQ(h->state(), vsim::TicketState::Failed);
    EXPECT_TRUE(h->result().degraded);
    EXPECT_EQ(h->degradation(), vsim::Degradation::ExternalFailure);
  }
  EXPECT_EQ(svc.calls(), 5u);
  EXPECT_EQ(gw.circuit_state(), vsim::CircuitState::Open);
  const Millis opened = gw.breaker().opened_at();
  EXPECT_EQ(opened, Millis{40});

  // cooldown: no calls at all, fallback results
  for (int i = 0; i < 10; ++i) {
    auto h = gw.submit(cohort(key++), opened + Millis{1000 * (i + 1)});
    gw.poll(opened + Millis{1000 * (i + 1)});
    EXPECT_EQ(h->state(), vsim::TicketState::Failed);
    EXPECT_TRUE(h->result().degraded);
  }
  EXPECT_EQ(svc.calls(), 5u);
  EXPECT_EQ(gw.stats().short_circuited, 10u);

  // after the cooldown exactly one trial goes out
  const Millis t = opened + Millis{30'000};
  auto trial = gw.submit(cohort(key++), t);
  auto extra = gw.submit(cohort(key++), t);
  EXPECT_EQ(svc.calls(), 6u);
  EXPECT_EQ(gw.circuit_state(), vsim::CircuitState::HalfOpen);
  EXPECT_EQ(extra->state(), vsim::TicketState::Failed);

  // the trial fails: open again with a fresh cooldown
  gw.poll(t);
  EXPECT_EQ(trial->state(), vsim::TicketState::Failed);
  EXPECT_EQ(gw.circuit_state(), vsim::CircuitState::Open);
  EXPECT_EQ(gw.breaker().opened_at(), t);

  svc.set_available(true);
  const Millis t2 = t + Millis{30'000};
  auto ok = gw.submit(cohort(key++), t2);
  gw.poll(t2);
  EXPECT_EQ(ok->state(), vsim::TicketState::Resolved);
  EXPECT_EQ(gw.circuit_state(), vsim::CircuitState::Closed);
  EXPECT_EQ(svc.calls(), 7u);
}

TEST(Gateway, ResultCountMismatchIsAFailure) {
  vsim::OfflineAnalysisService svc;
  svc.set_truncate_replies(true);
  vsim::AnalysisGateway gw(svc, inline_config());

  auto a = gw.submit(cohort(1), Millis{0});
  auto b = gw.submit(cohort(2), Millis{0});
  gw.poll(Millis{100});

  EXPECT_EQ(a->state(), vsim::TicketState::Failed);
  EXPECT_EQ(b->state(), vsim::TicketState::Failed);
  EXPECT_EQ(gw.stats().failures, 1u);
  EXPECT_EQ(gw.cache().size(), 0u);
}

TEST(Gateway, CancelledTicketNeverResolves) {
  vsim::OfflineAnalysisService svc;
  vsim::AnalysisGateway gw(svc, inline_config());

  auto keep = gw.submit(cohort(1), Millis{0});
  auto drop = gw.submit(cohort(2), Millis{0});
  drop->cancel();

  const auto ready = gw.poll(Millis{100});
  ASSERT_EQ(ready.size(), 1u);
  EXPECT_EQ(ready[0], keep);
  EXPECT_EQ(drop->state(), vsim::TicketState::Cancelled);
  EXPECT_EQ(svc.items_seen(), 1u);
  EXPECT_EQ(gw.stats().cancelled, 1u);
}

TEST(Gateway, SlowCallTimesOutToFallback) {
  GatedService svc;
  vsim::GatewayConfig cfg{};
  cfg.worker_threads = 1;
  cfg.call_timeout = Millis{5000};
  vsim::AnalysisGateway gw(svc, cfg);

  auto h = gw.submit(cohort(77), Millis{0});
  gw.poll(Millis{100});
  EXPECT_EQ(h->state(), vsim::TicketState::Dispatched);
  EXPECT_EQ(gw.in_flight(), 1u);

  gw.poll(Millis{5099});
  EXPECT_EQ(h->state(), vsim::TicketState::Dispatched);

  const auto ready = gw.poll(Millis{5100});
  EXPECT_EQ(ready.size(), 1u);
  EXPECT_EQ(h->state(), vsim::TicketState::Failed);
  EXPECT_EQ(h->degradation(), vsim::Degradation::Timeout);
  EXPECT_TRUE(h->result().degraded);
  EXPECT_EQ(gw.stats().timeouts, 1u);
  EXPECT_EQ(gw.in_flight(), 0u);

  // the late reply is dropped, not cached
  svc.release();
  EXPECT_TRUE(gw.poll(Millis{6000}).empty());
  EXPECT_EQ(gw.cache().size(), 0u);
  EXPECT_EQ(h->state(), vsim::TicketState::Failed);
}

TEST(Gateway, PooledCallsResolveOnLaterPoll) {
  vsim::OfflineAnalysisService svc;
  vsim::GatewayConfig cfg{};
  cfg.worker_threads = 3;
  vsim::AnalysisGateway gw(svc, cfg);

  std::vector<vsim::CohortHandle> hs;
  for (int i = 0; i < 130; ++i) hs.push_back(gw.submit(cohort(static_cast<vsim::CacheKey>(i)), Millis{0}));
  gw.flush(Millis{0});

  std::size_t resolved = 0;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (resolved < hs.size() && std::chrono::steady_clock::now() < deadline) {
    resolved += gw.poll(Millis{1}).size();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  EXPECT_EQ(resolved, hs.size());
  for (const auto& h : hs) EXPECT_EQ(h->state(), vsim::TicketState::Resolved);
  EXPECT_EQ(svc.calls(), 3u);
}

TEST(Gateway, OnlyTheTrialBatchMovesAHalfOpenCircuit) {
  KeyedService svc;
  vsim::GatewayConfig cfg{};
  cfg.worker_threads = 3;
  cfg.max_batch = 1;
  cfg.call_timeout = Millis{60'000};
  cfg.circuit.failure_threshold = 2;
  cfg.circuit.cooldown = Millis{1000};
  vsim::AnalysisGateway gw(svc, cfg);

  // dispatched while closed, still running when the circuit trips
  auto early = gw.submit(cohort(1), Millis{0});
  gw.submit(cohort(2), Millis{0});
  gw.submit(cohort(3), Millis{0});
  poll_until(gw, Millis{0}, [&] { return gw.circuit_state() == vsim::CircuitState::Open; });
  EXPECT_EQ(gw.circuit_state(), vsim::CircuitState::Open);

  auto trial = gw.submit(cohort(4), Millis{1000});
  EXPECT_EQ(gw.circuit_state(), vsim::CircuitState::HalfOpen);

  svc.release_early();
  poll_until(gw, Millis{1000}, [&] { return early->ready(); });
  EXPECT_EQ(early->state(), vsim::TicketState::Resolved);
  EXPECT_EQ(gw.circuit_state(), vsim::CircuitState::HalfOpen);

  svc.release_trial();
  poll_until(gw, Millis{1000}, [&] { return trial->ready(); });
  EXPECT_EQ(trial->state(), vsim::TicketState::Failed);
  EXPECT_EQ(gw.circuit_state(), vsim::CircuitState::Open);
  EXPECT_EQ(gw.breaker().opened_at(), Millis{1000});
}
