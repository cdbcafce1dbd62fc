#pragma once
#include <cstdint>

#include "vsim/types.hpp"

namespace vsim {

struct CircuitConfig {
  uint32_t failure_threshold{5};
  Millis cooldown{Millis{30'000}};
};

// Closed -> (threshold consecutive failures) -> Open -> (cooldown) -> HalfOpen.
// HalfOpen admits exactly one trial; its success closes, its failure reopens
// with a fresh cooldown. Outcomes of calls that are not the trial only count
// while Closed.
class CircuitBreaker {
public:
  CircuitBreaker() = default;
  explicit CircuitBreaker(CircuitConfig cfg) : cfg_(cfg) {}

  const CircuitConfig& config() const noexcept { return cfg_; }

  // True if a call may go out now. In HalfOpen this hands out the single trial;
  // the caller tells it apart by state() == HalfOpen right after.
  bool try_acquire(Millis now) noexcept;

  // `trial` marks the outcome of the call admitted in HalfOpen.
  void record_success(bool trial = false) noexcept;
  void record_failure(Millis now, bool trial = false) noexcept;

  CircuitState state() const noexcept { return state_; }
  uint32_t consecutive_failures() const noexcept { return failures_; }
  Millis opened_at() const noexcept { return opened_at_; }
  bool trial_in_flight() const noexcept { return trial_in_flight_; }
  uint64_t times_opened() const noexcept { return times_opened_; }

private:
  void open_(Millis now) noexcept;

  CircuitConfig cfg_{};
  CircuitState state_{CircuitState::Closed};
  uint32_t failures_{0};
  Millis opened_at_{0};
  bool trial_in_flight_{false};
  uint64_t times_opened_{0};
};

} // namespace vsim
