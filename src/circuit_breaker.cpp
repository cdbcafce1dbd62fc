#include "vsim/circuit_breaker.hpp"

namespace vsim {

bool CircuitBreaker::try_acquire(Millis now) noexcept {
  switch (state_) {
    case CircuitState::Closed:
      return true;
    case CircuitState::Open:
      if (now - opened_at_ < cfg_.cooldown) return false;
      state_ = CircuitState::HalfOpen;
      trial_in_flight_ = true;
      return true;
    case CircuitState::HalfOpen:
      // only the single trial goes out until it reports back
      if (trial_in_flight_) return false;
      trial_in_flight_ = true;
      return true;
  }
  return false;
}

void CircuitBreaker::record_success(bool trial) noexcept {
  if (trial) {
    if (state_ != CircuitState::HalfOpen) return;
    trial_in_flight_ = false;
    failures_ = 0;
    state_ = CircuitState::Closed;
    return;
  }
  // a straggler from before the trip does not close the circuit
  if (state_ == CircuitState::Closed) failures_ = 0;
}

void CircuitBreaker::record_failure(Millis now, bool trial) noexcept {
  if (trial) {
    if (state_ != CircuitState::HalfOpen) return;
    trial_in_flight_ = false;
    open_(now);
    return;
  }
  if (state_ != CircuitState::Closed) return;
  ++failures_;
  if (failures_ >= cfg_.failure_threshold) open_(now);
}

void CircuitBreaker::open_(Millis now) noexcept {
  state_ = CircuitState::Open;
  opened_at_ = now;
  ++times_opened_;
}

} // namespace vsim
