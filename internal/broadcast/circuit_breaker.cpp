#include "circuit_breaker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace taskorch::broadcast {

using taskorch::v1::BreakerPhase;

CircuitBreaker::CircuitBreaker(CircuitBreakerOptions options, ClockFn clock) : options_(options), clock_(std::move(clock)) {
  if (options_.failure_threshold == 0) options_.failure_threshold = 1;
  if (options_.success_threshold == 0) options_.success_threshold = 1;
}

bool CircuitBreaker::TryAcquire() {
  CircuitBreakerState after;
  {
    std::lock_guard lock(mutex_);
    switch (state_.phase) {
      case taskorch::v1::BREAKER_PHASE_HALF_OPEN:
        if (trial_in_flight_) return false;
        trial_in_flight_ = true;
        return true;

      case taskorch::v1::BREAKER_PHASE_OPEN:
        if (clock_() - state_.opened_at < options_.cooldown) return false;
        state_.phase                 = taskorch::v1::BREAKER_PHASE_HALF_OPEN;
        state_.consecutive_successes = 0;
        trial_in_flight_             = true;
        after                        = state_;
        break;

      default:
        return true;
    }
  }

  Notify(taskorch::v1::BREAKER_PHASE_OPEN, after);
  return true;
}

void CircuitBreaker::RecordSuccess() {
  BreakerPhase        before;
  CircuitBreakerState after;
  {
    std::lock_guard lock(mutex_);
    before = state_.phase;

    if (state_.phase == taskorch::v1::BREAKER_PHASE_HALF_OPEN) {
      trial_in_flight_ = false;
      if (++state_.consecutive_successes >= options_.success_threshold) {
        state_.phase                 = taskorch::v1::BREAKER_PHASE_CLOSED;
        state_.consecutive_failures  = 0;
        state_.consecutive_successes = 0;
      }
    } else if (state_.phase == taskorch::v1::BREAKER_PHASE_CLOSED) {
      state_.consecutive_failures = 0;
    }
    after = state_;
  }

  if (after.phase != before) Notify(before, after);
}

void CircuitBreaker::RecordFailure() {
  BreakerPhase        before;
  CircuitBreakerState after;
  {
    std::lock_guard lock(mutex_);
    before = state_.phase;

    state_.consecutive_successes = 0;
    ++state_.consecutive_failures;

    if (state_.phase == taskorch::v1::BREAKER_PHASE_HALF_OPEN ||
        (state_.phase == taskorch::v1::BREAKER_PHASE_CLOSED && state_.consecutive_failures >= options_.failure_threshold)) {
      state_.phase     = taskorch::v1::BREAKER_PHASE_OPEN;
      state_.opened_at = clock_();
      trial_in_flight_ = false;
    }
    after = state_;
  }

  if (after.phase != before) Notify(before, after);
}

CircuitBreakerState CircuitBreaker::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

void CircuitBreaker::SetListener(Listener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

void CircuitBreaker::Notify(BreakerPhase from, const CircuitBreakerState& to) {
  TASKORCH_LOG_WARN("broadcast circuit breaker transition",
                    {observability::StringField("from", taskorch::v1::BreakerPhase_Name(from)),
                     observability::StringField("to", taskorch::v1::BreakerPhase_Name(to.phase)),
                     observability::IntField("consecutive_failures", to.consecutive_failures)});
  observability::Metrics::Instance().RecordBreakerTransition(taskorch::v1::BreakerPhase_Name(to.phase));

  Listener listener;
  {
    std::lock_guard lock(mutex_);
    listener = listener_;
  }
  if (listener) listener(from, to);
}

} // namespace taskorch::broadcast
