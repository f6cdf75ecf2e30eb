#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

#include "internal/util/time.hpp"
#include "taskorch/v1.hpp"

namespace taskorch::broadcast {

struct CircuitBreakerOptions {
  uint32_t                  failure_threshold = 5;
  std::chrono::milliseconds cooldown{60000};
  uint32_t                  success_threshold = 3;
};

struct CircuitBreakerState {
  taskorch::v1::BreakerPhase phase                 = taskorch::v1::BREAKER_PHASE_CLOSED;
  uint32_t                   consecutive_failures  = 0;
  uint32_t                   consecutive_successes = 0;
  util::SteadyTimePoint      opened_at{};
};

/*
  Failure gate in front of the broadcast transport.

    CLOSED    --failure_threshold consecutive failures-->  OPEN
    OPEN      --cooldown elapsed, next TryAcquire()---->  HALF_OPEN
    HALF_OPEN --success_threshold consecutive successes->  CLOSED
    HALF_OPEN --any failure----------------------------->  OPEN (cooldown restarts)

  In HALF_OPEN a single trial is admitted at a time; TryAcquire() refuses
  others until that trial reports.

  The listener runs after the state lock is released, on the thread that
  caused the transition.
*/
class CircuitBreaker {
 public:
  using ClockFn  = std::function<util::SteadyTimePoint()>;
  using Listener = std::function<void(taskorch::v1::BreakerPhase from, const CircuitBreakerState& to)>;

  explicit CircuitBreaker(CircuitBreakerOptions options = {}, ClockFn clock = &util::SteadyNow);

  // false: short-circuit, do not touch the transport
  bool TryAcquire();

  void RecordSuccess();
  void RecordFailure();

  CircuitBreakerState State() const;

  taskorch::v1::BreakerPhase Phase() const {
    return State().phase;
  }

  const CircuitBreakerOptions& Options() const {
    return options_;
  }

  void SetListener(Listener listener);

 private:
  void Notify(taskorch::v1::BreakerPhase from, const CircuitBreakerState& to);

  CircuitBreakerOptions options_;
  ClockFn               clock_;

  mutable std::mutex  mutex_;
  CircuitBreakerState state_;
  bool                trial_in_flight_ = false;
  Listener            listener_;
};

} // namespace taskorch::broadcast
