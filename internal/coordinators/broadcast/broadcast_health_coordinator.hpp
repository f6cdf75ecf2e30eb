#pragma once

#include <atomic>
#include <memory>

#include "internal/broadcast/circuit_breaker.hpp"
#include "internal/coordinators/lifecycle.hpp"
#include "internal/events/event_bus.hpp"

namespace taskorch::coordinators::broadcast {

// Owns the breaker's transition listener and publishes
// BROADCAST_HEALTH_CHANGED for every phase change.
class BroadcastHealthCoordinator final : public Lifecycle {
 public:
  BroadcastHealthCoordinator(std::shared_ptr<taskorch::broadcast::CircuitBreaker> breaker, std::shared_ptr<events::EventBus> bus);

  std::string_view Name() const override {
    return "broadcast.health";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  bool TryAcquire() {
    return breaker_->TryAcquire();
  }
  void RecordSuccess() {
    breaker_->RecordSuccess();
  }
  void RecordFailure() {
    breaker_->RecordFailure();
  }
  taskorch::broadcast::CircuitBreakerState State() const {
    return breaker_->State();
  }

 private:
  std::shared_ptr<taskorch::broadcast::CircuitBreaker> breaker_;
  std::shared_ptr<events::EventBus>                    bus_;
  std::atomic<bool>                                    initialized_{false};
};

} // namespace taskorch::coordinators::broadcast
