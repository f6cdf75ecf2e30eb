#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "broadcast_execution_coordinator.hpp"
#include "broadcast_health_coordinator.hpp"
#include "internal/events/event_bus.hpp"

namespace taskorch::coordinators::broadcast {

enum class BroadcastResult { kSent, kUnchanged, kShortCircuited, kFailed };

/*
  Consumes STATUS_SNAPSHOT and pushes changed snapshots to observers.

  A snapshot is sent only when its hash differs from the last one that
  was delivered successfully; a failed or short-circuited attempt leaves
  the hash alone so the same content is retried on the next snapshot.
*/
class BroadcastCoordinator final : public Lifecycle {
 public:
  BroadcastCoordinator(std::shared_ptr<events::EventBus> bus, std::shared_ptr<taskorch::broadcast::CircuitBreaker> breaker,
                       std::shared_ptr<taskorch::broadcast::BroadcastTransport> transport, std::chrono::milliseconds send_timeout);

  std::string_view Name() const override {
    return "broadcast";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  BroadcastResult Broadcast(const taskorch::v1::StatusSnapshot& snapshot);

  std::string LastSentHash() const;

  taskorch::broadcast::CircuitBreakerState BreakerState() const {
    return health_.State();
  }

 private:
  void OnSnapshot(const taskorch::v1::Event& event);

  BroadcastHealthCoordinator    health_;
  BroadcastExecutionCoordinator execution_;
  events::SubscriptionSet       subscriptions_;

  // serializes change detection with the send it guards
  mutable std::mutex mutex_;
  std::string        last_sent_hash_;

  std::atomic<bool> initialized_{false};
};

} // namespace taskorch::coordinators::broadcast
