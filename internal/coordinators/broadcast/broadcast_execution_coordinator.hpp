#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include "broadcast_health_coordinator.hpp"
#include "internal/broadcast/broadcast_transport.hpp"

namespace taskorch::coordinators::broadcast {

enum class SendResult { kSent, kShortCircuited, kFailed };

/*
  One transport send behind the breaker.

  Short-circuits without touching the transport when the breaker refuses;
  otherwise sends under send_timeout and reports the outcome. Transport
  failures and timeouts are absorbed here, never thrown.
*/
class BroadcastExecutionCoordinator final : public Lifecycle {
 public:
  BroadcastExecutionCoordinator(std::shared_ptr<taskorch::broadcast::BroadcastTransport> transport, BroadcastHealthCoordinator& health,
                                std::chrono::milliseconds send_timeout);

  std::string_view Name() const override {
    return "broadcast.execution";
  }

  void Initialize() override {
    initialized_ = true;
  }
  void Cleanup() override {
    initialized_ = false;
  }
  bool IsInitialized() const override {
    return initialized_;
  }

  SendResult Send(const taskorch::v1::StatusUpdate& update);

 private:
  std::shared_ptr<taskorch::broadcast::BroadcastTransport> transport_;
  BroadcastHealthCoordinator&                              health_;
  std::chrono::milliseconds                                send_timeout_;
  std::atomic<bool>                                        initialized_{false};
};

} // namespace taskorch::coordinators::broadcast
