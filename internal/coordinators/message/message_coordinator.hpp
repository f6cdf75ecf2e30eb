#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include "message_handling_coordinator.hpp"
#include "message_routing_coordinator.hpp"

namespace taskorch::coordinators::message {

struct MessageCoordinatorOptions {
  std::size_t               mailbox_capacity = 1000;
  std::chrono::milliseconds request_timeout{30000};
};

// Agent messaging orchestrator: routing first, then the default handlers.
class MessageCoordinator final : public Lifecycle {
 public:
  MessageCoordinator(std::shared_ptr<events::EventBus> bus, MessageCoordinatorOptions options);

  std::string_view Name() const override {
    return "message";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  std::string Send(taskorch::v1::AgentMessage message) {
    return routing_.Send(std::move(message));
  }

  taskorch::v1::AgentMessage Request(taskorch::v1::AgentMessage message, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
    return routing_.Request(std::move(message), timeout);
  }

  void RegisterHandler(taskorch::v1::MessageType type, MessageHandler handler) {
    routing_.RegisterHandler(type, std::move(handler));
  }

  uint64_t Delivered() const {
    return routing_.Delivered();
  }

 private:
  MessageRoutingCoordinator  routing_;
  MessageHandlingCoordinator handling_;
  std::atomic<bool>          initialized_{false};
};

} // namespace taskorch::coordinators::message
