#pragma once

#include <atomic>
#include <memory>

#include "message_routing_coordinator.hpp"

namespace taskorch::coordinators::message {

/*
  Default handlers, translating agent messages into domain events:

    TASK_REQUEST   -> TASK_REQUESTED (content: queue_name, task_type, payload, priority)
    ERROR_REPORT   -> SYSTEM_ERROR
    STATUS_UPDATE  -> AGENT_STATUS_CHANGED (content: status, current_task_id)
    REQUEST ping   -> RESPONSE {status: ok} back to the sender

  Handlers stay registered with the router; they are inert while this
  coordinator is not initialized.
*/
class MessageHandlingCoordinator final : public Lifecycle {
 public:
  MessageHandlingCoordinator(MessageRoutingCoordinator& routing, std::shared_ptr<events::EventBus> bus);

  std::string_view Name() const override {
    return "message.handling";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

 private:
  void OnTaskRequest(const taskorch::v1::AgentMessage& message);
  void OnErrorReport(const taskorch::v1::AgentMessage& message);
  void OnStatusUpdate(const taskorch::v1::AgentMessage& message);
  void OnRequest(const taskorch::v1::AgentMessage& message);

  MessageRoutingCoordinator&        routing_;
  std::shared_ptr<events::EventBus> bus_;
  bool                              registered_ = false;
  std::atomic<bool>                 initialized_{false};
};

} // namespace taskorch::coordinators::message
