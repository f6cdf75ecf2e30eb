#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/coordinators/lifecycle.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/util/blocking_queue.hpp"

namespace taskorch::coordinators::message {

using MessageHandler = std::function<void(const taskorch::v1::AgentMessage&)>;

/*
  Mailbox plus one routing thread.

  Send() only enqueues; the routing thread resolves RESPONSEs against
  pending Request() calls, then runs the handlers registered for the
  message type in registration order. A throwing handler is logged and
  skipped. MESSAGE_SENT is published on enqueue, MESSAGE_DELIVERED after
  the handlers ran.
*/
class MessageRoutingCoordinator final : public Lifecycle {
 public:
  MessageRoutingCoordinator(std::shared_ptr<events::EventBus> bus, std::size_t mailbox_capacity, std::chrono::milliseconds request_timeout);
  ~MessageRoutingCoordinator();

  std::string_view Name() const override {
    return "message.routing";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  // Fills message_id and timestamp when unset. Returns the message id.
  // InvalidState before Initialize(), ResourceExhausted when the mailbox is full.
  std::string Send(taskorch::v1::AgentMessage message);

  // Sends and blocks for the RESPONSE carrying this message's id as
  // correlation_id. TimeoutError after `timeout` (default request_timeout).
  taskorch::v1::AgentMessage Request(taskorch::v1::AgentMessage message, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  void RegisterHandler(taskorch::v1::MessageType type, MessageHandler handler);

  uint64_t Delivered() const {
    return delivered_;
  }

 private:
  using PendingReply = std::shared_ptr<std::promise<taskorch::v1::AgentMessage>>;

  void Run();
  void Route(const taskorch::v1::AgentMessage& message);
  void FailPending(const std::string& reason);

  std::shared_ptr<events::EventBus> bus_;
  std::size_t                       mailbox_capacity_;
  std::chrono::milliseconds         request_timeout_;

  std::unique_ptr<util::BlockingQueue<taskorch::v1::AgentMessage>> mailbox_;
  std::thread                                                       thread_;

  mutable std::mutex                                   handlers_mutex_;
  std::unordered_map<int, std::vector<MessageHandler>> handlers_;

  std::mutex                                    pending_mutex_;
  std::unordered_map<std::string, PendingReply> pending_;

  std::atomic<uint64_t> delivered_{0};
  std::atomic<bool>     initialized_{false};
};

} // namespace taskorch::coordinators::message
