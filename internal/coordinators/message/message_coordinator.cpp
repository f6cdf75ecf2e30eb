#include "message_coordinator.hpp"

#include "internal/observability/logging.hpp"

namespace taskorch::coordinators::message {

MessageCoordinator::MessageCoordinator(std::shared_ptr<events::EventBus> bus, MessageCoordinatorOptions options)
    : routing_(bus, options.mailbox_capacity, options.request_timeout), handling_(routing_, bus) {
}

void MessageCoordinator::Initialize() {
  if (initialized_) return;
  routing_.Initialize();
  handling_.Initialize();
  initialized_ = true;
  TASKORCH_LOG_INFO("message coordinator initialized");
}

void MessageCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;
  handling_.Cleanup();
  routing_.Cleanup();
}

} // namespace taskorch::coordinators::message
