#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/coordinators/lifecycle.hpp"
#include "internal/events/event_bus.hpp"

namespace taskorch::coordinators::queue {

/*
  Follow-up work requested when a task finishes.

  Empty source_queue / source_task_type match anything. A FAILED event
  only fires once the failure is terminal (will_retry = false).
*/
struct TaskTrigger {
  taskorch::v1::EventType on_event = taskorch::v1::EVENT_TYPE_TASK_COMPLETED;
  std::string             source_queue;
  std::string             source_task_type;
  std::string             target_queue;
  std::string             target_task_type;
  int32_t                 priority = 0;
};

// Turns task and loop events into QUEUE_STATUS_CHANGED and fires triggers.
class QueueEventCoordinator final : public Lifecycle {
 public:
  QueueEventCoordinator(std::shared_ptr<events::EventBus> bus, std::vector<TaskTrigger> triggers);

  std::string_view Name() const override {
    return "queue.events";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

 private:
  void OnQueueActivity(const taskorch::v1::Event& event);
  void EvaluateTriggers(const taskorch::v1::Event& event);

  std::shared_ptr<events::EventBus> bus_;
  std::vector<TaskTrigger>          triggers_;
  events::SubscriptionSet           subscriptions_;
  std::atomic<bool>                 initialized_{false};
};

} // namespace taskorch::coordinators::queue
