#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "internal/coordinators/lifecycle.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/scheduler/queue_scheduler.hpp"

namespace taskorch::coordinators::queue {

/*
  Task intake. Direct callers use Enqueue()/Cancel(); other domains ask
  for work with TASK_REQUESTED events, whose failures come back as
  SYSTEM_ERROR rather than exceptions.

  TASK_REQUESTED data: queue_name, task_type, payload (struct),
  priority (number, optional), max_retries (number, optional).
*/
class QueueExecutionCoordinator final : public Lifecycle {
 public:
  QueueExecutionCoordinator(std::shared_ptr<scheduler::QueueScheduler> scheduler, std::shared_ptr<events::EventBus> bus);

  std::string_view Name() const override {
    return "queue.execution";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  std::string Enqueue(const scheduler::TaskSpec& spec);
  void        Cancel(const std::string& task_id);

 private:
  void OnTaskRequested(const taskorch::v1::Event& event);

  std::shared_ptr<scheduler::QueueScheduler> scheduler_;
  std::shared_ptr<events::EventBus>          bus_;
  events::SubscriptionSet                    subscriptions_;
  std::atomic<bool>                          initialized_{false};
};

} // namespace taskorch::coordinators::queue
