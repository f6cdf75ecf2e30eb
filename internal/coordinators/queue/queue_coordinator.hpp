#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

#include "queue_event_coordinator.hpp"
#include "queue_execution_coordinator.hpp"
#include "queue_lifecycle_coordinator.hpp"
#include "queue_monitoring_coordinator.hpp"

namespace taskorch::coordinators::queue {

struct QueueCoordinatorOptions {
  bool                      autostart = true;
  std::vector<TaskTrigger>  triggers;
  std::chrono::milliseconds retention{0};
};

/*
  Queue domain orchestrator. Thin: each call goes to the sub-coordinator
  that owns it.

  Initialize order is events, execution, monitoring, lifecycle, so that
  every subscription is in place before the first loop starts; Cleanup
  runs it backwards.
*/
class QueueCoordinator final : public Lifecycle {
 public:
  QueueCoordinator(std::shared_ptr<scheduler::QueueScheduler> scheduler, std::shared_ptr<state::StateRepository> state,
                   std::shared_ptr<events::EventBus> bus, QueueCoordinatorOptions options);

  std::string_view Name() const override {
    return "queue";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  std::string Enqueue(const scheduler::TaskSpec& spec) {
    return execution_.Enqueue(spec);
  }
  void Cancel(const std::string& task_id) {
    execution_.Cancel(task_id);
  }

  void StartQueue(const std::string& queue_name) {
    lifecycle_.StartQueue(queue_name);
  }
  void StopQueue(const std::string& queue_name) {
    lifecycle_.StopQueue(queue_name);
  }

  taskorch::v1::QueueState Status(const std::string& queue_name) const {
    return monitoring_.Status(queue_name);
  }
  std::map<std::string, taskorch::v1::QueueState> AllStatuses() const {
    return monitoring_.AllStatuses();
  }
  std::vector<taskorch::v1::TaskView> PendingTasks(const std::string& queue_name, std::size_t limit) const {
    return monitoring_.PendingTasks(queue_name, limit);
  }
  std::vector<taskorch::v1::TaskView> History(const std::string& queue_name, std::chrono::milliseconds window) const {
    return monitoring_.History(queue_name, window);
  }
  taskorch::v1::TaskView Task(const std::string& task_id) const {
    return monitoring_.Task(task_id);
  }
  QueueHealthReport HealthReport() const {
    return monitoring_.HealthReport();
  }

  std::vector<scheduler::LoopState> LoopStates() const {
    return scheduler_->LoopStates();
  }

 private:
  std::shared_ptr<scheduler::QueueScheduler> scheduler_;

  QueueEventCoordinator      events_;
  QueueExecutionCoordinator  execution_;
  QueueMonitoringCoordinator monitoring_;
  QueueLifecycleCoordinator  lifecycle_;

  std::atomic<bool> initialized_{false};
};

} // namespace taskorch::coordinators::queue
