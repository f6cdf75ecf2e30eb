#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/coordinators/lifecycle.hpp"
#include "internal/scheduler/queue_scheduler.hpp"
#include "internal/state/state_repository.hpp"

namespace taskorch::coordinators::queue {

struct StalledTask {
  std::string task_id;
  std::string queue_name;
  std::string task_type;
  int64_t     running_for_ms = 0;
  int64_t     timeout_ms     = 0;
};

struct QueueHealthReport {
  std::map<std::string, taskorch::v1::QueueState> queues;
  std::vector<StalledTask>                        stalled;
  bool                                            healthy = true;
};

/*
  Read side of the queue domain: status queries, stalled-task detection
  and retention pruning of finished rows.
*/
class QueueMonitoringCoordinator final : public Lifecycle {
 public:
  // retention 0 disables pruning
  QueueMonitoringCoordinator(std::shared_ptr<state::StateRepository> state, std::shared_ptr<scheduler::QueueScheduler> scheduler,
                             std::chrono::milliseconds retention);

  std::string_view Name() const override {
    return "queue.monitoring";
  }

  // Prunes once when retention is configured.
  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  taskorch::v1::QueueState                        Status(const std::string& queue_name) const;
  std::map<std::string, taskorch::v1::QueueState> AllStatuses() const;
  std::vector<taskorch::v1::TaskView>             PendingTasks(const std::string& queue_name, std::size_t limit) const;
  std::vector<taskorch::v1::TaskView>             History(const std::string& queue_name, std::chrono::milliseconds window) const;
  taskorch::v1::TaskView                          Task(const std::string& task_id) const;

  // RUNNING tasks older than their queue's timeout.
  std::vector<StalledTask> StalledTasks() const;

  QueueHealthReport HealthReport() const;

  uint64_t PruneFinished() const;

 private:
  std::shared_ptr<state::StateRepository>    state_;
  std::shared_ptr<scheduler::QueueScheduler> scheduler_;
  std::chrono::milliseconds                  retention_;
  std::atomic<bool>                          initialized_{false};
};

} // namespace taskorch::coordinators::queue
