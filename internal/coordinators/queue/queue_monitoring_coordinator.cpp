#include "queue_monitoring_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace taskorch::coordinators::queue {

using observability::StringField;

QueueMonitoringCoordinator::QueueMonitoringCoordinator(std::shared_ptr<state::StateRepository>    state,
                                                       std::shared_ptr<scheduler::QueueScheduler> scheduler,
                                                       std::chrono::milliseconds                  retention)
    : state_(std::move(state)), scheduler_(std::move(scheduler)), retention_(retention) {
}

void QueueMonitoringCoordinator::Initialize() {
  if (initialized_.exchange(true)) return;

  if (retention_.count() > 0) {
    try {
      PruneFinished();
    } catch (const util::StoreError& e) {
      TASKORCH_LOG_WARN("pruning finished tasks failed", {StringField("error", e.what())});
    }
  }
}

void QueueMonitoringCoordinator::Cleanup() {
  initialized_ = false;
}

taskorch::v1::QueueState QueueMonitoringCoordinator::Status(const std::string& queue_name) const {
  return state_->GetStatus(queue_name);
}

std::map<std::string, taskorch::v1::QueueState> QueueMonitoringCoordinator::AllStatuses() const {
  auto states = state_->GetAllStatuses();
  for (const auto& [name, s] : states) {
    if (s.error().empty()) observability::Metrics::Instance().SetQueueDepth(name, s.pending());
  }
  return states;
}

std::vector<taskorch::v1::TaskView> QueueMonitoringCoordinator::PendingTasks(const std::string& queue_name, std::size_t limit) const {
  return state_->GetPendingTasks(queue_name, limit);
}

std::vector<taskorch::v1::TaskView> QueueMonitoringCoordinator::History(const std::string&        queue_name,
                                                                        std::chrono::milliseconds window) const {
  return state_->GetTaskHistory(queue_name, window);
}

taskorch::v1::TaskView QueueMonitoringCoordinator::Task(const std::string& task_id) const {
  return state_->GetTask(task_id);
}

std::vector<StalledTask> QueueMonitoringCoordinator::StalledTasks() const {
  const auto now_ms = static_cast<int64_t>(util::ToUnixMillis(util::Now()));

  std::vector<StalledTask> out;
  for (const auto& task : state_->GetRunningTasks()) {
    if (!task.has_started_at()) continue;

    int64_t timeout_ms = 0;
    try {
      timeout_ms = static_cast<int64_t>(scheduler_->Queue(task.queue_name()).timeout.count());
    } catch (const util::NotFound&) {
      continue;  // rows of a queue no longer configured
    }

    const auto started_ms = static_cast<int64_t>(util::ToUnixMillis(util::FromProto(task.started_at())));
    const auto running_ms = now_ms - started_ms;
    if (running_ms > timeout_ms) {
      out.push_back({task.task_id(), task.queue_name(), task.task_type(), running_ms, timeout_ms});
    }
  }
  return out;
}

QueueHealthReport QueueMonitoringCoordinator::HealthReport() const {
  QueueHealthReport report;
  report.queues  = AllStatuses();
  report.stalled = StalledTasks();

  report.healthy = report.stalled.empty();
  for (const auto& [_, s] : report.queues) {
    if (!s.error().empty() || s.status() == taskorch::v1::QUEUE_STATUS_DEGRADED) report.healthy = false;
  }

  for (const auto& st : report.stalled) {
    TASKORCH_LOG_WARN("stalled task", {StringField("queue", st.queue_name), StringField("task_id", st.task_id),
                                       observability::IntField("running_for_ms", st.running_for_ms),
                                       observability::IntField("timeout_ms", st.timeout_ms)});
  }
  return report;
}

uint64_t QueueMonitoringCoordinator::PruneFinished() const {
  if (retention_.count() <= 0) return 0;
  return state_->PruneFinishedTasks(retention_);
}

} // namespace taskorch::coordinators::queue
