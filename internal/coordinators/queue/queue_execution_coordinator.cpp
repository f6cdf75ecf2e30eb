#include "queue_execution_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::coordinators::queue {

using observability::StringField;

QueueExecutionCoordinator::QueueExecutionCoordinator(std::shared_ptr<scheduler::QueueScheduler> scheduler,
                                                     std::shared_ptr<events::EventBus>          bus)
    : scheduler_(std::move(scheduler)), bus_(bus), subscriptions_(std::move(bus)) {
}

void QueueExecutionCoordinator::Initialize() {
  if (initialized_.exchange(true)) return;
  subscriptions_.Add(taskorch::v1::EVENT_TYPE_TASK_REQUESTED, [this](const taskorch::v1::Event& e) { OnTaskRequested(e); });
}

void QueueExecutionCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;
  subscriptions_.UnsubscribeAll();
}

std::string QueueExecutionCoordinator::Enqueue(const scheduler::TaskSpec& spec) {
  return scheduler_->Enqueue(spec);
}

void QueueExecutionCoordinator::Cancel(const std::string& task_id) {
  scheduler_->Cancel(task_id);
}

void QueueExecutionCoordinator::OnTaskRequested(const taskorch::v1::Event& event) {
  const auto& data = event.data();

  scheduler::TaskSpec spec;
  spec.queue_name  = util::GetString(data, "queue_name");
  spec.task_type   = util::GetString(data, "task_type");
  spec.payload     = util::GetStruct(data, "payload");

  try {
    spec.priority    = util::GetInt32(data, "priority", 0);
    spec.max_retries = util::GetInt32(data, "max_retries", -1);

    const auto task_id = scheduler_->Enqueue(spec);
    TASKORCH_LOG_DEBUG("requested task accepted",
                       {StringField("request_id", event.id()), StringField("source", event.source()), StringField("task_id", task_id)});
  } catch (const std::exception& e) {
    TASKORCH_LOG_WARN("requested task rejected", {StringField("request_id", event.id()), StringField("source", event.source()),
                                                  StringField("queue", spec.queue_name), StringField("error", e.what())});

    google::protobuf::Struct error;
    util::SetString(error, "component", std::string(Name()));
    util::SetString(error, "error", e.what());
    util::SetString(error, "request_id", event.id());
    util::SetString(error, "queue_name", spec.queue_name);
    util::SetString(error, "task_type", spec.task_type);
    bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_SYSTEM_ERROR, std::string(Name()), std::move(error)));
  }
}

} // namespace taskorch::coordinators::queue
