#include "queue_event_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::coordinators::queue {

using taskorch::v1::EventType;

namespace {

constexpr EventType kQueueActivity[] = {
    taskorch::v1::EVENT_TYPE_TASK_ENQUEUED,        taskorch::v1::EVENT_TYPE_TASK_STARTED,
    taskorch::v1::EVENT_TYPE_TASK_COMPLETED,       taskorch::v1::EVENT_TYPE_TASK_FAILED,
    taskorch::v1::EVENT_TYPE_TASK_RETRY_SCHEDULED, taskorch::v1::EVENT_TYPE_TASK_CANCELLED,
    taskorch::v1::EVENT_TYPE_QUEUE_STARTED,        taskorch::v1::EVENT_TYPE_QUEUE_STOPPED,
};

} // namespace

QueueEventCoordinator::QueueEventCoordinator(std::shared_ptr<events::EventBus> bus, std::vector<TaskTrigger> triggers)
    : bus_(bus), triggers_(std::move(triggers)), subscriptions_(std::move(bus)) {
}

void QueueEventCoordinator::Initialize() {
  if (initialized_.exchange(true)) return;
  for (auto type : kQueueActivity) {
    subscriptions_.Add(type, [this](const taskorch::v1::Event& e) { OnQueueActivity(e); });
  }
}

void QueueEventCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;
  subscriptions_.UnsubscribeAll();
}

void QueueEventCoordinator::OnQueueActivity(const taskorch::v1::Event& event) {
  const auto queue_name = util::GetString(event.data(), "queue_name");
  if (queue_name.empty()) return;

  google::protobuf::Struct data;
  util::SetString(data, "queue_name", queue_name);
  util::SetString(data, "cause", taskorch::v1::EventType_Name(event.type()));
  if (util::Has(event.data(), "task_id")) {
    util::SetString(data, "task_id", util::GetString(event.data(), "task_id"));
  }
  bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_QUEUE_STATUS_CHANGED, std::string(Name()), std::move(data)));

  if (event.type() == taskorch::v1::EVENT_TYPE_TASK_COMPLETED || event.type() == taskorch::v1::EVENT_TYPE_TASK_FAILED) {
    EvaluateTriggers(event);
  }
}

void QueueEventCoordinator::EvaluateTriggers(const taskorch::v1::Event& event) {
  const auto& d = event.data();
  if (event.type() == taskorch::v1::EVENT_TYPE_TASK_FAILED && util::GetBool(d, "will_retry")) return;

  const auto queue_name = util::GetString(d, "queue_name");
  const auto task_type  = util::GetString(d, "task_type");

  for (const auto& t : triggers_) {
    if (t.on_event != event.type()) continue;
    if (!t.source_queue.empty() && t.source_queue != queue_name) continue;
    if (!t.source_task_type.empty() && t.source_task_type != task_type) continue;

    google::protobuf::Struct payload;
    util::SetString(payload, "source_task_id", util::GetString(d, "task_id"));
    util::SetString(payload, "source_queue", queue_name);
    util::SetString(payload, "source_task_type", task_type);
    if (event.type() == taskorch::v1::EVENT_TYPE_TASK_COMPLETED) {
      util::SetStruct(payload, "result", util::GetStruct(d, "result"));
    } else {
      util::SetString(payload, "error", util::GetString(d, "error"));
    }

    google::protobuf::Struct request;
    util::SetString(request, "queue_name", t.target_queue);
    util::SetString(request, "task_type", t.target_task_type);
    util::SetNumber(request, "priority", t.priority);
    util::SetStruct(request, "payload", payload);
    util::SetString(request, "requested_by", "trigger");

    TASKORCH_LOG_DEBUG("trigger fired", {observability::StringField("source_task_id", util::GetString(d, "task_id")),
                                         observability::StringField("target_queue", t.target_queue),
                                         observability::StringField("target_task_type", t.target_task_type)});
    bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_TASK_REQUESTED, std::string(Name()), std::move(request)));
  }
}

} // namespace taskorch::coordinators::queue
