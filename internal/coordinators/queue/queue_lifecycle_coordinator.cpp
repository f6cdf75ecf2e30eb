#include "queue_lifecycle_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::coordinators::queue {

QueueLifecycleCoordinator::QueueLifecycleCoordinator(std::shared_ptr<scheduler::QueueScheduler> scheduler,
                                                     std::shared_ptr<events::EventBus> bus, bool autostart)
    : scheduler_(std::move(scheduler)), bus_(std::move(bus)), autostart_(autostart) {
}

void QueueLifecycleCoordinator::Initialize() {
  if (initialized_.exchange(true)) return;

  if (autostart_) {
    for (const auto& name : scheduler_->QueueNames()) StartQueue(name);
  }
}

void QueueLifecycleCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;

  for (const auto& name : scheduler_->QueueNames()) StopQueue(name);
}

void QueueLifecycleCoordinator::StartQueue(const std::string& queue_name) {
  if (scheduler_->IsRunning(queue_name)) return;
  scheduler_->StartQueue(queue_name);
  Announce(taskorch::v1::EVENT_TYPE_QUEUE_STARTED, queue_name);
}

void QueueLifecycleCoordinator::StopQueue(const std::string& queue_name) {
  if (!scheduler_->IsRunning(queue_name)) return;
  scheduler_->StopQueue(queue_name);
  Announce(taskorch::v1::EVENT_TYPE_QUEUE_STOPPED, queue_name);
}

void QueueLifecycleCoordinator::Announce(taskorch::v1::EventType type, const std::string& queue_name) {
  google::protobuf::Struct data;
  util::SetString(data, "queue_name", queue_name);
  bus_->Publish(events::MakeEvent(type, std::string(Name()), std::move(data)));

  TASKORCH_LOG_INFO(type == taskorch::v1::EVENT_TYPE_QUEUE_STARTED ? "queue started" : "queue stopped",
                    {observability::StringField("queue", queue_name)});
}

} // namespace taskorch::coordinators::queue
