#include "status_monitor_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::coordinators::status {

namespace {

constexpr taskorch::v1::EventType kRefreshTriggers[] = {
    taskorch::v1::EVENT_TYPE_QUEUE_STATUS_CHANGED,
    taskorch::v1::EVENT_TYPE_AGENT_STATUS_CHANGED,
    taskorch::v1::EVENT_TYPE_BROADCAST_HEALTH_CHANGED,
    taskorch::v1::EVENT_TYPE_SYSTEM_ERROR,
};

} // namespace

StatusMonitorCoordinator::StatusMonitorCoordinator(std::shared_ptr<events::EventBus> bus, const StatusAggregationCoordinator& aggregation,
                                                   std::chrono::milliseconds refresh_interval)
    : bus_(bus), aggregation_(aggregation), refresh_interval_(refresh_interval), subscriptions_(std::move(bus)) {
}

StatusMonitorCoordinator::~StatusMonitorCoordinator() {
  Cleanup();
}

void StatusMonitorCoordinator::Initialize() {
  if (initialized_.exchange(true)) return;

  for (auto type : kRefreshTriggers) {
    subscriptions_.Add(type, [this](const taskorch::v1::Event&) { RequestRefresh(); });
  }

  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
    dirty_    = true;
  }
  thread_ = std::thread(&StatusMonitorCoordinator::Run, this);
}

void StatusMonitorCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;

  subscriptions_.UnsubscribeAll();
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void StatusMonitorCoordinator::RequestRefresh() {
  {
    std::lock_guard lock(mutex_);
    dirty_ = true;
  }
  cv_.notify_all();
}

void StatusMonitorCoordinator::Run() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    cv_.wait_for(lock, refresh_interval_, [&] { return stopping_ || dirty_; });
    if (stopping_) break;
    dirty_ = false;

    lock.unlock();
    try {
      RefreshNow();
    } catch (const std::exception& e) {
      TASKORCH_LOG_ERROR("status refresh failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

taskorch::v1::StatusSnapshot StatusMonitorCoordinator::RefreshNow() {
  auto snapshot = aggregation_.Aggregate();
  {
    std::lock_guard lock(snapshot_mutex_);
    last_ = snapshot;
  }

  google::protobuf::Struct data;
  util::SetStruct(data, "snapshot", util::ToStruct(snapshot));
  bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_STATUS_SNAPSHOT, std::string(Name()), std::move(data)));
  return snapshot;
}

std::optional<taskorch::v1::StatusSnapshot> StatusMonitorCoordinator::LastSnapshot() const {
  std::lock_guard lock(snapshot_mutex_);
  return last_;
}

} // namespace taskorch::coordinators::status
