#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "internal/coordinators/lifecycle.hpp"
#include "internal/events/event_bus.hpp"
#include "status_aggregation_coordinator.hpp"

namespace taskorch::coordinators::status {

/*
  Refresh thread. Rebuilds the snapshot when something relevant happened
  (QUEUE_STATUS_CHANGED, AGENT_STATUS_CHANGED, BROADCAST_HEALTH_CHANGED,
  SYSTEM_ERROR) or every refresh_interval, and publishes STATUS_SNAPSHOT.

  Event handlers only raise a flag, so bursts of events collapse into one
  refresh and publishers never wait on aggregation.
*/
class StatusMonitorCoordinator final : public Lifecycle {
 public:
  StatusMonitorCoordinator(std::shared_ptr<events::EventBus> bus, const StatusAggregationCoordinator& aggregation,
                           std::chrono::milliseconds refresh_interval);
  ~StatusMonitorCoordinator();

  std::string_view Name() const override {
    return "status.monitor";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  // Aggregates and publishes on the calling thread.
  taskorch::v1::StatusSnapshot RefreshNow();

  std::optional<taskorch::v1::StatusSnapshot> LastSnapshot() const;

  void RequestRefresh();

 private:
  void Run();

  std::shared_ptr<events::EventBus>   bus_;
  const StatusAggregationCoordinator& aggregation_;
  std::chrono::milliseconds           refresh_interval_;
  events::SubscriptionSet             subscriptions_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  bool                    dirty_    = false;

  mutable std::mutex                          snapshot_mutex_;
  std::optional<taskorch::v1::StatusSnapshot> last_;

  std::atomic<bool> initialized_{false};
};

} // namespace taskorch::coordinators::status
