#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "status_aggregation_coordinator.hpp"
#include "status_monitor_coordinator.hpp"

namespace taskorch::coordinators::status {

class StatusCoordinator final : public Lifecycle {
 public:
  StatusCoordinator(std::shared_ptr<events::EventBus> bus, std::vector<std::shared_ptr<taskorch::status::StatusSource>> sources,
                    std::chrono::milliseconds source_timeout, std::chrono::milliseconds refresh_interval);

  std::string_view Name() const override {
    return "status";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  // Fresh aggregation; does not publish.
  taskorch::v1::StatusSnapshot Aggregate() const {
    return aggregation_.Aggregate();
  }

  // Fresh aggregation, published as STATUS_SNAPSHOT.
  taskorch::v1::StatusSnapshot Refresh() {
    return monitor_.RefreshNow();
  }

  std::optional<taskorch::v1::StatusSnapshot> LastSnapshot() const {
    return monitor_.LastSnapshot();
  }

 private:
  StatusAggregationCoordinator aggregation_;
  StatusMonitorCoordinator     monitor_;
  std::atomic<bool>            initialized_{false};
};

} // namespace taskorch::coordinators::status
