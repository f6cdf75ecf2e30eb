#include "status_coordinator.hpp"

namespace taskorch::coordinators::status {

StatusCoordinator::StatusCoordinator(std::shared_ptr<events::EventBus> bus, std::vector<std::shared_ptr<taskorch::status::StatusSource>> sources,
                                     std::chrono::milliseconds source_timeout, std::chrono::milliseconds refresh_interval)
    : aggregation_(std::move(sources), source_timeout), monitor_(std::move(bus), aggregation_, refresh_interval) {
}

void StatusCoordinator::Initialize() {
  if (initialized_.exchange(true)) return;
  aggregation_.Initialize();
  monitor_.Initialize();
}

void StatusCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;
  monitor_.Cleanup();
  aggregation_.Cleanup();
}

} // namespace taskorch::coordinators::status
