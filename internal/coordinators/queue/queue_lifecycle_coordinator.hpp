#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "internal/coordinators/lifecycle.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/scheduler/queue_scheduler.hpp"

namespace taskorch::coordinators::queue {

// Starts and stops queue loops; announces QUEUE_STARTED / QUEUE_STOPPED.
class QueueLifecycleCoordinator final : public Lifecycle {
 public:
  QueueLifecycleCoordinator(std::shared_ptr<scheduler::QueueScheduler> scheduler, std::shared_ptr<events::EventBus> bus, bool autostart);

  std::string_view Name() const override {
    return "queue.lifecycle";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  void StartQueue(const std::string& queue_name);
  void StopQueue(const std::string& queue_name);

 private:
  void Announce(taskorch::v1::EventType type, const std::string& queue_name);

  std::shared_ptr<scheduler::QueueScheduler> scheduler_;
  std::shared_ptr<events::EventBus>          bus_;
  bool                                       autostart_;
  std::atomic<bool>                          initialized_{false};
};

} // namespace taskorch::coordinators::queue
