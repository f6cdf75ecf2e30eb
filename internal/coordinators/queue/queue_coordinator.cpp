#include "queue_coordinator.hpp"

#include "internal/observability/logging.hpp"

namespace taskorch::coordinators::queue {

QueueCoordinator::QueueCoordinator(std::shared_ptr<scheduler::QueueScheduler> scheduler, std::shared_ptr<state::StateRepository> state,
                                   std::shared_ptr<events::EventBus> bus, QueueCoordinatorOptions options)
    : scheduler_(scheduler),
      events_(bus, std::move(options.triggers)),
      execution_(scheduler, bus),
      monitoring_(std::move(state), scheduler, options.retention),
      lifecycle_(scheduler, bus, options.autostart) {
}

void QueueCoordinator::Initialize() {
  if (initialized_.exchange(true)) return;

  events_.Initialize();
  execution_.Initialize();
  monitoring_.Initialize();
  lifecycle_.Initialize();

  TASKORCH_LOG_INFO("queue coordinator initialized",
                    {observability::IntField("queues", static_cast<int64_t>(scheduler_->QueueNames().size()))});
}

void QueueCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;

  lifecycle_.Cleanup();
  monitoring_.Cleanup();
  execution_.Cleanup();
  events_.Cleanup();
}

} // namespace taskorch::coordinators::queue
