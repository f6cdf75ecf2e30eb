#include "broadcast_health_coordinator.hpp"

#include "internal/util/struct_fields.hpp"

namespace taskorch::coordinators::broadcast {

BroadcastHealthCoordinator::BroadcastHealthCoordinator(std::shared_ptr<taskorch::broadcast::CircuitBreaker> breaker,
                                                       std::shared_ptr<events::EventBus>                    bus)
    : breaker_(std::move(breaker)), bus_(std::move(bus)) {
}

void BroadcastHealthCoordinator::Initialize() {
  if (initialized_.exchange(true)) return;

  auto bus = bus_;
  breaker_->SetListener([bus](taskorch::v1::BreakerPhase from, const taskorch::broadcast::CircuitBreakerState& to) {
    google::protobuf::Struct data;
    util::SetString(data, "from", taskorch::v1::BreakerPhase_Name(from));
    util::SetString(data, "to", taskorch::v1::BreakerPhase_Name(to.phase));
    util::SetNumber(data, "consecutive_failures", to.consecutive_failures);
    util::SetNumber(data, "consecutive_successes", to.consecutive_successes);
    bus->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_BROADCAST_HEALTH_CHANGED, "broadcast.health", std::move(data)));
  });
}

void BroadcastHealthCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;
  breaker_->SetListener(nullptr);
}

} // namespace taskorch::coordinators::broadcast
