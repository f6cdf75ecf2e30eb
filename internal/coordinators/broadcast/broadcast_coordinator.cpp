#include "broadcast_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/status/snapshot_hash.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::coordinators::broadcast {

BroadcastCoordinator::BroadcastCoordinator(std::shared_ptr<events::EventBus> bus, std::shared_ptr<taskorch::broadcast::CircuitBreaker> breaker,
                                           std::shared_ptr<taskorch::broadcast::BroadcastTransport> transport,
                                           std::chrono::milliseconds                                send_timeout)
    : health_(std::move(breaker), bus), execution_(std::move(transport), health_, send_timeout), subscriptions_(std::move(bus)) {
}

void BroadcastCoordinator::Initialize() {
  if (initialized_.exchange(true)) return;

  health_.Initialize();
  execution_.Initialize();
  subscriptions_.Add(taskorch::v1::EVENT_TYPE_STATUS_SNAPSHOT, [this](const taskorch::v1::Event& e) { OnSnapshot(e); });
}

void BroadcastCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;

  subscriptions_.UnsubscribeAll();
  execution_.Cleanup();
  health_.Cleanup();
}

void BroadcastCoordinator::OnSnapshot(const taskorch::v1::Event& event) {
  taskorch::v1::StatusSnapshot snapshot;
  try {
    util::FromStruct(util::GetStruct(event.data(), "snapshot"), &snapshot);
  } catch (const util::ValidationError& e) {
    TASKORCH_LOG_ERROR("undecodable status snapshot", {observability::StringField("event_id", event.id()),
                                                       observability::StringField("error", e.what())});
    return;
  }
  Broadcast(snapshot);
}

BroadcastResult BroadcastCoordinator::Broadcast(const taskorch::v1::StatusSnapshot& snapshot) {
  taskorch::v1::StatusUpdate update;
  *update.mutable_snapshot() = snapshot;
  update.set_hash(taskorch::status::SnapshotHash(snapshot));

  std::lock_guard lock(mutex_);
  if (update.hash() == last_sent_hash_) {
    return BroadcastResult::kUnchanged;
  }

  switch (execution_.Send(update)) {
    case SendResult::kSent:
      last_sent_hash_ = update.hash();
      return BroadcastResult::kSent;
    case SendResult::kShortCircuited:
      return BroadcastResult::kShortCircuited;
    case SendResult::kFailed:
      break;
  }
  return BroadcastResult::kFailed;
}

std::string BroadcastCoordinator::LastSentHash() const {
  std::lock_guard lock(mutex_);
  return last_sent_hash_;
}

} // namespace taskorch::coordinators::broadcast
