#include "broadcast_execution_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/errors.hpp"

namespace taskorch::coordinators::broadcast {

using observability::StringField;

BroadcastExecutionCoordinator::BroadcastExecutionCoordinator(std::shared_ptr<taskorch::broadcast::BroadcastTransport> transport,
                                                             BroadcastHealthCoordinator& health, std::chrono::milliseconds send_timeout)
    : transport_(std::move(transport)), health_(health), send_timeout_(send_timeout) {
}

SendResult BroadcastExecutionCoordinator::Send(const taskorch::v1::StatusUpdate& update) {
  if (!health_.TryAcquire()) {
    observability::Metrics::Instance().RecordBroadcast("short_circuited");
    TASKORCH_LOG_DEBUG("broadcast short-circuited", {StringField("hash", update.hash())});
    return SendResult::kShortCircuited;
  }

  auto transport = transport_;
  try {
    util::CallWithTimeout([transport, update] { transport->Send(update); }, send_timeout_, "broadcast via " + transport->Name());
  } catch (const util::BroadcastError& e) {
    health_.RecordFailure();
    observability::Metrics::Instance().RecordBroadcast("failed");
    TASKORCH_LOG_WARN("broadcast failed", {StringField("transport", transport->Name()), StringField("error", e.what())});
    return SendResult::kFailed;
  } catch (const util::TimeoutError& e) {
    health_.RecordFailure();
    observability::Metrics::Instance().RecordBroadcast("timeout");
    TASKORCH_LOG_WARN("broadcast timed out", {StringField("transport", transport->Name()), StringField("error", e.what())});
    return SendResult::kFailed;
  } catch (const std::exception& e) {
    health_.RecordFailure();
    observability::Metrics::Instance().RecordBroadcast("failed");
    TASKORCH_LOG_WARN("broadcast failed", {StringField("transport", transport->Name()), StringField("error", e.what())});
    return SendResult::kFailed;
  }

  health_.RecordSuccess();
  observability::Metrics::Instance().RecordBroadcast("sent");
  return SendResult::kSent;
}

} // namespace taskorch::coordinators::broadcast
