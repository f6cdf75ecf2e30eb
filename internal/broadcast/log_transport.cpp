#include "broadcast_transport.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::broadcast {

void LogBroadcastTransport::Send(const taskorch::v1::StatusUpdate& update) {
  std::string json;
  try {
    json = util::ToJson(update.snapshot());
  } catch (const util::ValidationError& e) {
    throw util::BroadcastError(std::string("log transport: ") + e.what());
  }

  TASKORCH_LOG_INFO("status broadcast", {observability::StringField("hash", update.hash()),
                                         observability::StringField("overall", taskorch::v1::ComponentHealth_Name(update.snapshot().overall())),
                                         observability::StringField("snapshot", json)});
}

} // namespace taskorch::broadcast
