#include "message_handling_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::coordinators::message {

using observability::StringField;

MessageHandlingCoordinator::MessageHandlingCoordinator(MessageRoutingCoordinator& routing, std::shared_ptr<events::EventBus> bus)
    : routing_(routing), bus_(std::move(bus)) {
}

void MessageHandlingCoordinator::Initialize() {
  if (initialized_) return;

  if (!registered_) {
    using taskorch::v1::AgentMessage;
    routing_.RegisterHandler(taskorch::v1::MESSAGE_TYPE_TASK_REQUEST, [this](const AgentMessage& m) { OnTaskRequest(m); });
    routing_.RegisterHandler(taskorch::v1::MESSAGE_TYPE_ERROR_REPORT, [this](const AgentMessage& m) { OnErrorReport(m); });
    routing_.RegisterHandler(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, [this](const AgentMessage& m) { OnStatusUpdate(m); });
    routing_.RegisterHandler(taskorch::v1::MESSAGE_TYPE_REQUEST, [this](const AgentMessage& m) { OnRequest(m); });
    registered_ = true;
  }
  initialized_ = true;
}

void MessageHandlingCoordinator::Cleanup() {
  initialized_ = false;
}

void MessageHandlingCoordinator::OnTaskRequest(const taskorch::v1::AgentMessage& message) {
  if (!initialized_) return;
  const auto& content = message.content();

  google::protobuf::Struct data;
  util::SetString(data, "queue_name", util::GetString(content, "queue_name"));
  util::SetString(data, "task_type", util::GetString(content, "task_type"));
  util::SetStruct(data, "payload", util::GetStruct(content, "payload"));
  if (util::Has(content, "priority")) util::SetNumber(data, "priority", util::GetNumber(content, "priority"));
  if (util::Has(content, "max_retries")) util::SetNumber(data, "max_retries", util::GetNumber(content, "max_retries"));
  util::SetString(data, "requested_by", message.sender());
  util::SetString(data, "message_id", message.message_id());

  bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_TASK_REQUESTED, "message", std::move(data)));
}

void MessageHandlingCoordinator::OnErrorReport(const taskorch::v1::AgentMessage& message) {
  if (!initialized_) return;
  const auto& content = message.content();

  TASKORCH_LOG_WARN("agent reported error",
                    {StringField("agent", message.sender()), StringField("error", util::GetString(content, "error"))});

  google::protobuf::Struct data;
  util::SetString(data, "component", message.sender());
  util::SetString(data, "error", util::GetString(content, "error", util::GetString(content, "message")));
  util::SetString(data, "message_id", message.message_id());
  bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_SYSTEM_ERROR, "message", std::move(data)));
}

void MessageHandlingCoordinator::OnStatusUpdate(const taskorch::v1::AgentMessage& message) {
  if (!initialized_) return;
  const auto& content = message.content();

  google::protobuf::Struct data;
  util::SetString(data, "agent", message.sender());
  util::SetString(data, "status", util::GetString(content, "status"));
  if (util::Has(content, "current_task_id")) util::SetString(data, "current_task_id", util::GetString(content, "current_task_id"));
  if (util::Has(content, "error")) util::SetString(data, "error", util::GetString(content, "error"));
  bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_AGENT_STATUS_CHANGED, "message", std::move(data)));
}

void MessageHandlingCoordinator::OnRequest(const taskorch::v1::AgentMessage& message) {
  if (!initialized_) return;
  if (util::GetString(message.content(), "action") != "ping") return;

  taskorch::v1::AgentMessage reply;
  reply.set_type(taskorch::v1::MESSAGE_TYPE_RESPONSE);
  reply.set_sender(message.recipient().empty() ? "system" : message.recipient());
  reply.set_recipient(message.sender());
  reply.set_correlation_id(message.correlation_id().empty() ? message.message_id() : message.correlation_id());
  util::SetString(*reply.mutable_content(), "status", "ok");

  try {
    routing_.Send(std::move(reply));
  } catch (const std::exception& e) {
    TASKORCH_LOG_WARN("ping reply dropped", {StringField("message_id", message.message_id()), StringField("error", e.what())});
  }
}

} // namespace taskorch::coordinators::message
