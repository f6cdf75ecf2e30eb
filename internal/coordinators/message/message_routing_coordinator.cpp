#include "message_routing_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/struct_fields.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace taskorch::coordinators::message {

using observability::StringField;

namespace {

google::protobuf::Struct Describe(const taskorch::v1::AgentMessage& m) {
  google::protobuf::Struct data;
  util::SetString(data, "message_id", m.message_id());
  util::SetString(data, "message_type", taskorch::v1::MessageType_Name(m.type()));
  util::SetString(data, "sender", m.sender());
  util::SetString(data, "recipient", m.recipient());
  if (!m.correlation_id().empty()) util::SetString(data, "correlation_id", m.correlation_id());
  return data;
}

} // namespace

MessageRoutingCoordinator::MessageRoutingCoordinator(std::shared_ptr<events::EventBus> bus, std::size_t mailbox_capacity,
                                                     std::chrono::milliseconds request_timeout)
    : bus_(std::move(bus)), mailbox_capacity_(mailbox_capacity), request_timeout_(request_timeout) {
}

MessageRoutingCoordinator::~MessageRoutingCoordinator() {
  Cleanup();
}

void MessageRoutingCoordinator::Initialize() {
  if (initialized_) return;

  mailbox_     = std::make_unique<util::BlockingQueue<taskorch::v1::AgentMessage>>(mailbox_capacity_);
  thread_      = std::thread(&MessageRoutingCoordinator::Run, this);
  initialized_ = true;
}

void MessageRoutingCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;

  mailbox_->Shutdown();
  if (thread_.joinable()) thread_.join();
  FailPending("message routing stopped");
}

std::string MessageRoutingCoordinator::Send(taskorch::v1::AgentMessage message) {
  if (!initialized_) {
    throw util::InvalidState("message routing is not running");
  }
  if (message.type() == taskorch::v1::MESSAGE_TYPE_UNSPECIFIED) {
    throw util::ValidationError("message type is required");
  }
  if (message.message_id().empty()) message.set_message_id(util::NewId());
  if (!message.has_timestamp()) *message.mutable_timestamp() = util::ToProto(util::Now());

  auto id   = message.message_id();
  auto data = Describe(message);

  if (!mailbox_->TryPush(std::move(message))) {
    throw util::ResourceExhausted("mailbox full, message " + id + " rejected");
  }

  bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_MESSAGE_SENT, std::string(Name()), std::move(data)));
  return id;
}

taskorch::v1::AgentMessage MessageRoutingCoordinator::Request(taskorch::v1::AgentMessage             message,
                                                              std::optional<std::chrono::milliseconds> timeout) {
  if (message.message_id().empty()) message.set_message_id(util::NewId());
  if (message.correlation_id().empty()) message.set_correlation_id(message.message_id());

  const auto correlation_id = message.correlation_id();
  auto       reply          = std::make_shared<std::promise<taskorch::v1::AgentMessage>>();
  auto       future         = reply->get_future();
  {
    std::lock_guard lock(pending_mutex_);
    pending_[correlation_id] = reply;
  }

  try {
    Send(std::move(message));
  } catch (const std::exception&) {
    std::lock_guard lock(pending_mutex_);
    pending_.erase(correlation_id);
    throw;
  }

  const auto wait = timeout.value_or(request_timeout_);
  if (future.wait_for(wait) != std::future_status::ready) {
    std::lock_guard lock(pending_mutex_);
    pending_.erase(correlation_id);
    throw util::TimeoutError("no response to " + correlation_id + " within " + std::to_string(wait.count()) + "ms");
  }
  return future.get();
}

void MessageRoutingCoordinator::RegisterHandler(taskorch::v1::MessageType type, MessageHandler handler) {
  std::lock_guard lock(handlers_mutex_);
  handlers_[static_cast<int>(type)].push_back(std::move(handler));
}

void MessageRoutingCoordinator::Run() {
  while (auto message = mailbox_->Pop()) {
    Route(*message);
  }
}

void MessageRoutingCoordinator::Route(const taskorch::v1::AgentMessage& message) {
  if (message.type() == taskorch::v1::MESSAGE_TYPE_RESPONSE && !message.correlation_id().empty()) {
    PendingReply reply;
    {
      std::lock_guard lock(pending_mutex_);
      auto            it = pending_.find(message.correlation_id());
      if (it != pending_.end()) {
        reply = std::move(it->second);
        pending_.erase(it);
      }
    }
    if (reply) reply->set_value(message);
  }

  std::vector<MessageHandler> handlers;
  {
    std::lock_guard lock(handlers_mutex_);
    auto            it = handlers_.find(static_cast<int>(message.type()));
    if (it != handlers_.end()) handlers = it->second;
  }

  for (const auto& handler : handlers) {
    try {
      handler(message);
    } catch (const std::exception& e) {
      TASKORCH_LOG_ERROR("message handler failed", {StringField("message_id", message.message_id()),
                                                    StringField("message_type", taskorch::v1::MessageType_Name(message.type())),
                                                    StringField("error", e.what())});
    } catch (...) {
      TASKORCH_LOG_ERROR("message handler failed", {StringField("message_id", message.message_id()),
                                                    StringField("message_type", taskorch::v1::MessageType_Name(message.type())),
                                                    StringField("error", "non-standard exception")});
    }
  }

  ++delivered_;
  auto data = Describe(message);
  util::SetNumber(data, "handlers", static_cast<double>(handlers.size()));
  bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_MESSAGE_DELIVERED, std::string(Name()), std::move(data)));
}

void MessageRoutingCoordinator::FailPending(const std::string& reason) {
  std::unordered_map<std::string, PendingReply> pending;
  {
    std::lock_guard lock(pending_mutex_);
    pending.swap(pending_);
  }
  for (auto& [_, reply] : pending) {
    reply->set_exception(std::make_exception_ptr(util::InvalidState(reason)));
  }
}

} // namespace taskorch::coordinators::message
