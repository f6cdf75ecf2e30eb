#include "event_bus.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace taskorch::events {

namespace {

// Subscriptions currently being delivered on this thread, for re-entrant
// Unsubscribe() calls from inside a handler.
thread_local std::vector<const void*> tls_dispatching;

bool DispatchingOnThisThread(const void* sub) {
  for (const void* p : tls_dispatching) {
    if (p == sub) return true;
  }
  return false;
}

} // namespace

EventBus::EventBus() = default;

EventBus::~EventBus() = default;

SubscriptionId EventBus::Subscribe(taskorch::v1::EventType type, Handler handler) {
  auto sub     = std::make_shared<Subscription>();
  sub->type    = type;
  sub->handler = std::move(handler);

  std::lock_guard lock(mutex_);
  sub->id = next_id_++;
  by_type_[static_cast<int>(type)].push_back(sub);
  by_id_.emplace(sub->id, sub);
  return sub->id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
  SubscriptionPtr sub;
  {
    std::lock_guard lock(mutex_);
    auto            it = by_id_.find(id);
    if (it == by_id_.end()) return;
    sub = it->second;
    by_id_.erase(it);

    auto& list = by_type_[static_cast<int>(sub->type)];
    std::erase(list, sub);
  }

  sub->active = false;

  if (DispatchingOnThisThread(sub.get())) return;

  std::unique_lock lock(sub->mutex);
  sub->idle_cv.wait(lock, [&] { return sub->in_flight == 0; });
}

void EventBus::Publish(const taskorch::v1::Event& event) {
  std::vector<SubscriptionPtr> snapshot;
  {
    std::lock_guard lock(mutex_);
    auto            it = by_type_.find(static_cast<int>(event.type()));
    if (it == by_type_.end()) return;
    snapshot = it->second;
  }

  for (const auto& sub : snapshot) {
    Deliver(sub, event);
  }
}

void EventBus::Deliver(const SubscriptionPtr& sub, const taskorch::v1::Event& event) {
  {
    std::lock_guard lock(sub->mutex);
    if (!sub->active) return;
    ++sub->in_flight;
  }

  tls_dispatching.push_back(sub.get());
  try {
    sub->handler(event);
  } catch (const std::exception& e) {
    TASKORCH_LOG_ERROR("event handler failed", {observability::StringField("event_type", taskorch::v1::EventType_Name(event.type())),
                                                observability::StringField("event_id", event.id()),
                                                observability::StringField("error", e.what())});
    observability::Metrics::Instance().RecordHandlerFailure(taskorch::v1::EventType_Name(event.type()));
  } catch (...) {
    TASKORCH_LOG_ERROR("event handler failed", {observability::StringField("event_type", taskorch::v1::EventType_Name(event.type())),
                                                observability::StringField("event_id", event.id()),
                                                observability::StringField("error", "non-standard exception")});
    observability::Metrics::Instance().RecordHandlerFailure(taskorch::v1::EventType_Name(event.type()));
  }
  tls_dispatching.pop_back();

  {
    std::lock_guard lock(sub->mutex);
    --sub->in_flight;
  }
  sub->idle_cv.notify_all();
}

std::size_t EventBus::SubscriberCount(taskorch::v1::EventType type) const {
  std::lock_guard lock(mutex_);
  auto            it = by_type_.find(static_cast<int>(type));
  return it == by_type_.end() ? 0 : it->second.size();
}

taskorch::v1::Event MakeEvent(taskorch::v1::EventType type, std::string source, google::protobuf::Struct data) {
  taskorch::v1::Event event;
  event.set_id(util::NewId());
  event.set_type(type);
  event.set_source(std::move(source));
  *event.mutable_timestamp() = util::ToProto(util::Now());
  *event.mutable_data()      = std::move(data);
  return event;
}

} // namespace taskorch::events
