#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "taskorch/v1.hpp"

namespace taskorch::events {

using Handler        = std::function<void(const taskorch::v1::Event&)>;
using SubscriptionId = uint64_t;

/*
  In-process publish/subscribe hub.

  - Handlers for one event type run in registration order, synchronously
    on the publishing thread; Publish() returns once all of them have.
  - A throwing handler is logged and skipped.
  - Each publish walks a snapshot of the subscriber list, so handlers may
    subscribe or unsubscribe (themselves included) while being invoked.
  - Delivery order per subscriber follows the publish order of each
    publishing thread.

  Constructed explicitly and injected; there is no global instance.
*/
class EventBus {
 public:
  EventBus();
  ~EventBus();

  EventBus(const EventBus&)            = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId Subscribe(taskorch::v1::EventType type, Handler handler);

  // Idempotent. Blocks until in-flight deliveries to this subscription
  // finish, except when called from a handler running on this thread.
  void Unsubscribe(SubscriptionId id);

  void Publish(const taskorch::v1::Event& event);

  std::size_t SubscriberCount(taskorch::v1::EventType type) const;

 private:
  struct Subscription {
    SubscriptionId           id;
    taskorch::v1::EventType  type;
    Handler                  handler;
    std::atomic<bool>        active{true};
    std::mutex               mutex;
    std::condition_variable  idle_cv;
    int                      in_flight = 0;
  };
  using SubscriptionPtr = std::shared_ptr<Subscription>;

  void Deliver(const SubscriptionPtr& sub, const taskorch::v1::Event& event);

  mutable std::mutex mutex_;
  std::unordered_map<int, std::vector<SubscriptionPtr>> by_type_;
  std::unordered_map<SubscriptionId, SubscriptionPtr>   by_id_;
  SubscriptionId                                        next_id_ = 1;
};

// Stamps a fresh UUID v4 id and the current time.
taskorch::v1::Event MakeEvent(taskorch::v1::EventType type, std::string source, google::protobuf::Struct data = {});

/*
  Subscriptions owned by one component; UnsubscribeAll() on Cleanup().
*/
class SubscriptionSet {
 public:
  explicit SubscriptionSet(std::shared_ptr<EventBus> bus) : bus_(std::move(bus)) {
  }
  ~SubscriptionSet() {
    UnsubscribeAll();
  }

  void Add(taskorch::v1::EventType type, Handler handler) {
    ids_.push_back(bus_->Subscribe(type, std::move(handler)));
  }

  void UnsubscribeAll() {
    for (auto id : ids_) bus_->Unsubscribe(id);
    ids_.clear();
  }

  std::size_t Size() const {
    return ids_.size();
  }

 private:
  std::shared_ptr<EventBus>   bus_;
  std::vector<SubscriptionId> ids_;
};

} // namespace taskorch::events
