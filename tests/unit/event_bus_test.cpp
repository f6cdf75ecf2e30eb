#include "internal/events/event_bus.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/struct_fields.hpp"

namespace {

using taskorch::events::EventBus;
using taskorch::events::MakeEvent;
using taskorch::events::SubscriptionSet;

taskorch::v1::Event Numbered(taskorch::v1::EventType type, int n) {
  google::protobuf::Struct data;
  taskorch::util::SetNumber(data, "n", n);
  return MakeEvent(type, "test", std::move(data));
}

void TestHandlersRunInRegistrationOrder() {
  EventBus         bus;
  std::vector<int> calls;

  bus.Subscribe(taskorch::v1::EVENT_TYPE_TASK_STARTED, [&](const taskorch::v1::Event&) { calls.push_back(1); });
  bus.Subscribe(taskorch::v1::EVENT_TYPE_TASK_STARTED, [&](const taskorch::v1::Event&) { calls.push_back(2); });
  bus.Subscribe(taskorch::v1::EVENT_TYPE_TASK_COMPLETED, [&](const taskorch::v1::Event&) { calls.push_back(99); });

  bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_TASK_STARTED, "test"));

  assert((calls == std::vector<int>{1, 2}));
}

void TestThrowingHandlerDoesNotStopOthers() {
  EventBus bus;
  int      delivered = 0;

  bus.Subscribe(taskorch::v1::EVENT_TYPE_SYSTEM_ERROR, [](const taskorch::v1::Event&) { throw std::runtime_error("boom"); });
  bus.Subscribe(taskorch::v1::EVENT_TYPE_SYSTEM_ERROR, [&](const taskorch::v1::Event&) { ++delivered; });

  bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_SYSTEM_ERROR, "test"));
  bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_SYSTEM_ERROR, "test"));

  assert(delivered == 2);
}

void TestPublishWithoutSubscribersIsNoop() {
  EventBus bus;
  bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_QUEUE_STARTED, "test"));
  assert(bus.SubscriberCount(taskorch::v1::EVENT_TYPE_QUEUE_STARTED) == 0);
}

void TestUnsubscribeIsIdempotent() {
  EventBus bus;
  int      delivered = 0;

  const auto id = bus.Subscribe(taskorch::v1::EVENT_TYPE_TASK_ENQUEUED, [&](const taskorch::v1::Event&) { ++delivered; });
  bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_TASK_ENQUEUED, "test"));
  bus.Unsubscribe(id);
  bus.Unsubscribe(id);
  bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_TASK_ENQUEUED, "test"));

  assert(delivered == 1);
  assert(bus.SubscriberCount(taskorch::v1::EVENT_TYPE_TASK_ENQUEUED) == 0);
}

void TestHandlerMayUnsubscribeItselfDuringDelivery() {
  EventBus                         bus;
  int                              delivered = 0;
  taskorch::events::SubscriptionId self      = 0;

  self = bus.Subscribe(taskorch::v1::EVENT_TYPE_TASK_CANCELLED, [&](const taskorch::v1::Event&) {
    ++delivered;
    bus.Unsubscribe(self);
  });

  bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_TASK_CANCELLED, "test"));
  bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_TASK_CANCELLED, "test"));

  assert(delivered == 1);
}

void TestHandlerMaySubscribeDuringDelivery() {
  EventBus bus;
  int      late = 0;

  bus.Subscribe(taskorch::v1::EVENT_TYPE_QUEUE_STOPPED, [&](const taskorch::v1::Event&) {
    bus.Subscribe(taskorch::v1::EVENT_TYPE_QUEUE_STOPPED, [&](const taskorch::v1::Event&) { ++late; });
  });

  // the new subscriber is not part of the running delivery
  bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_QUEUE_STOPPED, "test"));
  assert(late == 0);

  bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_QUEUE_STOPPED, "test"));
  assert(late == 1);
}

void TestNestedPublishFromHandler() {
  EventBus bus;
  int      completed = 0;

  bus.Subscribe(taskorch::v1::EVENT_TYPE_TASK_STARTED, [&](const taskorch::v1::Event& e) {
    bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_TASK_COMPLETED, e.source()));
  });
  bus.Subscribe(taskorch::v1::EVENT_TYPE_TASK_COMPLETED, [&](const taskorch::v1::Event&) { ++completed; });

  bus.Publish(MakeEvent(taskorch::v1::EVENT_TYPE_TASK_STARTED, "test"));
  assert(completed == 1);
}

void TestPerPublisherOrderingAcrossThreads() {
  auto bus = std::make_shared<EventBus>();

  constexpr int    kPerThread = 500;
  std::mutex       mutex;
  std::vector<int> seen_a;
  std::vector<int> seen_b;

  bus->Subscribe(taskorch::v1::EVENT_TYPE_MESSAGE_SENT, [&](const taskorch::v1::Event& e) {
    const int n = static_cast<int>(taskorch::util::GetNumber(e.data(), "n"));
    std::lock_guard lock(mutex);
    (e.source() == "a" ? seen_a : seen_b).push_back(n);
  });

  auto publisher = [&](const std::string& source) {
    for (int i = 0; i < kPerThread; ++i) {
      google::protobuf::Struct data;
      taskorch::util::SetNumber(data, "n", i);
      bus->Publish(MakeEvent(taskorch::v1::EVENT_TYPE_MESSAGE_SENT, source, std::move(data)));
    }
  };

  std::thread a(publisher, "a");
  std::thread b(publisher, "b");
  a.join();
  b.join();

  assert(seen_a.size() == kPerThread);
  assert(seen_b.size() == kPerThread);
  for (int i = 0; i < kPerThread; ++i) {
    assert(seen_a[i] == i);
    assert(seen_b[i] == i);
  }
}

void TestSubscriptionSetReleasesOnDestruction() {
  auto bus = std::make_shared<EventBus>();
  {
    SubscriptionSet set(bus);
    set.Add(taskorch::v1::EVENT_TYPE_STATUS_SNAPSHOT, [](const taskorch::v1::Event&) {});
    set.Add(taskorch::v1::EVENT_TYPE_STATUS_SNAPSHOT, [](const taskorch::v1::Event&) {});
    assert(set.Size() == 2);
    assert(bus->SubscriberCount(taskorch::v1::EVENT_TYPE_STATUS_SNAPSHOT) == 2);
  }
  assert(bus->SubscriberCount(taskorch::v1::EVENT_TYPE_STATUS_SNAPSHOT) == 0);
}

void TestMakeEventStampsIdAndTime() {
  auto first  = Numbered(taskorch::v1::EVENT_TYPE_TASK_ENQUEUED, 1);
  auto second = Numbered(taskorch::v1::EVENT_TYPE_TASK_ENQUEUED, 2);

  assert(!first.id().empty());
  assert(first.id() != second.id());
  assert(first.has_timestamp());
  assert(first.source() == "test");
  assert(first.type() == taskorch::v1::EVENT_TYPE_TASK_ENQUEUED);
}

} // namespace

int main() {
  TestHandlersRunInRegistrationOrder();
  TestThrowingHandlerDoesNotStopOthers();
  TestPublishWithoutSubscribersIsNoop();
  TestUnsubscribeIsIdempotent();
  TestHandlerMayUnsubscribeItselfDuringDelivery();
  TestHandlerMaySubscribeDuringDelivery();
  TestNestedPublishFromHandler();
  TestPerPublisherOrderingAcrossThreads();
  TestSubscriptionSetReleasesOnDestruction();
  TestMakeEventStampsIdAndTime();

  std::cout << "taskorch_unit_event_bus: pass\n";
  return 0;
}
