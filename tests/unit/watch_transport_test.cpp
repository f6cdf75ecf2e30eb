#include "internal/broadcast/watch_transport.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using taskorch::broadcast::WatchBroadcastTransport;

taskorch::v1::StatusUpdate Update(const std::string& hash) {
  taskorch::v1::StatusUpdate u;
  u.set_hash(hash);
  u.mutable_snapshot()->set_overall(taskorch::v1::COMPONENT_HEALTH_HEALTHY);
  return u;
}

void TestNoWatchersIsNotAFailure() {
  WatchBroadcastTransport transport(4);
  assert(transport.Name() == "watch");
  transport.Send(Update("a"));
  assert(transport.WatcherCount() == 0);
}

void TestFanOutToEveryWatcher() {
  WatchBroadcastTransport transport(4);
  auto [id1, q1] = transport.AddWatcher();
  auto [id2, q2] = transport.AddWatcher();
  assert(id1 != id2);
  assert(transport.WatcherCount() == 2);

  transport.Send(Update("a"));
  transport.Send(Update("b"));

  for (auto* q : {q1.get(), q2.get()}) {
    auto first = q->PopFor(100ms);
    assert(first && first->hash() == "a");
    auto second = q->PopFor(100ms);
    assert(second && second->hash() == "b");
  }
}

void TestSlowWatcherMissesUpdates() {
  WatchBroadcastTransport transport(1);
  auto [slow_id, slow] = transport.AddWatcher();
  auto [fast_id, fast] = transport.AddWatcher();

  transport.Send(Update("a"));
  assert(fast->PopFor(100ms)->hash() == "a");

  // slow still holds "a"; fast accepts so the send succeeds
  transport.Send(Update("b"));
  assert(fast->PopFor(100ms)->hash() == "b");
  assert(slow->Size() == 1);
  assert(slow->PopFor(100ms)->hash() == "a");
  assert(!slow->PopFor(10ms));
  (void)slow_id;
  (void)fast_id;
}

void TestAllWatchersFullThrows() {
  WatchBroadcastTransport transport(1);
  auto [id, queue] = transport.AddWatcher();
  transport.Send(Update("a"));

  bool threw = false;
  try {
    transport.Send(Update("b"));
  } catch (const taskorch::util::BroadcastError&) {
    threw = true;
  }
  assert(threw);
  assert(queue->Size() == 1);
  (void)id;
}

void TestRemoveWatcherWakesReader() {
  WatchBroadcastTransport transport(4);
  auto [id, queue] = transport.AddWatcher();

  std::thread reader([q = queue] {
    auto item = q->Pop();
    assert(!item);
  });
  std::this_thread::sleep_for(20ms);

  transport.RemoveWatcher(id);
  reader.join();
  assert(queue->IsShutdown());
  assert(transport.WatcherCount() == 0);

  // unknown ids are ignored
  transport.RemoveWatcher(id);
  transport.RemoveWatcher(999);
}

} // namespace

int main() {
  TestNoWatchersIsNotAFailure();
  TestFanOutToEveryWatcher();
  TestSlowWatcherMissesUpdates();
  TestAllWatchersFullThrows();
  TestRemoveWatcherWakesReader();

  std::cout << "taskorch_unit_watch_transport: pass\n";
  return 0;
}
