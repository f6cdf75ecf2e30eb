#include "internal/coordinators/message/message_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/struct_fields.hpp"

namespace {

using namespace std::chrono_literals;
using taskorch::coordinators::message::MessageCoordinator;
using taskorch::coordinators::message::MessageCoordinatorOptions;
using taskorch::coordinators::message::MessageRoutingCoordinator;

bool WaitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 3s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred() && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(2ms);
  return pred();
}

struct Recorder {
  std::mutex                       mutex;
  std::vector<taskorch::v1::Event> events;

  void On(taskorch::events::EventBus& bus, taskorch::v1::EventType type) {
    bus.Subscribe(type, [this](const taskorch::v1::Event& e) {
      std::lock_guard lock(mutex);
      events.push_back(e);
    });
  }
  std::size_t Size() {
    std::lock_guard lock(mutex);
    return events.size();
  }
  taskorch::v1::Event At(std::size_t i) {
    std::lock_guard lock(mutex);
    return events.at(i);
  }
};

taskorch::v1::AgentMessage Message(taskorch::v1::MessageType type, const std::string& sender) {
  taskorch::v1::AgentMessage m;
  m.set_type(type);
  m.set_sender(sender);
  m.set_recipient("system");
  return m;
}

void TestSendRunsHandlersInOrder() {
  auto                      bus = std::make_shared<taskorch::events::EventBus>();
  Recorder                  sent;
  Recorder                  delivered;
  MessageRoutingCoordinator routing(bus, 16, 1s);
  sent.On(*bus, taskorch::v1::EVENT_TYPE_MESSAGE_SENT);
  delivered.On(*bus, taskorch::v1::EVENT_TYPE_MESSAGE_DELIVERED);

  bool rejected = false;
  try {
    routing.Send(Message(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, "a"));
  } catch (const taskorch::util::InvalidState&) {
    rejected = true;
  }
  assert(rejected);

  std::mutex               mutex;
  std::vector<std::string> calls;
  routing.RegisterHandler(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, [&](const taskorch::v1::AgentMessage& m) {
    std::lock_guard lock(mutex);
    calls.push_back("first:" + m.sender());
  });
  routing.RegisterHandler(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE,
                          [](const taskorch::v1::AgentMessage&) { throw std::runtime_error("handler bug"); });
  routing.RegisterHandler(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, [](const taskorch::v1::AgentMessage&) { throw 42; });
  routing.RegisterHandler(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, [&](const taskorch::v1::AgentMessage& m) {
    std::lock_guard lock(mutex);
    calls.push_back("third:" + m.sender());
  });
  routing.Initialize();

  const auto id = routing.Send(Message(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, "fetcher"));
  assert(!id.empty());
  assert(sent.Size() == 1);
  assert(taskorch::util::GetString(sent.At(0).data(), "message_id") == id);
  assert(taskorch::util::GetString(sent.At(0).data(), "message_type") == "MESSAGE_TYPE_STATUS_UPDATE");

  assert(WaitUntil([&] { return delivered.Size() == 1; }));
  {
    std::lock_guard lock(mutex);
    assert((calls == std::vector<std::string>{"first:fetcher", "third:fetcher"}));
  }
  assert(taskorch::util::GetNumber(delivered.At(0).data(), "handlers") == 4);
  assert(routing.Delivered() == 1);

  // the routing thread survived both throwing handlers; with no handler
  // registered a message is still delivered
  routing.Send(Message(taskorch::v1::MESSAGE_TYPE_ERROR_REPORT, "fetcher"));
  assert(WaitUntil([&] { return delivered.Size() == 2; }));
  assert(taskorch::util::GetNumber(delivered.At(1).data(), "handlers") == 0);

  bool invalid = false;
  try {
    routing.Send(Message(taskorch::v1::MESSAGE_TYPE_UNSPECIFIED, "fetcher"));
  } catch (const taskorch::util::ValidationError&) {
    invalid = true;
  }
  assert(invalid);
  routing.Cleanup();
}

void TestFullMailboxRejects() {
  auto                      bus = std::make_shared<taskorch::events::EventBus>();
  MessageRoutingCoordinator routing(bus, 2, 1s);

  std::promise<void>       release;
  std::shared_future<void> gate = release.get_future().share();
  std::atomic<bool>        entered{false};
  routing.RegisterHandler(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, [&](const taskorch::v1::AgentMessage&) {
    entered = true;
    gate.wait();
  });
  routing.Initialize();

  routing.Send(Message(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, "a"));
  assert(WaitUntil([&] { return entered.load(); }));
  routing.Send(Message(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, "b"));
  routing.Send(Message(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, "c"));

  bool exhausted = false;
  try {
    routing.Send(Message(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, "d"));
  } catch (const taskorch::util::ResourceExhausted&) {
    exhausted = true;
  }
  assert(exhausted);

  release.set_value();
  assert(WaitUntil([&] { return routing.Delivered() == 3; }));
  routing.Cleanup();
}

void TestPingRequestGetsResponse() {
  auto               bus = std::make_shared<taskorch::events::EventBus>();
  MessageCoordinator messages(bus, MessageCoordinatorOptions{16, 1s});
  messages.Initialize();

  auto ping = Message(taskorch::v1::MESSAGE_TYPE_REQUEST, "analyst");
  taskorch::util::SetString(*ping.mutable_content(), "action", "ping");
  const auto reply = messages.Request(ping);

  assert(reply.type() == taskorch::v1::MESSAGE_TYPE_RESPONSE);
  assert(reply.recipient() == "analyst");
  assert(reply.sender() == "system");
  assert(taskorch::util::GetString(reply.content(), "status") == "ok");
  assert(!reply.correlation_id().empty());
  messages.Cleanup();
}

void TestRequestWithoutResponderTimesOut() {
  auto               bus = std::make_shared<taskorch::events::EventBus>();
  MessageCoordinator messages(bus, MessageCoordinatorOptions{16, 1s});
  messages.Initialize();

  auto question = Message(taskorch::v1::MESSAGE_TYPE_REQUEST, "analyst");
  taskorch::util::SetString(*question.mutable_content(), "action", "summarize");

  const auto start    = std::chrono::steady_clock::now();
  bool       timedout = false;
  try {
    messages.Request(question, 50ms);
  } catch (const taskorch::util::TimeoutError&) {
    timedout = true;
  }
  assert(timedout);
  assert(std::chrono::steady_clock::now() - start < 1s);
  messages.Cleanup();
}

void TestCleanupFailsWaitingRequests() {
  auto               bus = std::make_shared<taskorch::events::EventBus>();
  MessageCoordinator messages(bus, MessageCoordinatorOptions{16, 5s});
  messages.Initialize();

  auto waiter = std::async(std::launch::async, [&] {
    try {
      messages.Request(Message(taskorch::v1::MESSAGE_TYPE_REQUEST, "analyst"));
    } catch (const taskorch::util::InvalidState&) {
      return true;
    }
    return false;
  });
  assert(WaitUntil([&] { return messages.Delivered() == 1; }));
  messages.Cleanup();
  assert(waiter.get());
}

void TestDefaultHandlersTranslateToEvents() {
  auto               bus = std::make_shared<taskorch::events::EventBus>();
  Recorder           requested;
  Recorder           errors;
  Recorder           agent_status;
  MessageCoordinator messages(bus, MessageCoordinatorOptions{});
  requested.On(*bus, taskorch::v1::EVENT_TYPE_TASK_REQUESTED);
  errors.On(*bus, taskorch::v1::EVENT_TYPE_SYSTEM_ERROR);
  agent_status.On(*bus, taskorch::v1::EVENT_TYPE_AGENT_STATUS_CHANGED);
  messages.Initialize();

  auto task = Message(taskorch::v1::MESSAGE_TYPE_TASK_REQUEST, "analyst");
  auto& c   = *task.mutable_content();
  taskorch::util::SetString(c, "queue_name", "ai_analysis");
  taskorch::util::SetString(c, "task_type", "analyze");
  taskorch::util::SetNumber(c, "priority", 2);
  google::protobuf::Struct payload;
  taskorch::util::SetString(payload, "symbol", "ABC");
  taskorch::util::SetStruct(c, "payload", payload);
  const auto task_msg_id = messages.Send(task);

  auto error = Message(taskorch::v1::MESSAGE_TYPE_ERROR_REPORT, "fetcher");
  taskorch::util::SetString(*error.mutable_content(), "error", "rate limited");
  messages.Send(error);

  auto status = Message(taskorch::v1::MESSAGE_TYPE_STATUS_UPDATE, "fetcher");
  taskorch::util::SetString(*status.mutable_content(), "status", "busy");
  messages.Send(status);

  assert(WaitUntil([&] { return requested.Size() == 1 && errors.Size() == 1 && agent_status.Size() == 1; }));

  const auto req = requested.At(0);
  assert(req.source() == "message");
  assert(taskorch::util::GetString(req.data(), "queue_name") == "ai_analysis");
  assert(taskorch::util::GetString(req.data(), "task_type") == "analyze");
  assert(taskorch::util::GetNumber(req.data(), "priority") == 2);
  assert(!taskorch::util::Has(req.data(), "max_retries"));
  assert(taskorch::util::GetString(req.data(), "requested_by") == "analyst");
  assert(taskorch::util::GetString(req.data(), "message_id") == task_msg_id);
  assert(taskorch::util::GetString(taskorch::util::GetStruct(req.data(), "payload"), "symbol") == "ABC");

  assert(taskorch::util::GetString(errors.At(0).data(), "component") == "fetcher");
  assert(taskorch::util::GetString(errors.At(0).data(), "error") == "rate limited");

  assert(taskorch::util::GetString(agent_status.At(0).data(), "agent") == "fetcher");
  assert(taskorch::util::GetString(agent_status.At(0).data(), "status") == "busy");

  messages.Cleanup();
}

} // namespace

int main() {
  TestSendRunsHandlersInOrder();
  TestFullMailboxRejects();
  TestPingRequestGetsResponse();
  TestRequestWithoutResponderTimesOut();
  TestCleanupFailsWaitingRequests();
  TestDefaultHandlersTranslateToEvents();

  std::cout << "taskorch_unit_message_routing: pass\n";
  return 0;
}
