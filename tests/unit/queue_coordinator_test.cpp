#include "internal/coordinators/queue/queue_coordinator.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/struct_fields.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using taskorch::coordinators::queue::QueueCoordinator;
using taskorch::coordinators::queue::QueueCoordinatorOptions;
using taskorch::coordinators::queue::TaskTrigger;
using taskorch::scheduler::TaskContext;

bool WaitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred() && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(5ms);
  return pred();
}

class Collector {
 public:
  void On(taskorch::events::EventBus& bus, taskorch::v1::EventType type) {
    bus.Subscribe(type, [this](const taskorch::v1::Event& e) {
      std::lock_guard lock(mutex_);
      events_.push_back(e);
    });
  }

  std::vector<taskorch::v1::Event> Matching(const std::function<bool(const taskorch::v1::Event&)>& pred) {
    std::lock_guard                  lock(mutex_);
    std::vector<taskorch::v1::Event> out;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(out), pred);
    return out;
  }

  std::size_t Size() {
    std::lock_guard lock(mutex_);
    return events_.size();
  }

 private:
  std::mutex                       mutex_;
  std::vector<taskorch::v1::Event> events_;
};

struct Fixture {
  std::shared_ptr<taskorch::db::memory::MemoryRepository>   repo      = std::make_shared<taskorch::db::memory::MemoryRepository>();
  std::shared_ptr<taskorch::events::EventBus>               bus       = std::make_shared<taskorch::events::EventBus>();
  std::shared_ptr<taskorch::scheduler::ExecutorRegistry>    executors = std::make_shared<taskorch::scheduler::ExecutorRegistry>();
  std::shared_ptr<taskorch::state::StateRepository>         state;
  std::shared_ptr<taskorch::scheduler::QueueScheduler>      scheduler;
  std::unique_ptr<QueueCoordinator>                         queues;

  Collector completed;
  Collector failed;
  Collector changed;
  Collector errors;
  Collector lifecycle;

  explicit Fixture(QueueCoordinatorOptions options, std::chrono::milliseconds timeout = 5s) {
    completed.On(*bus, taskorch::v1::EVENT_TYPE_TASK_COMPLETED);
    failed.On(*bus, taskorch::v1::EVENT_TYPE_TASK_FAILED);
    changed.On(*bus, taskorch::v1::EVENT_TYPE_QUEUE_STATUS_CHANGED);
    errors.On(*bus, taskorch::v1::EVENT_TYPE_SYSTEM_ERROR);
    lifecycle.On(*bus, taskorch::v1::EVENT_TYPE_QUEUE_STARTED);
    lifecycle.On(*bus, taskorch::v1::EVENT_TYPE_QUEUE_STOPPED);

    taskorch::scheduler::SchedulerOptions so;
    so.queues     = {{"data_fetcher", timeout, 3, 50ms}, {"ai_analysis", timeout, 3, 50ms}};
    so.retry      = {5ms, 20ms, 2.0};
    so.stop_grace = 1s;

    state     = std::make_shared<taskorch::state::StateRepository>(
        repo, taskorch::state::StateRepositoryOptions{{"ai_analysis", "data_fetcher"}, 0.5});
    scheduler = std::make_shared<taskorch::scheduler::QueueScheduler>(repo, bus, executors, so);
    queues    = std::make_unique<QueueCoordinator>(scheduler, state, bus, std::move(options));
  }

  ~Fixture() {
    queues->Cleanup();
    scheduler->Stop();
  }

  std::vector<taskorch::v1::Event> CompletedIn(const std::string& queue) {
    return completed.Matching([&](const auto& e) { return taskorch::util::GetString(e.data(), "queue_name") == queue; });
  }
};

taskorch::scheduler::TaskSpec Spec(const std::string& queue, const std::string& type) {
  taskorch::scheduler::TaskSpec s;
  s.queue_name = queue;
  s.task_type  = type;
  taskorch::util::SetString(s.payload, "symbol", "ABC");
  return s;
}

void TestCompletionTriggersFollowUpTask() {
  QueueCoordinatorOptions options;
  options.triggers = {{taskorch::v1::EVENT_TYPE_TASK_COMPLETED, "data_fetcher", "fetch", "ai_analysis", "analyze", 1}};
  Fixture f(options);

  f.executors->Register("fetch", [](const TaskContext& ctx) {
    google::protobuf::Struct out;
    taskorch::util::SetNumber(out, "price", 42);
    taskorch::util::SetString(out, "symbol", taskorch::util::GetString(ctx.payload, "symbol"));
    return out;
  });
  f.executors->Register("analyze", [](const TaskContext& ctx) { return ctx.payload; });

  f.queues->Initialize();
  assert(f.lifecycle.Size() == 2);

  const auto fetch_id = f.queues->Enqueue(Spec("data_fetcher", "fetch"));
  assert(WaitUntil([&] { return f.CompletedIn("ai_analysis").size() == 1; }));

  const auto analysis = f.CompletedIn("ai_analysis")[0];
  const auto result   = taskorch::util::GetStruct(analysis.data(), "result");
  assert(taskorch::util::GetString(result, "source_task_id") == fetch_id);
  assert(taskorch::util::GetString(result, "source_queue") == "data_fetcher");
  assert(taskorch::util::GetNumber(taskorch::util::GetStruct(result, "result"), "price") == 42);

  // the follow-up does not trigger anything further
  std::this_thread::sleep_for(100ms);
  assert(f.CompletedIn("ai_analysis").size() == 1);

  const auto analysis_task = f.queues->Task(taskorch::util::GetString(analysis.data(), "task_id"));
  assert(analysis_task.priority() == 1);
  assert(f.queues->Status("ai_analysis").completed() == 1);
}

void TestFailureTriggerWaitsForTerminalFailure() {
  QueueCoordinatorOptions options;
  options.triggers = {{taskorch::v1::EVENT_TYPE_TASK_FAILED, "data_fetcher", "", "ai_analysis", "report_failure", 0}};
  Fixture f(options);

  f.executors->Register("fetch",
                        [](const TaskContext&) -> google::protobuf::Struct { throw taskorch::util::ExecutionError("feed down"); });
  f.executors->Register("report_failure", [](const TaskContext& ctx) { return ctx.payload; });
  f.queues->Initialize();

  auto spec        = Spec("data_fetcher", "fetch");
  spec.max_retries = 2;
  f.queues->Enqueue(spec);

  assert(WaitUntil([&] { return f.CompletedIn("ai_analysis").size() == 1; }));
  assert(f.failed.Size() == 3);

  const auto report = taskorch::util::GetStruct(f.CompletedIn("ai_analysis")[0].data(), "result");
  assert(taskorch::util::GetString(report, "error") == "feed down");

  std::this_thread::sleep_for(100ms);
  assert(f.CompletedIn("ai_analysis").size() == 1);
}

void TestQueueActivityAnnouncesStatusChange() {
  QueueCoordinatorOptions options;
  options.autostart = false;
  Fixture f(options);
  f.executors->Register("fetch", [](const TaskContext& ctx) { return ctx.payload; });
  f.queues->Initialize();
  assert(f.lifecycle.Size() == 0);

  const auto id = f.queues->Enqueue(Spec("data_fetcher", "fetch"));
  auto       enqueued = f.changed.Matching([&](const auto& e) { return taskorch::util::GetString(e.data(), "task_id") == id; });
  assert(enqueued.size() == 1);
  assert(taskorch::util::GetString(enqueued[0].data(), "cause") == "EVENT_TYPE_TASK_ENQUEUED");
  assert(taskorch::util::GetString(enqueued[0].data(), "queue_name") == "data_fetcher");

  f.queues->StartQueue("data_fetcher");
  assert(WaitUntil([&] { return f.CompletedIn("data_fetcher").size() == 1; }));
  f.queues->StopQueue("data_fetcher");
  assert(f.lifecycle.Size() == 2);

  const auto causes = f.changed.Matching([](const auto& e) {
    const auto cause = taskorch::util::GetString(e.data(), "cause");
    return cause == "EVENT_TYPE_QUEUE_STARTED" || cause == "EVENT_TYPE_TASK_STARTED" || cause == "EVENT_TYPE_TASK_COMPLETED" ||
           cause == "EVENT_TYPE_QUEUE_STOPPED";
  });
  assert(causes.size() == 4);
}

void TestTaskRequestedEventsAreEnqueued() {
  QueueCoordinatorOptions options;
  options.autostart = false;
  Fixture f(options);
  f.executors->Register("analyze", [](const TaskContext& ctx) { return ctx.payload; });
  f.queues->Initialize();

  google::protobuf::Struct good;
  taskorch::util::SetString(good, "queue_name", "ai_analysis");
  taskorch::util::SetString(good, "task_type", "analyze");
  taskorch::util::SetNumber(good, "priority", 4);
  f.bus->Publish(taskorch::events::MakeEvent(taskorch::v1::EVENT_TYPE_TASK_REQUESTED, "agent", good));

  auto pending = f.queues->PendingTasks("ai_analysis", 10);
  assert(pending.size() == 1);
  assert(pending[0].priority() == 4);
  assert(pending[0].max_retries() == 3);
  assert(f.errors.Size() == 0);

  google::protobuf::Struct bad;
  taskorch::util::SetString(bad, "queue_name", "nowhere");
  taskorch::util::SetString(bad, "task_type", "analyze");
  const auto request = taskorch::events::MakeEvent(taskorch::v1::EVENT_TYPE_TASK_REQUESTED, "agent", bad);
  f.bus->Publish(request);

  assert(f.errors.Size() == 1);
  const auto error = f.errors.Matching([](const auto&) { return true; })[0];
  assert(taskorch::util::GetString(error.data(), "component") == "queue.execution");
  assert(taskorch::util::GetString(error.data(), "request_id") == request.id());
  assert(taskorch::util::GetString(error.data(), "queue_name") == "nowhere");
}

void TestRequestedPriorityMustFitInt32() {
  QueueCoordinatorOptions options;
  options.autostart = false;
  Fixture f(options);
  f.executors->Register("analyze", [](const TaskContext& ctx) { return ctx.payload; });
  f.queues->Initialize();

  const std::vector<double> out_of_range = {1e20, -1e20, 2.5, std::numeric_limits<double>::quiet_NaN(),
                                            std::numeric_limits<double>::infinity()};
  for (double priority : out_of_range) {
    google::protobuf::Struct request;
    taskorch::util::SetString(request, "queue_name", "ai_analysis");
    taskorch::util::SetString(request, "task_type", "analyze");
    taskorch::util::SetNumber(request, "priority", priority);
    f.bus->Publish(taskorch::events::MakeEvent(taskorch::v1::EVENT_TYPE_TASK_REQUESTED, "agent", request));
  }

  google::protobuf::Struct retries;
  taskorch::util::SetString(retries, "queue_name", "ai_analysis");
  taskorch::util::SetString(retries, "task_type", "analyze");
  taskorch::util::SetNumber(retries, "max_retries", 1e12);
  f.bus->Publish(taskorch::events::MakeEvent(taskorch::v1::EVENT_TYPE_TASK_REQUESTED, "agent", retries));

  assert(f.queues->PendingTasks("ai_analysis", 10).empty());
  assert(f.errors.Size() == out_of_range.size() + 1);
  for (const auto& e : f.errors.Matching([](const auto&) { return true; })) {
    assert(taskorch::util::GetString(e.data(), "component") == "queue.execution");
    assert(taskorch::util::GetString(e.data(), "error").find("int32") != std::string::npos);
  }

  // the int32 bounds themselves are accepted
  google::protobuf::Struct lowest;
  taskorch::util::SetString(lowest, "queue_name", "ai_analysis");
  taskorch::util::SetString(lowest, "task_type", "analyze");
  taskorch::util::SetNumber(lowest, "priority", std::numeric_limits<int32_t>::min());
  f.bus->Publish(taskorch::events::MakeEvent(taskorch::v1::EVENT_TYPE_TASK_REQUESTED, "agent", lowest));

  auto pending = f.queues->PendingTasks("ai_analysis", 10);
  assert(pending.size() == 1);
  assert(pending[0].priority() == std::numeric_limits<int32_t>::min());
}

void TestStalledTaskDetection() {
  QueueCoordinatorOptions options;
  options.autostart = false;
  Fixture f(options, 1s);
  f.queues->Initialize();

  taskorch::db::model::TaskRecord row;
  row.task_id     = "stuck";
  row.queue_name  = "data_fetcher";
  row.task_type   = "fetch";
  row.status      = taskorch::v1::TASK_STATUS_RUNNING;
  row.max_retries = 3;
  row.created_at  = taskorch::util::NowMicros() - 20'000'000;
  row.started_at  = taskorch::util::NowMicros() - 10'000'000;
  {
    auto tx = f.repo->Begin();
    assert(f.repo->InsertTask(*tx, row));
    tx->Commit();
  }

  const auto report = f.queues->HealthReport();
  assert(!report.healthy);
  assert(report.stalled.size() == 1);
  assert(report.stalled[0].task_id == "stuck");
  assert(report.stalled[0].timeout_ms == 1000);
  assert(report.stalled[0].running_for_ms >= 9000);
  assert(report.queues.size() == 2);
  assert(report.queues.at("data_fetcher").running() == 1);
  assert(report.queues.at("data_fetcher").current_task_id() == "stuck");
}

void TestCancelAndUnknownQueue() {
  QueueCoordinatorOptions options;
  options.autostart = false;
  Fixture f(options);
  f.executors->Register("fetch", [](const TaskContext& ctx) { return ctx.payload; });
  f.queues->Initialize();

  const auto id = f.queues->Enqueue(Spec("data_fetcher", "fetch"));
  f.queues->Cancel(id);
  assert(f.queues->Task(id).status() == taskorch::v1::TASK_STATUS_CANCELLED);

  bool not_found = false;
  try {
    f.queues->Status("nowhere");
  } catch (const taskorch::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  not_found = false;
  try {
    f.queues->StartQueue("nowhere");
  } catch (const taskorch::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

} // namespace

int main() {
  TestCompletionTriggersFollowUpTask();
  TestFailureTriggerWaitsForTerminalFailure();
  TestQueueActivityAnnouncesStatusChange();
  TestTaskRequestedEventsAreEnqueued();
  TestRequestedPriorityMustFitInt32();
  TestStalledTaskDetection();
  TestCancelAndUnknownQueue();

  std::cout << "taskorch_unit_queue_coordinator: pass\n";
  return 0;
}
