#include "internal/coordinators/status/status_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/broadcast/circuit_breaker.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/state/state_repository.hpp"
#include "internal/util/struct_fields.hpp"

namespace {

using namespace std::chrono_literals;
using taskorch::coordinators::status::StatusAggregationCoordinator;
using taskorch::coordinators::status::StatusCoordinator;
using taskorch::status::SourceReport;
using taskorch::status::StatusSource;

class FixedSource final : public StatusSource {
 public:
  FixedSource(std::string name, taskorch::v1::ComponentHealth health, std::vector<std::string> queues = {})
      : name_(std::move(name)), health_(health), queues_(std::move(queues)) {
  }

  std::string Name() const override {
    return name_;
  }

  SourceReport Collect() override {
    ++calls;
    SourceReport r;
    r.component.set_health(health_);
    r.component.set_message("fixed");
    for (const auto& q : queues_) {
      taskorch::v1::QueueState s;
      s.set_name(q);
      s.set_status(taskorch::v1::QUEUE_STATUS_IDLE);
      r.queues.push_back(s);
    }
    return r;
  }

  std::atomic<int> calls{0};

 private:
  std::string                   name_;
  taskorch::v1::ComponentHealth health_;
  std::vector<std::string>      queues_;
};

class ThrowingSource final : public StatusSource {
 public:
  std::string Name() const override {
    return "flaky";
  }
  SourceReport Collect() override {
    throw std::runtime_error("backend unreachable");
  }
};

// Blocks until released; stands in for a hung dependency.
class HangingSource final : public StatusSource {
 public:
  std::string Name() const override {
    return "hung";
  }
  SourceReport Collect() override {
    gate_.wait();
    return {};
  }
  void Release() {
    release_.set_value();
  }

 private:
  std::promise<void>       release_;
  std::shared_future<void> gate_ = release_.get_future().share();
};

const taskorch::v1::ComponentStatus* FindComponent(const taskorch::v1::StatusSnapshot& s, const std::string& name) {
  for (const auto& c : s.components())
    if (c.name() == name) return &c;
  return nullptr;
}

void TestHealthySourcesMergeSorted() {
  auto b = std::make_shared<FixedSource>("b", taskorch::v1::COMPONENT_HEALTH_HEALTHY, std::vector<std::string>{"zeta", "alpha"});
  auto a = std::make_shared<FixedSource>("a", taskorch::v1::COMPONENT_HEALTH_HEALTHY, std::vector<std::string>{"mid"});

  StatusAggregationCoordinator agg({b, a}, 500ms);
  const auto                   snapshot = agg.Aggregate();

  assert(snapshot.overall() == taskorch::v1::COMPONENT_HEALTH_HEALTHY);
  assert(snapshot.components_size() == 2);
  assert(snapshot.components(0).name() == "a");
  assert(snapshot.components(1).name() == "b");
  assert(snapshot.queues_size() == 3);
  assert(snapshot.queues(0).name() == "alpha");
  assert(snapshot.queues(2).name() == "zeta");
  assert(snapshot.has_generated_at());
}

void TestFailingSourcesBecomePlaceholders() {
  auto ok      = std::make_shared<FixedSource>("ok", taskorch::v1::COMPONENT_HEALTH_HEALTHY, std::vector<std::string>{"q"});
  auto flaky   = std::make_shared<ThrowingSource>();
  auto hanging = std::make_shared<HangingSource>();

  StatusAggregationCoordinator agg({ok, flaky, hanging}, 100ms);

  const auto start    = std::chrono::steady_clock::now();
  const auto snapshot = agg.Aggregate();
  assert(std::chrono::steady_clock::now() - start < 1s);

  const auto* err = FindComponent(snapshot, "flaky");
  assert(err && err->health() == taskorch::v1::COMPONENT_HEALTH_ERROR);
  assert(err->message() == "backend unreachable");

  const auto* slow = FindComponent(snapshot, "hung");
  assert(slow && slow->health() == taskorch::v1::COMPONENT_HEALTH_DEGRADED);
  assert(slow->message().find("timed out") != std::string::npos);

  // the healthy source still contributes
  assert(FindComponent(snapshot, "ok")->health() == taskorch::v1::COMPONENT_HEALTH_HEALTHY);
  assert(snapshot.queues_size() == 1);

  assert(snapshot.overall() == taskorch::v1::COMPONENT_HEALTH_ERROR);
  hanging->Release();
}

void TestOverallIsWorstComponent() {
  auto healthy  = std::make_shared<FixedSource>("h", taskorch::v1::COMPONENT_HEALTH_HEALTHY);
  auto degraded = std::make_shared<FixedSource>("d", taskorch::v1::COMPONENT_HEALTH_DEGRADED);

  StatusAggregationCoordinator agg({healthy, degraded}, 500ms);
  assert(agg.Aggregate().overall() == taskorch::v1::COMPONENT_HEALTH_DEGRADED);

  StatusAggregationCoordinator none({}, 500ms);
  const auto                   empty = none.Aggregate();
  assert(empty.overall() == taskorch::v1::COMPONENT_HEALTH_HEALTHY);
  assert(empty.components_size() == 0);
}

void TestBuiltInSources() {
  auto repo  = std::make_shared<taskorch::db::memory::MemoryRepository>();
  auto state = std::make_shared<taskorch::state::StateRepository>(repo, taskorch::state::StateRepositoryOptions{{"data_fetcher"}, 0.5});

  taskorch::broadcast::CircuitBreaker::ClockFn clock = [] { return taskorch::util::SteadyTimePoint{}; };
  auto breaker = std::make_shared<taskorch::broadcast::CircuitBreaker>(taskorch::broadcast::CircuitBreakerOptions{1, 60000ms, 1}, clock);

  StatusAggregationCoordinator agg({std::make_shared<taskorch::status::QueueStatusSource>(state),
                                    std::make_shared<taskorch::status::StoreStatusSource>(state),
                                    std::make_shared<taskorch::status::BreakerStatusSource>(breaker)},
                                   1s);

  auto snapshot = agg.Aggregate();
  assert(snapshot.overall() == taskorch::v1::COMPONENT_HEALTH_HEALTHY);
  assert(snapshot.queues_size() == 1);
  assert(snapshot.queues(0).name() == "data_fetcher");
  assert(snapshot.queues(0).status() == taskorch::v1::QUEUE_STATUS_IDLE);

  breaker->RecordFailure();
  snapshot = agg.Aggregate();
  const auto* b = FindComponent(snapshot, "broadcast");
  assert(b && b->health() == taskorch::v1::COMPONENT_HEALTH_ERROR);
  assert(taskorch::util::GetString(b->details(), "phase") == "BREAKER_PHASE_OPEN");
  assert(snapshot.overall() == taskorch::v1::COMPONENT_HEALTH_ERROR);
}

void TestMonitorPublishesOnTriggerEvents() {
  auto bus    = std::make_shared<taskorch::events::EventBus>();
  auto source = std::make_shared<FixedSource>("only", taskorch::v1::COMPONENT_HEALTH_HEALTHY);

  std::mutex                                mutex;
  std::vector<taskorch::v1::StatusSnapshot> published;
  bus->Subscribe(taskorch::v1::EVENT_TYPE_STATUS_SNAPSHOT, [&](const taskorch::v1::Event& e) {
    taskorch::v1::StatusSnapshot s;
    taskorch::util::FromStruct(taskorch::util::GetStruct(e.data(), "snapshot"), &s);
    std::lock_guard lock(mutex);
    published.push_back(s);
  });
  auto count = [&] {
    std::lock_guard lock(mutex);
    return published.size();
  };
  auto wait_for = [&](std::size_t n) {
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (count() < n && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(5ms);
    return count() >= n;
  };

  // long interval: only events and startup trigger refreshes here
  StatusCoordinator status(bus, {source}, 500ms, 1h);
  assert(!status.LastSnapshot());
  status.Initialize();

  assert(wait_for(1));
  bus->Publish(taskorch::events::MakeEvent(taskorch::v1::EVENT_TYPE_QUEUE_STATUS_CHANGED, "test"));
  assert(wait_for(2));
  bus->Publish(taskorch::events::MakeEvent(taskorch::v1::EVENT_TYPE_SYSTEM_ERROR, "test"));
  assert(wait_for(3));

  // unrelated events do not refresh
  bus->Publish(taskorch::events::MakeEvent(taskorch::v1::EVENT_TYPE_TASK_ENQUEUED, "test"));
  std::this_thread::sleep_for(100ms);
  assert(count() == 3);

  const auto direct = status.Refresh();
  assert(count() == 4);
  assert(status.LastSnapshot()->components(0).name() == "only");
  assert(direct.components_size() == 1);

  status.Cleanup();
  bus->Publish(taskorch::events::MakeEvent(taskorch::v1::EVENT_TYPE_QUEUE_STATUS_CHANGED, "test"));
  std::this_thread::sleep_for(50ms);
  assert(count() == 4);
}

} // namespace

int main() {
  TestHealthySourcesMergeSorted();
  TestFailingSourcesBecomePlaceholders();
  TestOverallIsWorstComponent();
  TestBuiltInSources();
  TestMonitorPublishesOnTriggerEvents();

  std::cout << "taskorch_unit_status_aggregation: pass\n";
  return 0;
}
