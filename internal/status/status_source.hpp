#pragma once

#include <memory>
#include <string>
#include <vector>

#include "taskorch/v1.hpp"

namespace taskorch::scheduler {
class QueueScheduler;
}
namespace taskorch::state {
class StateRepository;
}
namespace taskorch::broadcast {
class CircuitBreaker;
}
namespace taskorch::agents {
class AgentRegistry;
}

namespace taskorch::status {

// One source's contribution to a StatusSnapshot.
struct SourceReport {
  taskorch::v1::ComponentStatus          component;
  std::vector<taskorch::v1::QueueState> queues;
};

/*
  An independently failing piece of system status. Collect() may throw or
  block; the aggregator bounds it and substitutes a placeholder.
*/
class StatusSource {
 public:
  virtual ~StatusSource() = default;

  virtual std::string Name() const = 0;

  virtual SourceReport Collect() = 0;
};

// Per-queue states from the store, plus a rollup component.
class QueueStatusSource final : public StatusSource {
 public:
  explicit QueueStatusSource(std::shared_ptr<state::StateRepository> state) : state_(std::move(state)) {
  }
  std::string Name() const override {
    return "queues";
  }
  SourceReport Collect() override;

 private:
  std::shared_ptr<state::StateRepository> state_;
};

// Store reachability.
class StoreStatusSource final : public StatusSource {
 public:
  explicit StoreStatusSource(std::shared_ptr<state::StateRepository> state) : state_(std::move(state)) {
  }
  std::string Name() const override {
    return "store";
  }
  SourceReport Collect() override;

 private:
  std::shared_ptr<state::StateRepository> state_;
};

// Which queue loops are running.
class SchedulerStatusSource final : public StatusSource {
 public:
  explicit SchedulerStatusSource(std::shared_ptr<scheduler::QueueScheduler> scheduler) : scheduler_(std::move(scheduler)) {
  }
  std::string Name() const override {
    return "scheduler";
  }
  SourceReport Collect() override;

 private:
  std::shared_ptr<scheduler::QueueScheduler> scheduler_;
};

// Broadcast circuit breaker phase.
class BreakerStatusSource final : public StatusSource {
 public:
  explicit BreakerStatusSource(std::shared_ptr<broadcast::CircuitBreaker> breaker) : breaker_(std::move(breaker)) {
  }
  std::string Name() const override {
    return "broadcast";
  }
  SourceReport Collect() override;

 private:
  std::shared_ptr<broadcast::CircuitBreaker> breaker_;
};

// Registered agents and what they last reported.
class AgentStatusSource final : public StatusSource {
 public:
  explicit AgentStatusSource(std::shared_ptr<agents::AgentRegistry> registry) : registry_(std::move(registry)) {
  }
  std::string Name() const override {
    return "agents";
  }
  SourceReport Collect() override;

 private:
  std::shared_ptr<agents::AgentRegistry> registry_;
};

} // namespace taskorch::status
