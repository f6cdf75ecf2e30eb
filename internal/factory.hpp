#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#include "internal/agents/agent_registry.hpp"
#include "internal/broadcast/broadcast_transport.hpp"
#include "internal/broadcast/circuit_breaker.hpp"
#include "internal/broadcast/watch_transport.hpp"
#include "internal/coordinators/agent/agent_coordinator.hpp"
#include "internal/coordinators/broadcast/broadcast_coordinator.hpp"
#include "internal/coordinators/message/message_coordinator.hpp"
#include "internal/coordinators/queue/queue_coordinator.hpp"
#include "internal/coordinators/status/status_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/scheduler/queue_scheduler.hpp"
#include "internal/state/state_repository.hpp"

#if TASKORCH_WITH_GRPC
#include <grpcpp/grpcpp.h>
#endif

namespace taskorch::factory {

/*
  Application

  Owns all long-lived components of the process. Built by Build(), brought
  up by Start() and torn down by Shutdown(), which is idempotent and also
  runs on destruction.

  Coordinator order: agent, message, broadcast, status, queue. Consumers
  are subscribed before the queue loops produce anything.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<events::EventBus>             bus;
  std::shared_ptr<state::StateRepository>       state;
  std::shared_ptr<scheduler::ExecutorRegistry>  executors;
  std::shared_ptr<scheduler::QueueScheduler>    scheduler;
  std::shared_ptr<broadcast::CircuitBreaker>    breaker;
  std::shared_ptr<broadcast::BroadcastTransport> transport;
  // set only when broadcasting to gRPC watchers
  std::shared_ptr<broadcast::WatchBroadcastTransport> watch;
  std::shared_ptr<agents::AgentRegistry>        agents;

  std::shared_ptr<coordinators::agent::AgentCoordinator>         agent_coordinator;
  std::shared_ptr<coordinators::message::MessageCoordinator>     message_coordinator;
  std::shared_ptr<coordinators::broadcast::BroadcastCoordinator> broadcast_coordinator;
  std::shared_ptr<coordinators::status::StatusCoordinator>       status_coordinator;
  std::shared_ptr<coordinators::queue::QueueCoordinator>         queue_coordinator;

#if TASKORCH_WITH_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif

  Application() = default;
  Application(Application&&) = default;
  Application& operator=(Application&&) = default;
  ~Application();

  void Start();
  void Shutdown();

 private:
  std::vector<std::shared_ptr<coordinators::Lifecycle>> Ordered() const;
  bool started_ = false;
};

/*
  Build

  Constructs the whole runtime from config. This is the composition root:
  the only place that knows concrete repository and transport types.

  `executors` may carry domain executors registered beforehand; the
  built-in "noop" executor is added when absent.
*/
Application Build(const taskorch::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<scheduler::ExecutorRegistry> executors = nullptr);

// Config -> options, zero values replaced by defaults.
scheduler::SchedulerOptions                     SchedulerOptionsFrom(const taskorch::runtime::config::RuntimeConfig& config);
broadcast::CircuitBreakerOptions                BreakerOptionsFrom(const taskorch::runtime::config::RuntimeConfig& config);
std::vector<coordinators::queue::TaskTrigger>   TriggersFrom(const taskorch::runtime::config::RuntimeConfig& config);

} // namespace taskorch::factory
