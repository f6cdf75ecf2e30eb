#include "status_source.hpp"

#include "internal/agents/agent_registry.hpp"
#include "internal/broadcast/circuit_breaker.hpp"
#include "internal/scheduler/queue_scheduler.hpp"
#include "internal/state/state_repository.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::status {

using taskorch::v1::ComponentHealth;

namespace {

taskorch::v1::ComponentStatus Component(const std::string& name, ComponentHealth health, std::string message) {
  taskorch::v1::ComponentStatus c;
  c.set_name(name);
  c.set_health(health);
  c.set_message(std::move(message));
  return c;
}

} // namespace

SourceReport QueueStatusSource::Collect() {
  SourceReport report;

  uint64_t pending  = 0;
  uint64_t running  = 0;
  int      degraded = 0;
  int      errored  = 0;

  for (auto& [_, q] : state_->GetAllStatuses()) {
    pending += q.pending();
    running += q.running();
    if (!q.error().empty()) {
      ++errored;
    } else if (q.status() == taskorch::v1::QUEUE_STATUS_DEGRADED) {
      ++degraded;
    }
    report.queues.push_back(std::move(q));
  }

  if (errored > 0) {
    report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_ERROR, std::to_string(errored) + " queue(s) unreadable");
  } else if (degraded > 0) {
    report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_DEGRADED, std::to_string(degraded) + " queue(s) degraded");
  } else {
    report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_HEALTHY, "ok");
  }

  auto& d = *report.component.mutable_details();
  util::SetNumber(d, "queues", static_cast<double>(report.queues.size()));
  util::SetNumber(d, "pending", static_cast<double>(pending));
  util::SetNumber(d, "running", static_cast<double>(running));
  return report;
}

SourceReport StoreStatusSource::Collect() {
  SourceReport report;
  if (state_->IsHealthy()) {
    report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_HEALTHY, "ok");
  } else {
    report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_ERROR, "store unreachable");
  }
  return report;
}

SourceReport SchedulerStatusSource::Collect() {
  SourceReport report;

  int                      running = 0;
  int                      blocked = 0;
  google::protobuf::Struct loops;
  for (const auto& loop : scheduler_->LoopStates()) {
    google::protobuf::Struct l;
    util::SetBool(l, "running", loop.running);
    util::SetBool(l, "blocked", loop.blocked);
    util::SetString(l, "current_task_id", loop.current_task_id);
    util::SetStruct(loops, loop.queue_name, l);
    if (loop.running) ++running;
    if (loop.blocked) ++blocked;
  }

  const auto total = static_cast<int>(loops.fields_size());
  if (blocked > 0) {
    report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_DEGRADED,
                                 std::to_string(blocked) + " loop(s) blocked on an unfinished executor call");
  } else if (running == total) {
    report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_HEALTHY, std::to_string(running) + " loop(s) running");
  } else {
    report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_DEGRADED,
                                 std::to_string(total - running) + " of " + std::to_string(total) + " loop(s) stopped");
  }
  util::SetStruct(*report.component.mutable_details(), "loops", loops);
  return report;
}

SourceReport BreakerStatusSource::Collect() {
  SourceReport report;
  const auto   state = breaker_->State();

  switch (state.phase) {
    case taskorch::v1::BREAKER_PHASE_OPEN:
      report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_ERROR, "circuit open");
      break;
    case taskorch::v1::BREAKER_PHASE_HALF_OPEN:
      report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_DEGRADED, "circuit half-open");
      break;
    default:
      report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_HEALTHY, "circuit closed");
      break;
  }

  auto& d = *report.component.mutable_details();
  util::SetString(d, "phase", taskorch::v1::BreakerPhase_Name(state.phase));
  util::SetNumber(d, "consecutive_failures", state.consecutive_failures);
  return report;
}

SourceReport AgentStatusSource::Collect() {
  SourceReport report;

  int                      failing = 0;
  google::protobuf::Struct agents;
  for (const auto& a : registry_->List()) {
    google::protobuf::Struct s;
    util::SetString(s, "status", a.status);
    util::SetNumber(s, "tasks_completed", static_cast<double>(a.tasks_completed));
    util::SetNumber(s, "tasks_failed", static_cast<double>(a.tasks_failed));
    util::SetStruct(agents, a.name, s);
    if (a.status == "error") ++failing;
  }

  if (failing > 0) {
    report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_DEGRADED, std::to_string(failing) + " agent(s) in error");
  } else {
    report.component = Component(Name(), taskorch::v1::COMPONENT_HEALTH_HEALTHY, std::to_string(agents.fields_size()) + " agent(s)");
  }
  util::SetStruct(*report.component.mutable_details(), "agents", agents);
  return report;
}

} // namespace taskorch::status
