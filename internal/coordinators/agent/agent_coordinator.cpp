#include "agent_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::coordinators::agent {

AgentCoordinator::AgentCoordinator(std::shared_ptr<agents::AgentRegistry> registry, std::shared_ptr<events::EventBus> bus,
                                   std::vector<AgentSpec> configured)
    : registry_(registry), bus_(bus), registration_(registry, bus, std::move(configured)), activity_(registry, bus) {
}

void AgentCoordinator::Initialize() {
  if (initialized_) return;
  activity_.Initialize();
  registration_.Initialize();
  initialized_ = true;
  TASKORCH_LOG_INFO("agent coordinator initialized");
}

void AgentCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;
  registration_.Cleanup();
  activity_.Cleanup();
}

std::string AgentCoordinator::SubmitTask(const std::string& agent, const AgentTaskRequest& request) {
  if (!registry_->Find(agent)) {
    throw util::NotFound("agent not registered: " + agent);
  }

  google::protobuf::Struct data;
  util::SetString(data, "queue_name", request.queue_name);
  util::SetString(data, "task_type", request.task_type);
  util::SetStruct(data, "payload", request.payload);
  util::SetNumber(data, "priority", request.priority);
  util::SetString(data, "requested_by", agent);

  auto event = events::MakeEvent(taskorch::v1::EVENT_TYPE_TASK_REQUESTED, "agent", std::move(data));
  auto id    = event.id();
  bus_->Publish(event);
  return id;
}

} // namespace taskorch::coordinators::agent
