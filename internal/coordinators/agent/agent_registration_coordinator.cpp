#include "agent_registration_coordinator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::coordinators::agent {

using observability::IntField;
using observability::StringField;

AgentRegistrationCoordinator::AgentRegistrationCoordinator(std::shared_ptr<agents::AgentRegistry> registry,
                                                           std::shared_ptr<events::EventBus> bus, std::vector<AgentSpec> configured)
    : registry_(std::move(registry)), bus_(std::move(bus)), configured_(std::move(configured)) {
}

void AgentRegistrationCoordinator::Initialize() {
  if (initialized_) return;
  for (const auto& spec : configured_) {
    Register(spec);
  }
  initialized_ = true;
}

void AgentRegistrationCoordinator::Cleanup() {
  if (!initialized_.exchange(false)) return;
  for (const auto& spec : configured_) {
    registry_->Unregister(spec.name);
  }
}

void AgentRegistrationCoordinator::Register(const AgentSpec& spec) {
  registry_->Register(spec.name, spec.task_types);

  TASKORCH_LOG_INFO("agent registered", {StringField("agent", spec.name), IntField("task_types", static_cast<int64_t>(spec.task_types.size()))});

  google::protobuf::Struct data;
  util::SetString(data, "agent", spec.name);
  auto* types = (*data.mutable_fields())["task_types"].mutable_list_value();
  for (const auto& type : spec.task_types) {
    types->add_values()->set_string_value(type);
  }
  bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_AGENT_REGISTERED, "agent", std::move(data)));
}

bool AgentRegistrationCoordinator::Unregister(const std::string& name) {
  const bool removed = registry_->Unregister(name);
  if (removed) TASKORCH_LOG_INFO("agent unregistered", {StringField("agent", name)});
  return removed;
}

} // namespace taskorch::coordinators::agent
