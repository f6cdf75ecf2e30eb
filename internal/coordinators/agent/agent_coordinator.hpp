#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "agent_activity_coordinator.hpp"
#include "agent_registration_coordinator.hpp"

namespace taskorch::coordinators::agent {

struct AgentTaskRequest {
  std::string              queue_name;
  std::string              task_type;
  google::protobuf::Struct payload;
  int32_t                  priority = 0;
};

// Agent domain orchestrator.
class AgentCoordinator final : public Lifecycle {
 public:
  AgentCoordinator(std::shared_ptr<agents::AgentRegistry> registry, std::shared_ptr<events::EventBus> bus, std::vector<AgentSpec> configured);

  std::string_view Name() const override {
    return "agent";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  void Register(const AgentSpec& spec) {
    registration_.Register(spec);
  }
  bool Unregister(const std::string& name) {
    return registration_.Unregister(name);
  }

  // Asks the queue domain for work on behalf of `agent` via TASK_REQUESTED.
  // Returns the request event id. NotFound for an unregistered agent.
  std::string SubmitTask(const std::string& agent, const AgentTaskRequest& request);

  std::vector<agents::AgentInfo> Agents() const {
    return registry_->List();
  }

 private:
  std::shared_ptr<agents::AgentRegistry> registry_;
  std::shared_ptr<events::EventBus>      bus_;

  AgentRegistrationCoordinator registration_;
  AgentActivityCoordinator     activity_;

  std::atomic<bool> initialized_{false};
};

} // namespace taskorch::coordinators::agent
