#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "internal/agents/agent_registry.hpp"
#include "internal/coordinators/lifecycle.hpp"
#include "internal/events/event_bus.hpp"

namespace taskorch::coordinators::agent {

struct AgentSpec {
  std::string              name;
  std::vector<std::string> task_types;
};

/*
  Owns agent membership. Configured agents are registered on Initialize
  and removed again on Cleanup; agents added at runtime through
  Register() stay until Unregister().
*/
class AgentRegistrationCoordinator final : public Lifecycle {
 public:
  AgentRegistrationCoordinator(std::shared_ptr<agents::AgentRegistry> registry, std::shared_ptr<events::EventBus> bus,
                               std::vector<AgentSpec> configured);

  std::string_view Name() const override {
    return "agent.registration";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

  // Publishes AGENT_REGISTERED. AlreadyExists / ValidationError from the registry.
  void Register(const AgentSpec& spec);
  bool Unregister(const std::string& name);

 private:
  std::shared_ptr<agents::AgentRegistry> registry_;
  std::shared_ptr<events::EventBus>      bus_;
  std::vector<AgentSpec>                 configured_;
  std::atomic<bool>                      initialized_{false};
};

} // namespace taskorch::coordinators::agent
