#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "internal/agents/agent_registry.hpp"
#include "internal/coordinators/lifecycle.hpp"
#include "internal/events/event_bus.hpp"

namespace taskorch::coordinators::agent {

/*
  Keeps AgentInfo in step with what the bus reports.

  Task events are attributed to the agent serving the task type. Status
  reports from elsewhere (AGENT_STATUS_CHANGED not sourced "agent") are
  applied as-is. Whenever an agent's status actually changes, the result
  is republished as AGENT_STATUS_CHANGED with source "agent".
*/
class AgentActivityCoordinator final : public Lifecycle {
 public:
  AgentActivityCoordinator(std::shared_ptr<agents::AgentRegistry> registry, std::shared_ptr<events::EventBus> bus);

  std::string_view Name() const override {
    return "agent.activity";
  }

  void Initialize() override;
  void Cleanup() override;
  bool IsInitialized() const override {
    return initialized_;
  }

 private:
  void OnTaskStarted(const taskorch::v1::Event& event);
  void OnTaskFinished(const taskorch::v1::Event& event, bool succeeded);
  void OnMessageDelivered(const taskorch::v1::Event& event);
  void OnStatusReported(const taskorch::v1::Event& event);

  void Apply(const std::string& agent, const std::function<void(agents::AgentInfo&)>& fn);

  std::shared_ptr<agents::AgentRegistry> registry_;
  std::shared_ptr<events::EventBus>      bus_;
  events::SubscriptionSet                subscriptions_;
  std::atomic<bool>                      initialized_{false};
};

} // namespace taskorch::coordinators::agent
