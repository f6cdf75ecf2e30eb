#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskorch::agents {

struct AgentInfo {
  std::string              name;
  std::vector<std::string> task_types;

  // idle | busy | error, or whatever the agent last reported
  std::string status = "idle";

  std::string current_task_id;
  uint64_t    tasks_completed = 0;
  uint64_t    tasks_failed    = 0;

  // unix micros of the last task event or message seen for this agent
  uint64_t    last_seen = 0;
  std::string last_error;
};

/*
  Named agents and the task types each one serves.

  Observed activity only; nothing here is authoritative for task state.
*/
class AgentRegistry {
 public:
  // AlreadyExists for a taken name, ValidationError for an empty one.
  void Register(const std::string& name, std::vector<std::string> task_types);

  // false when the agent was not registered
  bool Unregister(const std::string& name);

  std::optional<AgentInfo> Find(const std::string& name) const;

  // The agent serving task_type, if any (first registered wins).
  std::optional<std::string> AgentForTaskType(const std::string& task_type) const;

  std::vector<AgentInfo> List() const;

  // Applies fn under the registry lock. false when the agent is unknown.
  bool Update(const std::string& name, const std::function<void(AgentInfo&)>& fn);

  std::size_t Size() const;

 private:
  mutable std::mutex               mutex_;
  std::map<std::string, AgentInfo> agents_;
  std::vector<std::string>         order_;
};

} // namespace taskorch::agents
