#include "agent_registry.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace taskorch::agents {

void AgentRegistry::Register(const std::string& name, std::vector<std::string> task_types) {
  if (name.empty()) {
    throw util::ValidationError("agent name must not be empty");
  }

  std::lock_guard lock(mutex_);
  if (agents_.contains(name)) {
    throw util::AlreadyExists("agent already registered: " + name);
  }

  AgentInfo info;
  info.name       = name;
  info.task_types = std::move(task_types);
  agents_.emplace(name, std::move(info));
  order_.push_back(name);
}

bool AgentRegistry::Unregister(const std::string& name) {
  std::lock_guard lock(mutex_);
  if (agents_.erase(name) == 0) return false;
  std::erase(order_, name);
  return true;
}

std::optional<AgentInfo> AgentRegistry::Find(const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto            it = agents_.find(name);
  if (it == agents_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> AgentRegistry::AgentForTaskType(const std::string& task_type) const {
  std::lock_guard lock(mutex_);
  for (const auto& name : order_) {
    const auto& types = agents_.at(name).task_types;
    if (std::find(types.begin(), types.end(), task_type) != types.end()) return name;
  }
  return std::nullopt;
}

std::vector<AgentInfo> AgentRegistry::List() const {
  std::lock_guard        lock(mutex_);
  std::vector<AgentInfo> out;
  out.reserve(agents_.size());
  for (const auto& [_, info] : agents_) out.push_back(info);
  return out;
}

bool AgentRegistry::Update(const std::string& name, const std::function<void(AgentInfo&)>& fn) {
  std::lock_guard lock(mutex_);
  auto            it = agents_.find(name);
  if (it == agents_.end()) return false;
  fn(it->second);
  return true;
}

std::size_t AgentRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return agents_.size();
}

} // namespace taskorch::agents
