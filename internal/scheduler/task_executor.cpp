#include "task_executor.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::scheduler {

std::shared_ptr<TaskExecutor> MakeNoopExecutor() {
  return std::make_shared<FunctionExecutor>([](const TaskContext& ctx) {
    google::protobuf::Struct result;
    util::SetString(result, "task_id", ctx.task.task_id());
    util::SetStruct(result, "echo", ctx.payload);
    return result;
  });
}

void ExecutorRegistry::Register(const std::string& task_type, std::shared_ptr<TaskExecutor> executor) {
  if (task_type.empty()) {
    throw util::ValidationError("task_type must not be empty");
  }
  if (!executor) {
    throw util::ValidationError("executor for " + task_type + " is null");
  }

  std::lock_guard lock(mutex_);
  if (!executors_.emplace(task_type, std::move(executor)).second) {
    throw util::AlreadyExists("executor already registered for task_type " + task_type);
  }
}

std::shared_ptr<TaskExecutor> ExecutorRegistry::Find(const std::string& task_type) const {
  std::lock_guard lock(mutex_);
  auto            it = executors_.find(task_type);
  return it == executors_.end() ? nullptr : it->second;
}

std::vector<std::string> ExecutorRegistry::TaskTypes() const {
  std::vector<std::string> out;
  {
    std::lock_guard lock(mutex_);
    out.reserve(executors_.size());
    for (const auto& [type, _] : executors_) out.push_back(type);
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace taskorch::scheduler
