#pragma once

#include <google/protobuf/struct.pb.h>

#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "taskorch/v1.hpp"

namespace taskorch::scheduler {

/*
  What an executor sees for one attempt.

  `stop` is requested when the attempt times out, the task is cancelled or
  the queue stops past its grace period. Executors that run long should
  poll it: the queue does not claim its next task until the call returns.
*/
struct TaskContext {
  taskorch::v1::TaskView   task;
  google::protobuf::Struct payload;
  std::stop_token          stop;
};

/*
  Domain work for one task_type.

  Throw util::ExecutionError (or any std::exception) for a retryable
  failure and util::ValidationError for a task that can never succeed.
  The returned Struct is published with TASK_COMPLETED.
*/
class TaskExecutor {
 public:
  virtual ~TaskExecutor() = default;

  virtual google::protobuf::Struct Execute(const TaskContext& ctx) = 0;
};

class FunctionExecutor final : public TaskExecutor {
 public:
  using Fn = std::function<google::protobuf::Struct(const TaskContext&)>;

  explicit FunctionExecutor(Fn fn) : fn_(std::move(fn)) {
  }

  google::protobuf::Struct Execute(const TaskContext& ctx) override {
    return fn_(ctx);
  }

 private:
  Fn fn_;
};

// Echoes the payload back; used for smoke runs of the daemon.
std::shared_ptr<TaskExecutor> MakeNoopExecutor();

/*
  task_type -> executor. Thread-safe; registrations may happen while
  queues run.
*/
class ExecutorRegistry {
 public:
  // AlreadyExists when task_type is taken.
  void Register(const std::string& task_type, std::shared_ptr<TaskExecutor> executor);

  void Register(const std::string& task_type, FunctionExecutor::Fn fn) {
    Register(task_type, std::make_shared<FunctionExecutor>(std::move(fn)));
  }

  // nullptr when nothing is registered
  std::shared_ptr<TaskExecutor> Find(const std::string& task_type) const;

  bool Has(const std::string& task_type) const {
    return Find(task_type) != nullptr;
  }

  std::vector<std::string> TaskTypes() const;

 private:
  mutable std::mutex                                             mutex_;
  std::unordered_map<std::string, std::shared_ptr<TaskExecutor>> executors_;
};

} // namespace taskorch::scheduler
