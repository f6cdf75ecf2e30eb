#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "taskorch/v1.hpp"

namespace taskorch::state {

struct StateRepositoryOptions {
  // Queues reported by GetAllStatuses() even when they have no rows.
  std::vector<std::string> queue_names;

  // A queue with failures and a success rate below this is DEGRADED.
  double degraded_success_rate = 0.5;
};

/*
  Read side over the task store.

  Every QueueState is computed from task rows at call time; nothing here
  caches counters. GetAllStatuses() issues exactly two queries no matter
  how many queues or tasks exist: one GROUP BY aggregate and one scan of
  RUNNING rows. The two run concurrently and fail independently.
*/
class StateRepository {
 public:
  StateRepository(std::shared_ptr<db::Repository> repository, StateRepositoryOptions options);

  // NotFound for a queue that is neither configured nor present in the store.
  taskorch::v1::QueueState GetStatus(const std::string& queue_name) const;

  // Never throws; failed branches become placeholders with `error` set.
  std::map<std::string, taskorch::v1::QueueState> GetAllStatuses() const;

  std::vector<taskorch::v1::TaskView> GetPendingTasks(const std::string& queue_name, std::size_t limit) const;
  std::vector<taskorch::v1::TaskView> GetRunningTasks() const;

  // Finished tasks completed within `window` of now, newest first.
  std::vector<taskorch::v1::TaskView> GetTaskHistory(const std::string& queue_name, std::chrono::milliseconds window,
                                                     std::size_t limit = 1000) const;

  taskorch::v1::TaskView GetTask(const std::string& task_id) const;

  // Deletes finished rows completed before now - older_than. Returns the count.
  uint64_t PruneFinishedTasks(std::chrono::milliseconds older_than) const;

  bool IsHealthy() const;

  const std::vector<std::string>& QueueNames() const {
    return options_.queue_names;
  }

 private:
  taskorch::v1::QueueState Derive(const std::string& name, const db::model::QueueAggregateRecord* aggregate,
                                  const db::model::TaskRecord* running) const;

  std::shared_ptr<db::Repository> repository_;
  StateRepositoryOptions          options_;
};

} // namespace taskorch::state
