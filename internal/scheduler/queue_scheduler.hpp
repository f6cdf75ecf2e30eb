#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/events/event_bus.hpp"
#include "queue_worker.hpp"
#include "scheduler_options.hpp"
#include "task_executor.hpp"

namespace taskorch::scheduler {

/*
  Owns one QueueWorker per configured queue.

  Queues run in parallel and never synchronize with each other; inside a
  queue execution is strictly sequential in (priority ASC, created_at ASC)
  order. All task state lives in the repository; the scheduler only keeps
  which loops run and which task each holds.
*/
class QueueScheduler {
 public:
  QueueScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventBus> bus,
                 std::shared_ptr<ExecutorRegistry> executors, SchedulerOptions options);
  ~QueueScheduler();

  QueueScheduler(const QueueScheduler&)            = delete;
  QueueScheduler& operator=(const QueueScheduler&) = delete;

  void Start();
  void Stop();

  // NotFound for an unknown queue. Idempotent otherwise.
  void StartQueue(const std::string& queue_name);
  void StopQueue(const std::string& queue_name);
  bool IsRunning(const std::string& queue_name) const;

  /*
    Validates and persists a PENDING task, emits TASK_ENQUEUED and wakes
    the queue's loop. Accepted while the queue is stopped.

    NotFound: unknown queue
    ValidationError: no executor for task_type, or payload not encodable
    StoreError: insert failed
  */
  std::string Enqueue(const TaskSpec& spec);

  /*
    PENDING  -> CANCELLED now
    RUNNING  -> stop requested; the loop persists CANCELLED
    terminal -> InvalidState
  */
  void Cancel(const std::string& task_id);

  std::vector<LoopState> LoopStates() const;

  std::vector<std::string> QueueNames() const;

  // NotFound for an unknown queue.
  const QueueOptions& Queue(const std::string& queue_name) const;

 private:
  QueueWorker& Worker(const std::string& queue_name) const;
  void         PublishCancelled(const db::model::TaskRecord& task, const std::string& reason);

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<events::EventBus> bus_;
  std::shared_ptr<ExecutorRegistry> executors_;
  SchedulerOptions                  options_;

  // fixed after construction
  std::map<std::string, std::unique_ptr<QueueWorker>> workers_;
};

} // namespace taskorch::scheduler
