#pragma once

#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "internal/db/api/repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/util/time.hpp"
#include "scheduler_options.hpp"
#include "task_executor.hpp"

namespace taskorch::scheduler {

/*
  Execution loop for one named queue.

  One thread, one task at a time. A claimed task is driven to COMPLETED,
  FAILED, CANCELLED or back to PENDING (retry) and that row write is
  committed before the next claim. Different workers share nothing but
  the repository and the event bus.

  An executor call that outlives its attempt (timeout, cancel) is still
  waited for before the next claim, so no two calls of one queue ever
  overlap. Past stop_grace the loop reports itself blocked until the call
  returns; only Stop() abandons it.

  The loop never exits on a task or store failure. It exits only through
  Stop(), which gives an in-flight task stop_grace to finish and marks it
  CANCELLED otherwise.
*/
class QueueWorker {
 public:
  QueueWorker(QueueOptions queue, const SchedulerOptions& scheduler, std::shared_ptr<db::Repository> repository,
              std::shared_ptr<events::EventBus> bus, std::shared_ptr<ExecutorRegistry> executors);
  ~QueueWorker();

  QueueWorker(const QueueWorker&)            = delete;
  QueueWorker& operator=(const QueueWorker&) = delete;

  void Start();

  // Blocks until the loop has exited and the in-flight row is terminal.
  void Stop();

  bool IsRunning() const {
    return running_;
  }

  // New work is available.
  void Wake();

  // true when task_id is this worker's in-flight task and its outcome is
  // not decided yet; the worker then persists CANCELLED itself.
  bool RequestCancel(const std::string& task_id);

  LoopState State() const;

  const QueueOptions& Options() const {
    return queue_;
  }

 private:
  enum class Outcome { kCompleted, kFailed, kTimedOut, kCancelled, kStopped };

  struct Attempt {
    Outcome                  outcome = Outcome::kFailed;
    google::protobuf::Struct result;
    std::string              error;
    bool                     retryable = true;

    // set when the executor call was given up on but has not returned
    std::future<google::protobuf::Struct> unfinished;
  };

  void Run();
  void RecoverAbandoned();
  std::optional<db::model::TaskRecord> ClaimNext();
  void Execute(db::model::TaskRecord task);
  Attempt Invoke(const db::model::TaskRecord& task, std::shared_ptr<TaskExecutor> executor, google::protobuf::Struct payload);
  void Finish(db::model::TaskRecord task, const Attempt& attempt);
  void AwaitUnfinished(const db::model::TaskRecord& task, std::future<google::protobuf::Struct>& call);

  // Freezes the in-flight outcome. Returns true when a cancel got in first.
  bool DecideOutcome();
  void FailOrRequeue(db::model::TaskRecord task, const std::string& error, bool retryable);

  // Compare-and-set against `expected`. false when the row changed underneath.
  bool Persist(const db::model::TaskRecord& task, taskorch::v1::TaskStatus expected);

  void Publish(taskorch::v1::EventType type, const db::model::TaskRecord& task, google::protobuf::Struct data = {});

  // false once Stop() was requested
  bool WaitFor(std::chrono::milliseconds timeout, bool wake_on_work);
  bool Stopping() const;
  void ClearInFlight();

  QueueOptions                      queue_;
  RetryPolicy                       retry_;
  std::chrono::milliseconds         store_retry_backoff_;
  std::chrono::milliseconds         stop_grace_;
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<events::EventBus> bus_;
  std::shared_ptr<ExecutorRegistry> executors_;

  std::thread       thread_;
  std::atomic<bool> running_{false};

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  bool                    wake_     = false;
  util::SteadyTimePoint   stop_requested_at_;

  // loop thread only
  util::SteadyTimePoint backoff_until_;

  // in-flight task, guarded by mutex_
  std::string      current_task_id_;
  std::string      current_task_type_;
  uint64_t         current_started_at_ = 0;
  std::stop_source current_stop_;
  bool             cancel_requested_ = false;
  bool             decided_          = false;
  bool             blocked_          = false;
  uint64_t         processed_        = 0;
};

} // namespace taskorch::scheduler
