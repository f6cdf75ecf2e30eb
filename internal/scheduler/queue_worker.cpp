#include "queue_worker.hpp"

#include "internal/model/task_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/struct_fields.hpp"

namespace taskorch::scheduler {

using observability::BoolField;
using observability::IntField;
using observability::StringField;
using taskorch::v1::EventType;

namespace {

constexpr std::chrono::milliseconds kPollSlice{20};

int64_t ToMillis(std::chrono::milliseconds d) {
  return static_cast<int64_t>(d.count());
}

} // namespace

QueueWorker::QueueWorker(QueueOptions queue, const SchedulerOptions& scheduler, std::shared_ptr<db::Repository> repository,
                         std::shared_ptr<events::EventBus> bus, std::shared_ptr<ExecutorRegistry> executors)
    : queue_(std::move(queue)),
      retry_(scheduler.retry),
      store_retry_backoff_(scheduler.store_retry_backoff),
      stop_grace_(scheduler.stop_grace),
      repository_(std::move(repository)),
      bus_(std::move(bus)),
      executors_(std::move(executors)) {
}

QueueWorker::~QueueWorker() {
  Stop();
}

void QueueWorker::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;

  stopping_ = false;
  running_  = true;
  thread_   = std::thread(&QueueWorker::Run, this);
}

void QueueWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!thread_.joinable()) return;
    stopping_          = true;
    stop_requested_at_ = util::SteadyNow();
  }
  cv_.notify_all();

  thread_.join();
  running_ = false;

  std::lock_guard lock(mutex_);
  stopping_ = false;
}

void QueueWorker::Wake() {
  {
    std::lock_guard lock(mutex_);
    wake_ = true;
  }
  cv_.notify_all();
}

bool QueueWorker::RequestCancel(const std::string& task_id) {
  std::lock_guard lock(mutex_);
  if (task_id.empty() || current_task_id_ != task_id || decided_) return false;
  cancel_requested_ = true;
  current_stop_.request_stop();
  return true;
}

LoopState QueueWorker::State() const {
  std::lock_guard lock(mutex_);
  LoopState       s;
  s.queue_name              = queue_.name;
  s.running                 = running_;
  s.current_task_id         = current_task_id_;
  s.current_task_type       = current_task_type_;
  s.current_task_started_at = current_started_at_;
  s.processed               = processed_;
  s.blocked                 = blocked_;
  return s;
}

bool QueueWorker::Stopping() const {
  std::lock_guard lock(mutex_);
  return stopping_;
}

bool QueueWorker::WaitFor(std::chrono::milliseconds timeout, bool wake_on_work) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return stopping_ || (wake_on_work && wake_); });
  if (wake_on_work) wake_ = false;
  return !stopping_;
}

// ------------------------------------------------------------------
// Loop
// ------------------------------------------------------------------

void QueueWorker::Run() {
  TASKORCH_LOG_INFO("queue loop started", {StringField("queue", queue_.name)});

  bool recovered = false;
  while (!Stopping()) {
    try {
      if (!recovered) {
        RecoverAbandoned();
        recovered = true;
      }

      const auto now = util::SteadyNow();
      if (now < backoff_until_) {
        WaitFor(std::chrono::duration_cast<std::chrono::milliseconds>(backoff_until_ - now), false);
        continue;
      }

      auto next = ClaimNext();
      if (!next) {
        WaitFor(queue_.poll_interval, true);
        continue;
      }
      Execute(std::move(*next));
    } catch (const util::StoreError& e) {
      TASKORCH_LOG_WARN("queue loop store failure, backing off",
                        {StringField("queue", queue_.name), StringField("error", e.what()),
                         IntField("backoff_ms", ToMillis(store_retry_backoff_))});
      WaitFor(store_retry_backoff_, false);
    } catch (const std::exception& e) {
      TASKORCH_LOG_ERROR("queue loop iteration failed",
                         {StringField("queue", queue_.name), StringField("error", e.what())});
      WaitFor(store_retry_backoff_, false);
    }
  }

  TASKORCH_LOG_INFO("queue loop stopped", {StringField("queue", queue_.name)});
}

void QueueWorker::RecoverAbandoned() {
  std::vector<db::model::TaskRecord> abandoned;
  {
    auto tx   = repository_->Begin();
    abandoned = repository_->ListRunningTasks(*tx, queue_.name);
    tx->Commit();
  }

  for (auto& task : abandoned) {
    TASKORCH_LOG_WARN("recovering task left RUNNING", {StringField("queue", queue_.name), StringField("task_id", task.task_id)});
    FailOrRequeue(std::move(task), "timed out: task was RUNNING when its queue loop started", true);
  }
}

std::optional<db::model::TaskRecord> QueueWorker::ClaimNext() {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListPendingTasks(*tx, queue_.name, 1);
  if (rows.empty()) {
    tx->Commit();
    return std::nullopt;
  }

  auto task = std::move(rows.front());
  task.status       = taskorch::v1::TASK_STATUS_RUNNING;
  task.started_at   = util::NowMicros();
  task.completed_at = 0;
  task.error.clear();

  auto result = repository_->UpdateTaskIf(*tx, task, taskorch::v1::TASK_STATUS_PENDING);
  if (!result) {
    throw util::StoreError("claim " + task.task_id + ": " + result.message);
  }

  // Registered before commit so a Cancel() that sees RUNNING always finds it here.
  {
    std::lock_guard lock(mutex_);
    current_task_id_    = task.task_id;
    current_task_type_  = task.task_type;
    current_started_at_ = task.started_at;
    current_stop_       = std::stop_source{};
    cancel_requested_   = false;
    decided_            = false;
    blocked_            = false;
  }

  try {
    tx->Commit();
  } catch (const util::StoreError&) {
    ClearInFlight();
    throw;
  }
  return task;
}

void QueueWorker::ClearInFlight() {
  std::lock_guard lock(mutex_);
  current_task_id_.clear();
  current_task_type_.clear();
  current_started_at_ = 0;
  cancel_requested_   = false;
  decided_            = false;
  blocked_            = false;
}

bool QueueWorker::DecideOutcome() {
  std::lock_guard lock(mutex_);
  decided_ = true;
  return cancel_requested_;
}

// ------------------------------------------------------------------
// One task
// ------------------------------------------------------------------

void QueueWorker::Execute(db::model::TaskRecord task) {
  google::protobuf::Struct started;
  util::SetNumber(started, "retry_count", task.retry_count);
  Publish(taskorch::v1::EVENT_TYPE_TASK_STARTED, task, std::move(started));

  observability::SpanScope span("taskorch.task.execute");
  span.SetAttribute("taskorch.queue", queue_.name);
  span.SetAttribute("taskorch.task_id", task.task_id);
  span.SetAttribute("taskorch.task_type", task.task_type);

  Attempt attempt;
  try {
    auto executor = executors_->Find(task.task_type);
    if (!executor) {
      throw util::ValidationError("no executor registered for task_type " + task.task_type);
    }

    google::protobuf::Struct payload;
    try {
      payload = model::DecodePayload(task.payload);
    } catch (const util::ValidationError& e) {
      TASKORCH_LOG_ERROR("data-quality alarm: stored task payload is not a JSON object",
                         {StringField("queue", queue_.name), StringField("task_id", task.task_id), StringField("error", e.what())});
      throw;
    }

    attempt = Invoke(task, std::move(executor), std::move(payload));
  } catch (const util::ValidationError& e) {
    attempt.outcome   = Outcome::kFailed;
    attempt.error     = e.what();
    attempt.retryable = false;
    if (DecideOutcome()) {
      attempt.outcome = Outcome::kCancelled;
      attempt.error   = "cancelled";
    }
  }

  if (attempt.outcome != Outcome::kCompleted) {
    span.RecordException(attempt.error);
  }

  auto unfinished = std::move(attempt.unfinished);
  Finish(task, attempt);
  AwaitUnfinished(task, unfinished);

  ClearInFlight();
  std::lock_guard lock(mutex_);
  ++processed_;
}

QueueWorker::Attempt QueueWorker::Invoke(const db::model::TaskRecord& task, std::shared_ptr<TaskExecutor> executor,
                                         google::protobuf::Struct payload) {
  std::stop_source stop;
  {
    std::lock_guard lock(mutex_);
    stop = current_stop_;
  }

  TaskContext ctx{model::ToView(task), std::move(payload), stop.get_token()};
  auto        future = util::RunDetached([executor, ctx = std::move(ctx)] { return executor->Execute(ctx); });

  const auto deadline = util::SteadyNow() + queue_.timeout;
  Attempt    attempt;

  for (;;) {
    if (future.wait_for(kPollSlice) == std::future_status::ready) {
      if (DecideOutcome()) {
        attempt.outcome = Outcome::kCancelled;
        attempt.error   = "cancelled";
        return attempt;
      }
      try {
        attempt.outcome = Outcome::kCompleted;
        attempt.result  = future.get();
      } catch (const util::ValidationError& e) {
        attempt.outcome   = Outcome::kFailed;
        attempt.error     = e.what();
        attempt.retryable = false;
      } catch (const std::exception& e) {
        attempt.outcome = Outcome::kFailed;
        attempt.error   = e.what();
      } catch (...) {
        attempt.outcome = Outcome::kFailed;
        attempt.error   = "executor threw a non-standard exception";
      }
      return attempt;
    }

    const auto      now = util::SteadyNow();
    std::lock_guard lock(mutex_);
    if (cancel_requested_) {
      attempt.outcome = Outcome::kCancelled;
      attempt.error   = "cancelled";
    } else if (stopping_ && now - stop_requested_at_ >= stop_grace_) {
      attempt.outcome = Outcome::kStopped;
      attempt.error   = "cancelled: queue stopped";
    } else if (now >= deadline) {
      attempt.outcome = Outcome::kTimedOut;
      attempt.error   = "timed out after " + std::to_string(ToMillis(queue_.timeout)) + "ms";
    } else {
      continue;
    }
    decided_ = true;
    break;
  }

  stop.request_stop();
  attempt.unfinished = std::move(future);
  return attempt;
}

void QueueWorker::AwaitUnfinished(const db::model::TaskRecord& task, std::future<google::protobuf::Struct>& call) {
  if (!call.valid()) return;

  const auto since   = util::SteadyNow();
  bool       blocked = false;
  while (call.wait_for(kPollSlice) != std::future_status::ready) {
    const auto      now = util::SteadyNow();
    std::lock_guard lock(mutex_);
    if (stopping_ && now - stop_requested_at_ >= stop_grace_) {
      TASKORCH_LOG_ERROR("abandoning executor call that ignored its stop request",
                         {StringField("queue", queue_.name), StringField("task_id", task.task_id)});
      return;
    }
    if (!blocked && now - since >= stop_grace_) {
      blocked  = true;
      blocked_ = true;
      TASKORCH_LOG_ERROR("executor ignored its stop request, queue blocked until it returns",
                         {StringField("queue", queue_.name), StringField("task_id", task.task_id),
                          IntField("waited_ms", ToMillis(std::chrono::duration_cast<std::chrono::milliseconds>(now - since)))});
    }
  }

  if (blocked) {
    TASKORCH_LOG_WARN("late executor call returned, queue unblocked",
                      {StringField("queue", queue_.name), StringField("task_id", task.task_id)});
  }
}

void QueueWorker::Finish(db::model::TaskRecord task, const Attempt& attempt) {
  const uint64_t now         = util::NowMicros();
  const double   duration_ms = task.started_at && now > task.started_at ? static_cast<double>(now - task.started_at) / 1000.0 : 0.0;

  switch (attempt.outcome) {
    case Outcome::kCompleted: {
      task.status       = taskorch::v1::TASK_STATUS_COMPLETED;
      task.completed_at = now;
      task.error.clear();
      if (!Persist(task, taskorch::v1::TASK_STATUS_RUNNING)) return;

      google::protobuf::Struct data;
      util::SetNumber(data, "duration_ms", duration_ms);
      util::SetStruct(data, "result", attempt.result);
      Publish(taskorch::v1::EVENT_TYPE_TASK_COMPLETED, task, std::move(data));

      observability::Metrics::Instance().RecordTaskOutcome(queue_.name, "completed");
      observability::Metrics::Instance().ObserveTaskDurationMs(queue_.name, duration_ms);
      TASKORCH_LOG_DEBUG("task completed", {StringField("queue", queue_.name), StringField("task_id", task.task_id),
                                            observability::DoubleField("duration_ms", duration_ms)});
      return;
    }

    case Outcome::kCancelled:
    case Outcome::kStopped: {
      task.status       = taskorch::v1::TASK_STATUS_CANCELLED;
      task.completed_at = now;
      task.error        = attempt.error;
      if (!Persist(task, taskorch::v1::TASK_STATUS_RUNNING)) return;

      google::protobuf::Struct data;
      util::SetString(data, "reason", attempt.error);
      Publish(taskorch::v1::EVENT_TYPE_TASK_CANCELLED, task, std::move(data));
      observability::Metrics::Instance().RecordTaskOutcome(queue_.name, "cancelled");
      TASKORCH_LOG_INFO("task cancelled", {StringField("queue", queue_.name), StringField("task_id", task.task_id),
                                           StringField("reason", attempt.error)});
      return;
    }

    case Outcome::kFailed:
    case Outcome::kTimedOut:
      FailOrRequeue(std::move(task), attempt.error, attempt.retryable);
      return;
  }
}

void QueueWorker::FailOrRequeue(db::model::TaskRecord task, const std::string& error, bool retryable) {
  if (retryable && retry_.ShouldRetry(task.retry_count, task.max_retries)) {
    const auto delay = retry_.Delay(task.retry_count);

    task.status = taskorch::v1::TASK_STATUS_PENDING;
    task.retry_count += 1;
    task.started_at   = 0;
    task.completed_at = 0;
    task.error        = error;
    if (!Persist(task, taskorch::v1::TASK_STATUS_RUNNING)) return;

    backoff_until_ = util::SteadyNow() + delay;

    google::protobuf::Struct failed;
    util::SetString(failed, "error", error);
    util::SetBool(failed, "will_retry", true);
    util::SetNumber(failed, "retry_count", task.retry_count);
    Publish(taskorch::v1::EVENT_TYPE_TASK_FAILED, task, std::move(failed));

    google::protobuf::Struct scheduled;
    util::SetNumber(scheduled, "retry_count", task.retry_count);
    util::SetNumber(scheduled, "delay_ms", static_cast<double>(delay.count()));
    Publish(taskorch::v1::EVENT_TYPE_TASK_RETRY_SCHEDULED, task, std::move(scheduled));

    observability::Metrics::Instance().RecordTaskOutcome(queue_.name, "retried");
    TASKORCH_LOG_WARN("task failed, retry scheduled",
                      {StringField("queue", queue_.name), StringField("task_id", task.task_id), StringField("error", error),
                       IntField("retry_count", task.retry_count), IntField("delay_ms", ToMillis(delay))});
    return;
  }

  task.status       = taskorch::v1::TASK_STATUS_FAILED;
  task.completed_at = util::NowMicros();
  task.error        = error;
  if (!Persist(task, taskorch::v1::TASK_STATUS_RUNNING)) return;

  google::protobuf::Struct failed;
  util::SetString(failed, "error", error);
  util::SetBool(failed, "will_retry", false);
  util::SetNumber(failed, "retry_count", task.retry_count);
  Publish(taskorch::v1::EVENT_TYPE_TASK_FAILED, task, std::move(failed));

  observability::Metrics::Instance().RecordTaskOutcome(queue_.name, "failed");
  TASKORCH_LOG_ERROR("task failed", {StringField("queue", queue_.name), StringField("task_id", task.task_id),
                                     StringField("error", error), BoolField("retryable", retryable)});
}

bool QueueWorker::Persist(const db::model::TaskRecord& task, taskorch::v1::TaskStatus expected) {
  for (int attempt = 1;; ++attempt) {
    try {
      auto tx     = repository_->Begin();
      auto result = repository_->UpdateTaskIf(*tx, task, expected);
      if (result) {
        tx->Commit();
        return true;
      }
      tx->Rollback();

      if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::NotFound) {
        TASKORCH_LOG_WARN("task changed concurrently, dropping transition",
                          {StringField("queue", queue_.name), StringField("task_id", task.task_id),
                           StringField("to", taskorch::v1::TaskStatus_Name(task.status)), StringField("reason", result.message)});
        return false;
      }
      throw util::StoreError(result.message);
    } catch (const util::StoreError& e) {
      // While stopping, give up after a few attempts; the row is recovered
      // by RecoverAbandoned() on the next start.
      if (Stopping() && attempt >= 3) {
        TASKORCH_LOG_ERROR("could not persist task transition during shutdown",
                           {StringField("queue", queue_.name), StringField("task_id", task.task_id), StringField("error", e.what())});
        return false;
      }
      TASKORCH_LOG_WARN("persisting task transition failed, retrying",
                        {StringField("queue", queue_.name), StringField("task_id", task.task_id), StringField("error", e.what()),
                         IntField("attempt", attempt)});
      std::this_thread::sleep_for(store_retry_backoff_);
    }
  }
}

void QueueWorker::Publish(EventType type, const db::model::TaskRecord& task, google::protobuf::Struct data) {
  util::SetString(data, "task_id", task.task_id);
  util::SetString(data, "queue_name", task.queue_name);
  util::SetString(data, "task_type", task.task_type);
  util::SetString(data, "status", taskorch::v1::TaskStatus_Name(task.status));
  bus_->Publish(events::MakeEvent(type, "queue:" + queue_.name, std::move(data)));
}

} // namespace taskorch::scheduler
