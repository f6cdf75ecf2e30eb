#include "queue_scheduler.hpp"

#include "internal/model/state_machine.hpp"
#include "internal/model/task_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/struct_fields.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace taskorch::scheduler {

using observability::StringField;

QueueScheduler::QueueScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventBus> bus,
                               std::shared_ptr<ExecutorRegistry> executors, SchedulerOptions options)
    : repository_(std::move(repository)), bus_(std::move(bus)), executors_(std::move(executors)), options_(std::move(options)) {
  for (const auto& q : options_.queues) {
    if (q.name.empty()) {
      throw util::ValidationError("queue name must not be empty");
    }
    auto worker = std::make_unique<QueueWorker>(q, options_, repository_, bus_, executors_);
    if (!workers_.emplace(q.name, std::move(worker)).second) {
      throw util::AlreadyExists("duplicate queue: " + q.name);
    }
  }
}

QueueScheduler::~QueueScheduler() {
  Stop();
}

void QueueScheduler::Start() {
  for (auto& [_, worker] : workers_) worker->Start();
}

void QueueScheduler::Stop() {
  for (auto& [_, worker] : workers_) worker->Stop();
}

void QueueScheduler::StartQueue(const std::string& queue_name) {
  Worker(queue_name).Start();
}

void QueueScheduler::StopQueue(const std::string& queue_name) {
  Worker(queue_name).Stop();
}

bool QueueScheduler::IsRunning(const std::string& queue_name) const {
  return Worker(queue_name).IsRunning();
}

QueueWorker& QueueScheduler::Worker(const std::string& queue_name) const {
  auto it = workers_.find(queue_name);
  if (it == workers_.end()) {
    throw util::NotFound("unknown queue: " + queue_name);
  }
  return *it->second;
}

const QueueOptions& QueueScheduler::Queue(const std::string& queue_name) const {
  return Worker(queue_name).Options();
}

std::vector<std::string> QueueScheduler::QueueNames() const {
  std::vector<std::string> out;
  out.reserve(workers_.size());
  for (const auto& [name, _] : workers_) out.push_back(name);
  return out;
}

std::vector<LoopState> QueueScheduler::LoopStates() const {
  std::vector<LoopState> out;
  out.reserve(workers_.size());
  for (const auto& [_, worker] : workers_) out.push_back(worker->State());
  return out;
}

std::string QueueScheduler::Enqueue(const TaskSpec& spec) {
  auto& worker = Worker(spec.queue_name);

  if (spec.task_type.empty()) {
    throw util::ValidationError("task_type must not be empty");
  }
  if (!executors_->Has(spec.task_type)) {
    throw util::ValidationError("no executor registered for task_type " + spec.task_type);
  }

  db::model::TaskRecord task;
  task.task_id     = util::NewId();
  task.queue_name  = spec.queue_name;
  task.task_type   = spec.task_type;
  task.status      = taskorch::v1::TASK_STATUS_PENDING;
  task.priority    = spec.priority;
  task.payload     = model::EncodePayload(spec.payload);
  task.retry_count = 0;
  task.max_retries = spec.max_retries < 0 ? worker.Options().max_retries : static_cast<uint32_t>(spec.max_retries);
  task.created_at  = util::UniqueNowMicros();

  {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertTask(*tx, task);
    if (!result) {
      throw util::StoreError("enqueue into " + spec.queue_name + ": " + result.message);
    }
    tx->Commit();
  }

  google::protobuf::Struct data;
  util::SetString(data, "task_id", task.task_id);
  util::SetString(data, "queue_name", task.queue_name);
  util::SetString(data, "task_type", task.task_type);
  util::SetString(data, "status", taskorch::v1::TaskStatus_Name(task.status));
  util::SetNumber(data, "priority", task.priority);
  bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_TASK_ENQUEUED, "queue_scheduler", std::move(data)));

  worker.Wake();

  TASKORCH_LOG_DEBUG("task enqueued", {StringField("queue", task.queue_name), StringField("task_id", task.task_id),
                                       StringField("task_type", task.task_type)});
  return task.task_id;
}

void QueueScheduler::Cancel(const std::string& task_id) {
  // A PENDING row can be claimed between the read and the write; the
  // second pass then sees RUNNING.
  for (int pass = 0; pass < 2; ++pass) {
    db::model::TaskRecord task;
    {
      auto tx  = repository_->Begin();
      auto row = repository_->GetTask(*tx, task_id);
      if (!row) {
        throw util::NotFound("task not found: " + task_id);
      }
      task = std::move(*row);

      if (model::IsTerminal(task.status)) {
        throw util::InvalidState("task " + task_id + " is already " + taskorch::v1::TaskStatus_Name(task.status));
      }

      if (task.status == taskorch::v1::TASK_STATUS_PENDING) {
        const auto expected = task.status;
        task.status         = taskorch::v1::TASK_STATUS_CANCELLED;
        task.completed_at   = util::NowMicros();
        task.error          = "cancelled";

        auto result = repository_->UpdateTaskIf(*tx, task, expected);
        if (result) {
          tx->Commit();
          PublishCancelled(task, "cancelled before start");
          return;
        }
        if (result.code != db::ErrorCode::Conflict) {
          throw util::StoreError("cancel " + task_id + ": " + result.message);
        }
        continue;
      }
      tx->Commit();
    }

    // RUNNING: the owning loop finishes the transition when it holds the task.
    auto it = workers_.find(task.queue_name);
    if (it != workers_.end() && it->second->RequestCancel(task_id)) {
      return;
    }

    // RUNNING without a loop holding it (left over, loop stopped).
    task.status       = taskorch::v1::TASK_STATUS_CANCELLED;
    task.completed_at = util::NowMicros();
    task.error        = "cancelled";

    auto tx     = repository_->Begin();
    auto result = repository_->UpdateTaskIf(*tx, task, taskorch::v1::TASK_STATUS_RUNNING);
    if (result) {
      tx->Commit();
      PublishCancelled(task, "cancelled while not held by a loop");
      return;
    }
    if (result.code != db::ErrorCode::Conflict) {
      throw util::StoreError("cancel " + task_id + ": " + result.message);
    }
  }

  throw util::InvalidState("task " + task_id + " changed state during cancel");
}

void QueueScheduler::PublishCancelled(const db::model::TaskRecord& task, const std::string& reason) {
  google::protobuf::Struct data;
  util::SetString(data, "task_id", task.task_id);
  util::SetString(data, "queue_name", task.queue_name);
  util::SetString(data, "task_type", task.task_type);
  util::SetString(data, "status", taskorch::v1::TaskStatus_Name(task.status));
  util::SetString(data, "reason", reason);
  bus_->Publish(events::MakeEvent(taskorch::v1::EVENT_TYPE_TASK_CANCELLED, "queue_scheduler", std::move(data)));

  TASKORCH_LOG_INFO("task cancelled", {StringField("queue", task.queue_name), StringField("task_id", task.task_id),
                                       StringField("reason", reason)});
}

} // namespace taskorch::scheduler
