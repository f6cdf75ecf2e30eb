#include "state_repository.hpp"

#include <optional>
#include <unordered_map>

#include "internal/model/task_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace taskorch::state {

using taskorch::v1::QueueState;

namespace {

template <typename Fn>
auto ReadOnly(db::Repository& repo, Fn&& fn) {
  auto tx     = repo.Begin();
  auto result = fn(*tx);
  tx->Commit();
  return result;
}

std::vector<taskorch::v1::TaskView> ToViews(const std::vector<db::model::TaskRecord>& rows) {
  std::vector<taskorch::v1::TaskView> out;
  out.reserve(rows.size());
  for (const auto& r : rows) out.push_back(model::ToView(r));
  return out;
}

} // namespace

StateRepository::StateRepository(std::shared_ptr<db::Repository> repository, StateRepositoryOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
}

QueueState StateRepository::Derive(const std::string& name, const db::model::QueueAggregateRecord* a,
                                   const db::model::TaskRecord* running) const {
  QueueState s;
  s.set_name(name);

  if (a) {
    s.set_pending(a->pending);
    s.set_running(a->running);
    s.set_completed(a->completed);
    s.set_failed(a->failed);
    s.set_cancelled(a->cancelled);
    s.set_avg_duration_ms(a->avg_duration_ms);
    if (a->last_activity) *s.mutable_last_activity() = util::MicrosToProto(a->last_activity);
  }

  const uint64_t finished = s.completed() + s.failed();
  s.set_success_rate(finished == 0 ? 1.0 : static_cast<double>(s.completed()) / static_cast<double>(finished));

  if (s.failed() > 0 && s.success_rate() < options_.degraded_success_rate) {
    s.set_status(taskorch::v1::QUEUE_STATUS_DEGRADED);
  } else if (s.pending() > 0 || s.running() > 0) {
    s.set_status(taskorch::v1::QUEUE_STATUS_RUNNING);
  } else {
    s.set_status(taskorch::v1::QUEUE_STATUS_IDLE);
  }

  if (running) {
    s.set_current_task_id(running->task_id);
    s.set_current_task_type(running->task_type);
    if (running->started_at) *s.mutable_current_task_started_at() = util::MicrosToProto(running->started_at);
  }
  return s;
}

QueueState StateRepository::GetStatus(const std::string& queue_name) const {
  auto [aggregates, running] = ReadOnly(*repository_, [&](db::Transaction& tx) {
    return std::make_pair(repository_->AggregateQueues(tx, queue_name), repository_->ListRunningTasks(tx, queue_name));
  });

  const db::model::QueueAggregateRecord* a = aggregates.empty() ? nullptr : &aggregates.front();
  if (!a) {
    bool configured = false;
    for (const auto& q : options_.queue_names) configured = configured || q == queue_name;
    if (!configured) throw util::NotFound("queue not found: " + queue_name);
  }
  return Derive(queue_name, a, running.empty() ? nullptr : &running.front());
}

std::map<std::string, QueueState> StateRepository::GetAllStatuses() const {
  auto repo = repository_;

  auto aggregate_future = util::RunDetached([repo] {
    return ReadOnly(*repo, [&](db::Transaction& tx) { return repo->AggregateQueues(tx, std::nullopt); });
  });
  auto running_future = util::RunDetached([repo] {
    return ReadOnly(*repo, [&](db::Transaction& tx) { return repo->ListRunningTasks(tx, std::nullopt); });
  });

  std::optional<std::vector<db::model::QueueAggregateRecord>> aggregates;
  std::optional<std::vector<db::model::TaskRecord>>           running;
  std::string                                                 aggregate_error;
  std::string                                                 running_error;

  try {
    aggregates = aggregate_future.get();
  } catch (const std::exception& e) {
    aggregate_error = std::string("aggregate query failed: ") + e.what();
    TASKORCH_LOG_WARN("queue aggregate query failed", {observability::StringField("error", e.what())});
  }
  try {
    running = running_future.get();
  } catch (const std::exception& e) {
    running_error = std::string("running-task query failed: ") + e.what();
    TASKORCH_LOG_WARN("running task query failed", {observability::StringField("error", e.what())});
  }

  std::unordered_map<std::string, const db::model::QueueAggregateRecord*> by_queue;
  std::unordered_map<std::string, const db::model::TaskRecord*>           running_by_queue;
  if (aggregates) {
    for (const auto& a : *aggregates) by_queue.emplace(a.queue_name, &a);
  }
  if (running) {
    for (const auto& r : *running) running_by_queue.emplace(r.queue_name, &r);
  }

  std::vector<std::string> names = options_.queue_names;
  for (const auto& [name, _] : by_queue) {
    bool known = false;
    for (const auto& q : names) known = known || q == name;
    if (!known) names.push_back(name);
  }

  std::map<std::string, QueueState> out;
  for (const auto& name : names) {
    if (!aggregates) {
      QueueState placeholder;
      placeholder.set_name(name);
      placeholder.set_status(taskorch::v1::QUEUE_STATUS_DEGRADED);
      placeholder.set_success_rate(0.0);
      placeholder.set_error(aggregate_error);
      if (running) {
        auto it = running_by_queue.find(name);
        if (it != running_by_queue.end()) placeholder.set_current_task_id(it->second->task_id);
      }
      out.emplace(name, std::move(placeholder));
      continue;
    }

    auto a  = by_queue.find(name);
    auto rt = running_by_queue.find(name);
    auto s  = Derive(name, a == by_queue.end() ? nullptr : a->second, rt == running_by_queue.end() ? nullptr : rt->second);
    if (!running) s.set_error(running_error);
    out.emplace(name, std::move(s));
  }
  return out;
}

std::vector<taskorch::v1::TaskView> StateRepository::GetPendingTasks(const std::string& queue_name, std::size_t limit) const {
  return ToViews(ReadOnly(*repository_, [&](db::Transaction& tx) { return repository_->ListPendingTasks(tx, queue_name, limit); }));
}

std::vector<taskorch::v1::TaskView> StateRepository::GetRunningTasks() const {
  return ToViews(ReadOnly(*repository_, [&](db::Transaction& tx) { return repository_->ListRunningTasks(tx, std::nullopt); }));
}

std::vector<taskorch::v1::TaskView> StateRepository::GetTaskHistory(const std::string& queue_name, std::chrono::milliseconds window,
                                                                    std::size_t limit) const {
  const uint64_t now   = util::NowMicros();
  const uint64_t span  = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(window).count());
  const uint64_t since = span >= now ? 0 : now - span;
  return ToViews(
      ReadOnly(*repository_, [&](db::Transaction& tx) { return repository_->ListFinishedTasks(tx, queue_name, since, limit); }));
}

taskorch::v1::TaskView StateRepository::GetTask(const std::string& task_id) const {
  auto row = ReadOnly(*repository_, [&](db::Transaction& tx) { return repository_->GetTask(tx, task_id); });
  if (!row) throw util::NotFound("task not found: " + task_id);
  return model::ToView(*row);
}

uint64_t StateRepository::PruneFinishedTasks(std::chrono::milliseconds older_than) const {
  const uint64_t now    = util::NowMicros();
  const uint64_t span   = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(older_than).count());
  const uint64_t before = span >= now ? 0 : now - span;

  uint64_t deleted = 0;
  auto     tx      = repository_->Begin();
  auto     result  = repository_->DeleteFinishedTasksBefore(*tx, before, deleted);
  if (!result) {
    throw util::StoreError("prune finished tasks: " + result.message);
  }
  tx->Commit();

  if (deleted > 0) {
    TASKORCH_LOG_INFO("pruned finished tasks", {observability::IntField("deleted", static_cast<int64_t>(deleted))});
  }
  return deleted;
}

bool StateRepository::IsHealthy() const {
  return repository_->IsHealthy();
}

} // namespace taskorch::state
