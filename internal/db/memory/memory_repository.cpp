#include "memory_repository.hpp"

#include <algorithm>
#include <map>

#include "memory_tx.hpp"

namespace taskorch::db::memory {

namespace {

bool IsTerminal(taskorch::v1::TaskStatus s) {
  return s == taskorch::v1::TASK_STATUS_COMPLETED || s == taskorch::v1::TASK_STATUS_FAILED ||
         s == taskorch::v1::TASK_STATUS_CANCELLED;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.tasks.contains(r.task_id)) return Result::Err(ErrorCode::AlreadyExists, "task " + r.task_id + " exists");
  s.tasks[r.task_id] = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& task_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(task_id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateTaskIf(Transaction& t, const model::TaskRecord& r, taskorch::v1::TaskStatus expected) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tasks.find(r.task_id);
  if (it == s.tasks.end()) return Result::Err(ErrorCode::NotFound, "task " + r.task_id + " not found");
  if (it->second.status != expected) {
    return Result::Err(ErrorCode::Conflict, "task " + r.task_id + " is no longer " + taskorch::v1::TaskStatus_Name(expected));
  }

  // identity columns are immutable
  auto& row        = it->second;
  row.status       = r.status;
  row.priority     = r.priority;
  row.payload      = r.payload;
  row.retry_count  = r.retry_count;
  row.max_retries  = r.max_retries;
  row.started_at   = r.started_at;
  row.completed_at = r.completed_at;
  row.error        = r.error;
  return Result::Ok();
}

std::vector<model::TaskRecord> MemoryRepository::ListPendingTasks(Transaction& t, const std::string& queue_name, std::size_t limit) {
  const auto&                    s = TX(t).View();
  std::vector<model::TaskRecord> out;
  for (const auto& [_, r] : s.tasks) {
    if (r.queue_name == queue_name && r.status == taskorch::v1::TASK_STATUS_PENDING) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    return a.created_at < b.created_at;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::TaskRecord> MemoryRepository::ListRunningTasks(Transaction& t, const std::optional<std::string>& queue_name) {
  const auto&                    s = TX(t).View();
  std::vector<model::TaskRecord> out;
  for (const auto& [_, r] : s.tasks) {
    if (r.status != taskorch::v1::TASK_STATUS_RUNNING) continue;
    if (queue_name && r.queue_name != *queue_name) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.queue_name != b.queue_name) return a.queue_name < b.queue_name;
    return a.started_at < b.started_at;
  });
  return out;
}

std::vector<model::TaskRecord> MemoryRepository::ListFinishedTasks(Transaction& t, const std::string& queue_name, uint64_t completed_since,
                                                                   std::size_t limit) {
  const auto&                    s = TX(t).View();
  std::vector<model::TaskRecord> out;
  for (const auto& [_, r] : s.tasks) {
    if (r.queue_name == queue_name && IsTerminal(r.status) && r.completed_at >= completed_since) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.completed_at > b.completed_at; });
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::QueueAggregateRecord> MemoryRepository::AggregateQueues(Transaction&                      t,
                                                                           const std::optional<std::string>& queue_name) {
  const auto& s = TX(t).View();

  struct Acc {
    model::QueueAggregateRecord rec;
    double                      duration_sum = 0.0;
    uint64_t                    duration_n   = 0;
  };
  std::map<std::string, Acc> by_queue;

  for (const auto& [_, r] : s.tasks) {
    if (queue_name && r.queue_name != *queue_name) continue;
    auto& acc          = by_queue[r.queue_name];
    acc.rec.queue_name = r.queue_name;
    switch (r.status) {
      case taskorch::v1::TASK_STATUS_PENDING: ++acc.rec.pending; break;
      case taskorch::v1::TASK_STATUS_RUNNING: ++acc.rec.running; break;
      case taskorch::v1::TASK_STATUS_COMPLETED:
        ++acc.rec.completed;
        if (r.started_at != 0 && r.completed_at != 0) {
          acc.duration_sum += static_cast<double>(r.completed_at - r.started_at) / 1000.0;
          ++acc.duration_n;
        }
        break;
      case taskorch::v1::TASK_STATUS_FAILED: ++acc.rec.failed; break;
      case taskorch::v1::TASK_STATUS_CANCELLED: ++acc.rec.cancelled; break;
      default: break;
    }
    acc.rec.last_activity = std::max({acc.rec.last_activity, r.created_at, r.started_at, r.completed_at});
  }

  std::vector<model::QueueAggregateRecord> out;
  out.reserve(by_queue.size());
  for (auto& [_, acc] : by_queue) {
    if (acc.duration_n > 0) acc.rec.avg_duration_ms = acc.duration_sum / static_cast<double>(acc.duration_n);
    out.push_back(std::move(acc.rec));
  }
  return out;
}

Result MemoryRepository::DeleteFinishedTasksBefore(Transaction& t, uint64_t completed_before, uint64_t& deleted) {
  auto& s = TX(t).Mutable();
  deleted = std::erase_if(s.tasks, [&](const auto& kv) {
    return IsTerminal(kv.second.status) && kv.second.completed_at < completed_before;
  });
  return Result::Ok();
}

} // namespace taskorch::db::memory
