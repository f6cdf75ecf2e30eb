#include "pg_repository.hpp"

#include "internal/db/sql/schema.hpp"
#include <algorithm>
#include <cstdint>

#include "internal/util/errors.hpp"

namespace taskorch::db::postgres {

namespace {

std::optional<int64_t> NullableMicros(uint64_t v) {
  if (v == 0) return std::nullopt;
  return static_cast<int64_t>(v);
}

uint64_t ColMicros(const pqxx::field& f) {
  return f.is_null() ? 0 : f.as<uint64_t>();
}

model::TaskRecord ReadTask(const pqxx::row& row) {
  model::TaskRecord r;
  r.task_id      = row[0].c_str();
  r.queue_name   = row[1].c_str();
  r.task_type    = row[2].c_str();
  r.status       = static_cast<taskorch::v1::TaskStatus>(row[3].as<int>());
  r.priority     = row[4].as<int32_t>();
  r.payload      = row[5].c_str();
  r.retry_count  = row[6].as<uint32_t>();
  r.max_retries  = row[7].as<uint32_t>();
  r.created_at   = row[8].as<uint64_t>();
  r.started_at   = ColMicros(row[9]);
  r.completed_at = ColMicros(row[10]);
  r.error        = row[11].is_null() ? "" : row[11].c_str();
  return r;
}

std::vector<model::TaskRecord> ReadTasks(const pqxx::result& res) {
  std::vector<model::TaskRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadTask(row));
  }
  return out;
}

// Reads surface backend failures as StoreError like every other backend.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StoreError(std::string("postgres: ") + e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema(const std::string& conninfo) {
  try {
    pqxx::connection conn(conninfo);
    pqxx::work       tx(conn);
    for (const char* ddl : sql::POSTGRES_SCHEMA) {
      tx.exec(ddl);
    }
    tx.commit();
  } catch (const pqxx::failure& e) {
    throw util::StoreError(std::string("postgres schema bootstrap: ") + e.what());
  }
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

bool PgRepository::IsHealthy() {
  try {
    PgTransaction tx(pool_);
    tx.Work().exec("SELECT 1;");
    tx.Commit();
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_task", r.task_id, r.queue_name, r.task_type, static_cast<int>(r.status), r.priority,
                               r.payload, static_cast<int>(r.retry_count), static_cast<int>(r.max_retries),
                               static_cast<int64_t>(r.created_at), NullableMicros(r.started_at), NullableMicros(r.completed_at),
                               r.error);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskRecord> PgRepository::GetTask(Transaction& t, const std::string& task_id) {
  auto res = Read([&] { return TX(t).Work().exec_prepared("get_task", task_id); });
  if (res.empty()) return std::nullopt;
  return ReadTask(res[0]);
}

Result PgRepository::UpdateTaskIf(Transaction& t, const model::TaskRecord& r, taskorch::v1::TaskStatus expected) {
  try {
    auto res = TX(t).Work().exec_prepared("update_task_if_status", static_cast<int>(r.status), r.priority, r.payload,
                                          static_cast<int>(r.retry_count), static_cast<int>(r.max_retries),
                                          NullableMicros(r.started_at), NullableMicros(r.completed_at), r.error, r.task_id,
                                          static_cast<int>(expected));
    if (res.affected_rows() == 0) {
      if (TX(t).Work().exec_prepared("get_task", r.task_id).empty()) {
        return Result::Err(ErrorCode::NotFound, "task " + r.task_id + " not found");
      }
      return Result::Err(ErrorCode::Conflict, "task " + r.task_id + " is no longer " + taskorch::v1::TaskStatus_Name(expected));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TaskRecord> PgRepository::ListPendingTasks(Transaction& t, const std::string& queue_name, std::size_t limit) {
  return Read([&] {
    return ReadTasks(TX(t).Work().exec_prepared("pending_tasks", queue_name, static_cast<int64_t>(std::min<std::size_t>(limit, INT64_MAX))));
  });
}

std::vector<model::TaskRecord> PgRepository::ListRunningTasks(Transaction& t, const std::optional<std::string>& queue_name) {
  return Read([&] {
    if (queue_name) return ReadTasks(TX(t).Work().exec_prepared("running_tasks_for_queue", *queue_name));
    return ReadTasks(TX(t).Work().exec_prepared("running_tasks"));
  });
}

std::vector<model::TaskRecord> PgRepository::ListFinishedTasks(Transaction& t, const std::string& queue_name, uint64_t completed_since,
                                                               std::size_t limit) {
  return Read([&] {
    return ReadTasks(TX(t).Work().exec_prepared("finished_tasks", queue_name, static_cast<int64_t>(completed_since),
                                                static_cast<int64_t>(std::min<std::size_t>(limit, INT64_MAX))));
  });
}

std::vector<model::QueueAggregateRecord> PgRepository::AggregateQueues(Transaction& t, const std::optional<std::string>& queue_name) {
  auto res = Read([&] { return TX(t).Work().exec_prepared("aggregate_queues", queue_name); });

  std::vector<model::QueueAggregateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::QueueAggregateRecord r;
    r.queue_name      = row[0].c_str();
    r.pending         = row[1].as<uint64_t>();
    r.running         = row[2].as<uint64_t>();
    r.completed       = row[3].as<uint64_t>();
    r.failed          = row[4].as<uint64_t>();
    r.cancelled       = row[5].as<uint64_t>();
    r.avg_duration_ms = row[6].as<double>();
    r.last_activity   = ColMicros(row[7]);
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeleteFinishedTasksBefore(Transaction& t, uint64_t completed_before, uint64_t& deleted) {
  deleted = 0;
  try {
    auto res = TX(t).Work().exec_prepared("delete_finished_before", static_cast<int64_t>(completed_before));
    deleted  = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

}
