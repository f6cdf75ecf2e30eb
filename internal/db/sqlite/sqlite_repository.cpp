#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/schema.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace taskorch::db::sqlite {

using taskorch::db::ErrorCode;
using taskorch::db::Result;

static_assert(taskorch::v1::TASK_STATUS_PENDING == 1 && taskorch::v1::TASK_STATUS_RUNNING == 2 &&
                  taskorch::v1::TASK_STATUS_COMPLETED == 3 && taskorch::v1::TASK_STATUS_FAILED == 4 &&
                  taskorch::v1::TASK_STATUS_CANCELLED == 5,
              "sql_queries.hpp hardcodes TaskStatus values");

namespace {

/*
  Finalizes on scope exit so early returns and throws never leak a statement.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      std::string msg = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw util::StoreError("sqlite prepare: " + msg);
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  // SQLITE_ROW / SQLITE_DONE; anything else throws StoreError
  int StepOrThrow() {
    int rc = sqlite3_step(st_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      throw util::StoreError(std::string("sqlite step: ") + sqlite3_errmsg(db_));
    }
    return rc;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// 0 is stored as NULL
void BindTimestamp(sqlite3_stmt* st, int idx, uint64_t v) {
  if (v == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindU64(st, idx, v);
  }
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::TaskRecord ReadTask(sqlite3_stmt* st) {
  model::TaskRecord r;
  r.task_id      = ColText(st, 0);
  r.queue_name   = ColText(st, 1);
  r.task_type    = ColText(st, 2);
  r.status       = static_cast<taskorch::v1::TaskStatus>(ColI32(st, 3));
  r.priority     = ColI32(st, 4);
  r.payload      = ColText(st, 5);
  r.retry_count  = static_cast<uint32_t>(ColI32(st, 6));
  r.max_retries  = static_cast<uint32_t>(ColI32(st, 7));
  r.created_at   = ColU64(st, 8);
  r.started_at   = ColU64(st, 9);
  r.completed_at = ColU64(st, 10);
  r.error        = ColText(st, 11);
  return r;
}

std::vector<model::TaskRecord> ReadTasks(Statement& st) {
  std::vector<model::TaskRecord> out;
  while (st.StepOrThrow() == SQLITE_ROW) {
    out.push_back(ReadTask(st.get()));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema() {
  std::lock_guard lock(db_->TransactionLock());
  for (const char* ddl : sql::SQLITE_SCHEMA_DDL) {
    db_->Exec(ddl);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

bool SqliteRepository::IsHealthy() {
  std::lock_guard lock(db_->TransactionLock());
  sqlite3_stmt*   st = nullptr;
  if (sqlite3_prepare_v2(db_->Handle(), sql::PING, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return false;
  }
  const int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  return rc == SQLITE_ROW;
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Task lifecycle
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_TASK, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  BindText(st, 1, r.task_id);
  BindText(st, 2, r.queue_name);
  BindText(st, 3, r.task_type);
  BindI32(st, 4, static_cast<int>(r.status));
  BindI32(st, 5, r.priority);
  BindText(st, 6, r.payload);
  BindI32(st, 7, static_cast<int>(r.retry_count));
  BindI32(st, 8, static_cast<int>(r.max_retries));
  BindU64(st, 9, r.created_at);
  BindTimestamp(st, 10, r.started_at);
  BindTimestamp(st, 11, r.completed_at);
  BindText(st, 12, r.error);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, const std::string& task_id) {
  Statement st(TX(t).Handle(), sql::SELECT_TASK);
  BindText(st.get(), 1, task_id);

  if (st.StepOrThrow() != SQLITE_ROW) {
    return std::nullopt;
  }
  return ReadTask(st.get());
}

Result SqliteRepository::UpdateTaskIf(Transaction& t, const model::TaskRecord& r, taskorch::v1::TaskStatus expected) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPDATE_TASK_IF_STATUS, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  BindI32(st, 1, static_cast<int>(r.status));
  BindI32(st, 2, r.priority);
  BindText(st, 3, r.payload);
  BindI32(st, 4, static_cast<int>(r.retry_count));
  BindI32(st, 5, static_cast<int>(r.max_retries));
  BindTimestamp(st, 6, r.started_at);
  BindTimestamp(st, 7, r.completed_at);
  BindText(st, 8, r.error);
  BindText(st, 9, r.task_id);
  BindI32(st, 10, static_cast<int>(expected));

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (!result) return result;

  if (sqlite3_changes(db) == 0) {
    if (GetTask(t, r.task_id).has_value()) {
      return Result::Err(ErrorCode::Conflict, "task " + r.task_id + " is no longer " + taskorch::v1::TaskStatus_Name(expected));
    }
    return Result::Err(ErrorCode::NotFound, "task " + r.task_id + " not found");
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::vector<model::TaskRecord> SqliteRepository::ListPendingTasks(Transaction& t, const std::string& queue_name, std::size_t limit) {
  Statement st(TX(t).Handle(), sql::SELECT_PENDING_TASKS);
  BindText(st.get(), 1, queue_name);
  BindU64(st.get(), 2, limit);
  return ReadTasks(st);
}

std::vector<model::TaskRecord> SqliteRepository::ListRunningTasks(Transaction& t, const std::optional<std::string>& queue_name) {
  if (queue_name) {
    Statement st(TX(t).Handle(), sql::SELECT_RUNNING_TASKS_FOR_QUEUE);
    BindText(st.get(), 1, *queue_name);
    return ReadTasks(st);
  }
  Statement st(TX(t).Handle(), sql::SELECT_RUNNING_TASKS);
  return ReadTasks(st);
}

std::vector<model::TaskRecord> SqliteRepository::ListFinishedTasks(Transaction& t, const std::string& queue_name, uint64_t completed_since,
                                                                   std::size_t limit) {
  Statement st(TX(t).Handle(), sql::SELECT_FINISHED_TASKS);
  BindText(st.get(), 1, queue_name);
  BindU64(st.get(), 2, completed_since);
  BindU64(st.get(), 3, limit);
  return ReadTasks(st);
}

std::vector<model::QueueAggregateRecord> SqliteRepository::AggregateQueues(Transaction& t, const std::optional<std::string>& queue_name) {
  Statement st(TX(t).Handle(), queue_name ? sql::AGGREGATE_QUEUE : sql::AGGREGATE_QUEUES);
  if (queue_name) {
    BindText(st.get(), 1, *queue_name);
  }

  std::vector<model::QueueAggregateRecord> out;
  while (st.StepOrThrow() == SQLITE_ROW) {
    model::QueueAggregateRecord r;
    r.queue_name      = ColText(st.get(), 0);
    r.pending         = ColU64(st.get(), 1);
    r.running         = ColU64(st.get(), 2);
    r.completed       = ColU64(st.get(), 3);
    r.failed          = ColU64(st.get(), 4);
    r.cancelled       = ColU64(st.get(), 5);
    r.avg_duration_ms = sqlite3_column_double(st.get(), 6);
    r.last_activity   = ColU64(st.get(), 7);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

Result SqliteRepository::DeleteFinishedTasksBefore(Transaction& t, uint64_t completed_before, uint64_t& deleted) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::DELETE_FINISHED_BEFORE, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  BindU64(st, 1, completed_before);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  deleted     = result ? static_cast<uint64_t>(sqlite3_changes(db)) : 0;
  return result;
}

} // namespace taskorch::db::sqlite
