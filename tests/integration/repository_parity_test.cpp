#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"

#if TASKORCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if TASKORCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using taskorch::db::ErrorCode;
using taskorch::db::Repository;
using taskorch::db::memory::MemoryRepository;
using taskorch::db::model::TaskRecord;

constexpr uint64_t kSecond = 1'000'000;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

TaskRecord Task(const std::string& id, const std::string& queue, taskorch::v1::TaskStatus status, int32_t priority, uint64_t created_at) {
  TaskRecord r;
  r.task_id     = id;
  r.queue_name  = queue;
  r.task_type   = "fetch";
  r.status      = status;
  r.priority    = priority;
  r.payload     = R"({"symbol":"ABC"})";
  r.max_retries = 3;
  r.created_at  = created_at;
  return r;
}

void VerifyInsertGetUpdate(Repository& repo, const std::string& queue) {
  const auto now = taskorch::util::NowMicros();
  const auto id  = queue + "-life";

  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, Task(id, queue, taskorch::v1::TASK_STATUS_PENDING, 0, now)));
    tx->Commit();
  }

  // duplicate ids are rejected; the failed tx is discarded
  {
    auto       tx  = repo.Begin();
    const auto dup = repo.InsertTask(*tx, Task(id, queue, taskorch::v1::TASK_STATUS_PENDING, 0, now));
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx  = repo.Begin();
  auto row = repo.GetTask(*tx, id);
  assert(row);
  assert(row->queue_name == queue);
  assert(row->status == taskorch::v1::TASK_STATUS_PENDING);
  assert(row->payload == R"({"symbol":"ABC"})");
  assert(row->created_at == now);
  assert(row->started_at == 0);
  assert(row->completed_at == 0);
  assert(!repo.GetTask(*tx, queue + "-missing"));

  row->status     = taskorch::v1::TASK_STATUS_RUNNING;
  row->started_at = now + kSecond;
  assert(repo.UpdateTaskIf(*tx, *row, taskorch::v1::TASK_STATUS_PENDING));

  // second claim of the same row loses
  const auto lost = repo.UpdateTaskIf(*tx, *row, taskorch::v1::TASK_STATUS_PENDING);
  assert(lost.code == ErrorCode::Conflict);

  auto ghost = *row;
  ghost.task_id = queue + "-ghost";
  assert(repo.UpdateTaskIf(*tx, ghost, taskorch::v1::TASK_STATUS_RUNNING).code == ErrorCode::NotFound);

  row->status       = taskorch::v1::TASK_STATUS_FAILED;
  row->retry_count  = 3;
  row->completed_at = now + 2 * kSecond;
  row->error        = "upstream 503";
  assert(repo.UpdateTaskIf(*tx, *row, taskorch::v1::TASK_STATUS_RUNNING));
  tx->Commit();

  auto check = repo.Begin();
  auto stored = repo.GetTask(*check, id);
  check->Commit();
  assert(stored->status == taskorch::v1::TASK_STATUS_FAILED);
  assert(stored->retry_count == 3);
  assert(stored->error == "upstream 503");
  assert(stored->started_at == now + kSecond);
}

void VerifyPendingOrder(Repository& repo, const std::string& queue) {
  const auto base = taskorch::util::NowMicros();

  auto tx = repo.Begin();
  assert(repo.InsertTask(*tx, Task(queue + "-c", queue, taskorch::v1::TASK_STATUS_PENDING, 5, base + 1)));
  assert(repo.InsertTask(*tx, Task(queue + "-a", queue, taskorch::v1::TASK_STATUS_PENDING, 1, base + 3)));
  assert(repo.InsertTask(*tx, Task(queue + "-b", queue, taskorch::v1::TASK_STATUS_PENDING, 5, base)));
  auto done         = Task(queue + "-done", queue, taskorch::v1::TASK_STATUS_COMPLETED, 0, base);
  done.completed_at = base + 5;
  assert(repo.InsertTask(*tx, done));
  assert(repo.InsertTask(*tx, Task(queue + "-other", queue + "-x", taskorch::v1::TASK_STATUS_PENDING, 0, base)));
  tx->Commit();

  auto read    = repo.Begin();
  auto pending = repo.ListPendingTasks(*read, queue, 10);
  assert(pending.size() == 3);
  assert(pending[0].task_id == queue + "-a");
  assert(pending[1].task_id == queue + "-b");
  assert(pending[2].task_id == queue + "-c");

  auto first = repo.ListPendingTasks(*read, queue, 1);
  assert(first.size() == 1 && first[0].task_id == queue + "-a");
  read->Commit();
}

void VerifyAggregatesAndRetention(Repository& repo, const std::string& queue) {
  const auto base = taskorch::util::NowMicros() - 100 * kSecond;

  auto tx = repo.Begin();

  auto done1         = Task(queue + "-done1", queue, taskorch::v1::TASK_STATUS_COMPLETED, 0, base);
  done1.started_at   = base + kSecond;
  done1.completed_at = base + kSecond + 2000;  // 2 ms
  auto done2         = Task(queue + "-done2", queue, taskorch::v1::TASK_STATUS_COMPLETED, 0, base);
  done2.started_at   = base + kSecond;
  done2.completed_at = base + kSecond + 6000;  // 6 ms
  auto failed         = Task(queue + "-failed", queue, taskorch::v1::TASK_STATUS_FAILED, 0, base);
  failed.completed_at = base + 50 * kSecond;
  auto running       = Task(queue + "-running", queue, taskorch::v1::TASK_STATUS_RUNNING, 0, base);
  running.started_at = base + 90 * kSecond;

  auto cancelled         = Task(queue + "-cancelled", queue, taskorch::v1::TASK_STATUS_CANCELLED, 0, base);
  cancelled.completed_at = base + 2 * kSecond;

  for (const auto& r : {done1, done2, failed, running, cancelled, Task(queue + "-pending", queue, taskorch::v1::TASK_STATUS_PENDING, 0, base)}) {
    assert(repo.InsertTask(*tx, r));
  }
  tx->Commit();

  auto read = repo.Begin();
  auto aggs = repo.AggregateQueues(*read, queue);
  assert(aggs.size() == 1);
  const auto& a = aggs[0];
  assert(a.queue_name == queue);
  assert(a.pending == 1 && a.running == 1 && a.completed == 2 && a.failed == 1 && a.cancelled == 1);
  assert(a.avg_duration_ms > 3.9 && a.avg_duration_ms < 4.1);
  assert(a.last_activity == base + 90 * kSecond);

  auto running_rows = repo.ListRunningTasks(*read, queue);
  assert(running_rows.size() == 1 && running_rows[0].task_id == queue + "-running");

  auto finished = repo.ListFinishedTasks(*read, queue, base + 10 * kSecond, 10);
  assert(finished.size() == 1 && finished[0].task_id == queue + "-failed");
  read->Commit();

  // finished rows completed before the cutoff go; the rest stay
  auto     prune   = repo.Begin();
  uint64_t deleted = 0;
  assert(repo.DeleteFinishedTasksBefore(*prune, base + 10 * kSecond, deleted));
  prune->Commit();
  assert(deleted >= 3);

  auto after = repo.Begin();
  assert(!repo.GetTask(*after, queue + "-done1"));
  assert(repo.GetTask(*after, queue + "-failed"));
  assert(repo.GetTask(*after, queue + "-running"));
  assert(repo.GetTask(*after, queue + "-pending"));
  after->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& queue) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, Task(queue + "-rolled", queue, taskorch::v1::TASK_STATUS_PENDING, 0, taskorch::util::NowMicros())));
    tx->Rollback();
  }
  {
    // dropped without Commit()
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, Task(queue + "-dropped", queue, taskorch::v1::TASK_STATUS_PENDING, 0, taskorch::util::NowMicros())));
  }

  auto check = repo.Begin();
  assert(!repo.GetTask(*check, queue + "-rolled"));
  assert(!repo.GetTask(*check, queue + "-dropped"));
  check->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& queue) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertTask(*tx, Task(queue + "-durable", queue, taskorch::v1::TASK_STATUS_PENDING, 7, taskorch::util::NowMicros())));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->Begin();
  auto row = repo->GetTask(*tx, queue + "-durable");
  tx->Commit();
  assert(row);
  assert(row->priority == 7);
  assert(repo->IsHealthy());
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if TASKORCH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("taskorch_integration_sqlite_" + std::to_string(taskorch::util::NowMicros()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto repo = std::make_shared<taskorch::db::sqlite::SqliteRepository>(std::make_shared<taskorch::db::sqlite::SqliteDB>(db_path));
    repo->BootstrapSchema();
    return repo;
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if TASKORCH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TASKORCH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TASKORCH_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto repo = std::make_shared<taskorch::db::postgres::PgRepository>(std::make_shared<taskorch::db::postgres::PgPool>(conninfo));
    repo->BootstrapSchema(conninfo);
    return repo;
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();
  assert(repo->IsHealthy());

  // unique per run so a shared postgres database does not collide
  const auto prefix = backend.name + "-" + std::to_string(taskorch::util::NowMicros());

  VerifyInsertGetUpdate(*repo, prefix + "-life");
  VerifyPendingOrder(*repo, prefix + "-order");
  VerifyAggregatesAndRetention(*repo, prefix + "-agg");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TASKORCH_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if TASKORCH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "taskorch_integration_repository_parity: pass\n";
  return 0;
}
