#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace taskorch::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates queue_tasks and its indexes when missing.
  void BootstrapSchema();

  std::unique_ptr<Transaction> Begin() override;
  bool IsHealthy() override;

  Result InsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string&) override;
  Result UpdateTaskIf(Transaction&, const model::TaskRecord&, taskorch::v1::TaskStatus expected) override;

  std::vector<model::TaskRecord> ListPendingTasks(Transaction&, const std::string& queue_name, std::size_t limit) override;
  std::vector<model::TaskRecord> ListRunningTasks(Transaction&, const std::optional<std::string>& queue_name) override;
  std::vector<model::TaskRecord> ListFinishedTasks(Transaction&, const std::string& queue_name, uint64_t completed_since,
                                                   std::size_t limit) override;
  std::vector<model::QueueAggregateRecord> AggregateQueues(Transaction&, const std::optional<std::string>& queue_name) override;

  Result DeleteFinishedTasksBefore(Transaction&, uint64_t completed_before, uint64_t& deleted) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
