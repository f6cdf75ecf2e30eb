#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace taskorch::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  // Creates queue_tasks and its indexes when missing.
  void BootstrapSchema(const std::string& conninfo);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
