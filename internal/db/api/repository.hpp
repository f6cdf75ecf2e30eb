#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/queue_aggregate_record.hpp"
#include "internal/db/model/task_record.hpp"

namespace taskorch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access requires a Transaction
  - Reads inside a transaction see its writes
  - Every task mutation is a single row write; status changes are
    compare-and-set on the expected current status
  - Reads that fail at the backend throw util::StoreError; writes
    report through Result

  The DB is the source of truth for task state. Queue state is always
  derived from these rows, never cached.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual bool IsHealthy() = 0;

  // ---------------------------------------------------------------------
  // Task lifecycle
  // ---------------------------------------------------------------------

  virtual Result InsertTask(Transaction&, const model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& task_id) = 0;

  // Writes every mutable column of `task` when the stored status equals
  // `expected`. Conflict when it does not, NotFound when the row is gone.
  virtual Result UpdateTaskIf(Transaction&, const model::TaskRecord& task, taskorch::v1::TaskStatus expected) = 0;

  // ---------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------

  // PENDING rows of one queue in execution order (priority ASC, created_at ASC).
  virtual std::vector<model::TaskRecord> ListPendingTasks(Transaction&, const std::string& queue_name, std::size_t limit) = 0;

  // RUNNING rows, all queues when queue_name is empty.
  virtual std::vector<model::TaskRecord> ListRunningTasks(Transaction&, const std::optional<std::string>& queue_name) = 0;

  // Terminal rows completed at or after `completed_since`, newest first.
  virtual std::vector<model::TaskRecord> ListFinishedTasks(Transaction&, const std::string& queue_name, uint64_t completed_since,
                                                           std::size_t limit) = 0;

  // One GROUP BY over all queues (or just queue_name).
  virtual std::vector<model::QueueAggregateRecord> AggregateQueues(Transaction&, const std::optional<std::string>& queue_name) = 0;

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  virtual Result DeleteFinishedTasksBefore(Transaction&, uint64_t completed_before, uint64_t& deleted) = 0;
};

} // namespace taskorch::db
