#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace taskorch::db::memory {

class MemoryTransaction;

/*
  In-process backend for tests and `database: { memory: {} }`.

  Rows live in one map; a transaction copies it on Begin() and swaps it
  back on Commit(). The repository lock is held for the transaction's
  lifetime, so transactions are serialized exactly like the SQLite
  backend and never conflict at commit.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  bool IsHealthy() override { return true; }

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::TaskRecord> tasks;
  };

  std::mutex mutex_;
  State committed_;
};

}
