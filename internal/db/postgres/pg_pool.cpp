#include "pg_pool.hpp"

namespace taskorch::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_task",
               "INSERT INTO queue_tasks(task_id,queue_name,task_type,status,priority,payload,retry_count,max_retries,"
               "created_at,started_at,completed_at,error) "
               "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7,$8,$9,$10,$11,$12)");

  conn.prepare("get_task",
               "SELECT task_id,queue_name,task_type,status,priority,payload::text,retry_count,max_retries,"
               "created_at,started_at,completed_at,error FROM queue_tasks WHERE task_id=$1");

  conn.prepare("update_task_if_status",
               "UPDATE queue_tasks SET status=$1,priority=$2,payload=$3::jsonb,retry_count=$4,max_retries=$5,"
               "started_at=$6,completed_at=$7,error=$8 WHERE task_id=$9 AND status=$10");

  conn.prepare("pending_tasks",
               "SELECT task_id,queue_name,task_type,status,priority,payload::text,retry_count,max_retries,"
               "created_at,started_at,completed_at,error FROM queue_tasks WHERE queue_name=$1 AND status=1 "
               "ORDER BY priority ASC, created_at ASC LIMIT $2");

  conn.prepare("running_tasks",
               "SELECT task_id,queue_name,task_type,status,priority,payload::text,retry_count,max_retries,"
               "created_at,started_at,completed_at,error FROM queue_tasks WHERE status=2 ORDER BY queue_name ASC, started_at ASC");

  conn.prepare("running_tasks_for_queue",
               "SELECT task_id,queue_name,task_type,status,priority,payload::text,retry_count,max_retries,"
               "created_at,started_at,completed_at,error FROM queue_tasks WHERE status=2 AND queue_name=$1 ORDER BY started_at ASC");

  conn.prepare("finished_tasks",
               "SELECT task_id,queue_name,task_type,status,priority,payload::text,retry_count,max_retries,"
               "created_at,started_at,completed_at,error FROM queue_tasks WHERE queue_name=$1 AND status IN (3,4,5) "
               "AND completed_at>=$2 ORDER BY completed_at DESC LIMIT $3");

  conn.prepare("aggregate_queues",
               "SELECT queue_name,"
               " COUNT(*) FILTER (WHERE status=1), COUNT(*) FILTER (WHERE status=2),"
               " COUNT(*) FILTER (WHERE status=3), COUNT(*) FILTER (WHERE status=4),"
               " COUNT(*) FILTER (WHERE status=5),"
               " COALESCE(AVG((completed_at-started_at)/1000.0) FILTER (WHERE status=3 AND started_at IS NOT NULL"
               "   AND completed_at IS NOT NULL),0),"
               " MAX(GREATEST(created_at,COALESCE(started_at,0),COALESCE(completed_at,0)))"
               " FROM queue_tasks WHERE ($1::text IS NULL OR queue_name=$1) GROUP BY queue_name ORDER BY queue_name");

  conn.prepare("delete_finished_before", "DELETE FROM queue_tasks WHERE status IN (3,4,5) AND completed_at<$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace taskorch::db::postgres
