#pragma once

namespace taskorch::db::sql {

/*
  Bootstrap DDL per backend.

  status holds taskorch.core.v1.TaskStatus values:
    1 PENDING, 2 RUNNING, 3 COMPLETED, 4 FAILED, 5 CANCELLED
*/

static constexpr const char* SQLITE_SCHEMA_DDL[] = {
    "CREATE TABLE IF NOT EXISTS queue_tasks ("
    " task_id TEXT PRIMARY KEY,"
    " queue_name TEXT NOT NULL,"
    " task_type TEXT NOT NULL,"
    " status INTEGER NOT NULL,"
    " priority INTEGER NOT NULL DEFAULT 0,"
    " payload TEXT NOT NULL DEFAULT '{}',"
    " retry_count INTEGER NOT NULL DEFAULT 0,"
    " max_retries INTEGER NOT NULL DEFAULT 0,"
    " created_at INTEGER NOT NULL,"
    " started_at INTEGER,"
    " completed_at INTEGER,"
    " error TEXT);",
    "CREATE INDEX IF NOT EXISTS idx_queue_tasks_pick ON queue_tasks(queue_name, status, priority, created_at);",
    "CREATE INDEX IF NOT EXISTS idx_queue_tasks_completed ON queue_tasks(status, completed_at);",
};

static constexpr const char* POSTGRES_SCHEMA[] = {
    "CREATE TABLE IF NOT EXISTS queue_tasks ("
    " task_id TEXT PRIMARY KEY,"
    " queue_name TEXT NOT NULL,"
    " task_type TEXT NOT NULL,"
    " status SMALLINT NOT NULL,"
    " priority INTEGER NOT NULL DEFAULT 0,"
    " payload JSONB NOT NULL DEFAULT '{}'::jsonb,"
    " retry_count INTEGER NOT NULL DEFAULT 0,"
    " max_retries INTEGER NOT NULL DEFAULT 0,"
    " created_at BIGINT NOT NULL,"
    " started_at BIGINT,"
    " completed_at BIGINT,"
    " error TEXT);",
    "CREATE INDEX IF NOT EXISTS idx_queue_tasks_pick ON queue_tasks(queue_name, status, priority, created_at);",
    "CREATE INDEX IF NOT EXISTS idx_queue_tasks_completed ON queue_tasks(status, completed_at);",
};

} // namespace taskorch::db::sql
