#pragma once

namespace taskorch::db::sql {

/*
  Canonical SQL for the SQLite backend (? placeholders).

  The Postgres backend keeps $n variants of the same statements next to
  its prepared-statement setup; column order is shared so row decoding is
  identical.
*/

static constexpr const char* INSERT_TASK =
    "INSERT INTO queue_tasks(task_id,queue_name,task_type,status,priority,payload,"
    "retry_count,max_retries,created_at,started_at,completed_at,error)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_TASK =
    "SELECT task_id,queue_name,task_type,status,priority,payload,retry_count,max_retries,"
    "created_at,started_at,completed_at,error FROM queue_tasks WHERE task_id=?;";

static constexpr const char* UPDATE_TASK_IF_STATUS =
    "UPDATE queue_tasks SET status=?,priority=?,payload=?,retry_count=?,max_retries=?,"
    "started_at=?,completed_at=?,error=?"
    " WHERE task_id=? AND status=?;";

static constexpr const char* SELECT_PENDING_TASKS =
    "SELECT task_id,queue_name,task_type,status,priority,payload,retry_count,max_retries,"
    "created_at,started_at,completed_at,error FROM queue_tasks"
    " WHERE queue_name=? AND status=1"
    " ORDER BY priority ASC, created_at ASC LIMIT ?;";

static constexpr const char* SELECT_RUNNING_TASKS =
    "SELECT task_id,queue_name,task_type,status,priority,payload,retry_count,max_retries,"
    "created_at,started_at,completed_at,error FROM queue_tasks"
    " WHERE status=2 ORDER BY queue_name ASC, started_at ASC;";

static constexpr const char* SELECT_RUNNING_TASKS_FOR_QUEUE =
    "SELECT task_id,queue_name,task_type,status,priority,payload,retry_count,max_retries,"
    "created_at,started_at,completed_at,error FROM queue_tasks"
    " WHERE status=2 AND queue_name=? ORDER BY started_at ASC;";

static constexpr const char* SELECT_FINISHED_TASKS =
    "SELECT task_id,queue_name,task_type,status,priority,payload,retry_count,max_retries,"
    "created_at,started_at,completed_at,error FROM queue_tasks"
    " WHERE queue_name=? AND status IN (3,4,5) AND completed_at>=?"
    " ORDER BY completed_at DESC LIMIT ?;";

static constexpr const char* AGGREGATE_QUEUES =
    "SELECT queue_name,"
    " SUM(CASE WHEN status=1 THEN 1 ELSE 0 END),"
    " SUM(CASE WHEN status=2 THEN 1 ELSE 0 END),"
    " SUM(CASE WHEN status=3 THEN 1 ELSE 0 END),"
    " SUM(CASE WHEN status=4 THEN 1 ELSE 0 END),"
    " SUM(CASE WHEN status=5 THEN 1 ELSE 0 END),"
    " AVG(CASE WHEN status=3 AND started_at IS NOT NULL AND completed_at IS NOT NULL"
    "     THEN (completed_at-started_at)/1000.0 END),"
    " MAX(MAX(created_at,COALESCE(started_at,0),COALESCE(completed_at,0)))"
    " FROM queue_tasks GROUP BY queue_name ORDER BY queue_name;";

static constexpr const char* AGGREGATE_QUEUE =
    "SELECT queue_name,"
    " SUM(CASE WHEN status=1 THEN 1 ELSE 0 END),"
    " SUM(CASE WHEN status=2 THEN 1 ELSE 0 END),"
    " SUM(CASE WHEN status=3 THEN 1 ELSE 0 END),"
    " SUM(CASE WHEN status=4 THEN 1 ELSE 0 END),"
    " SUM(CASE WHEN status=5 THEN 1 ELSE 0 END),"
    " AVG(CASE WHEN status=3 AND started_at IS NOT NULL AND completed_at IS NOT NULL"
    "     THEN (completed_at-started_at)/1000.0 END),"
    " MAX(MAX(created_at,COALESCE(started_at,0),COALESCE(completed_at,0)))"
    " FROM queue_tasks WHERE queue_name=? GROUP BY queue_name;";

static constexpr const char* DELETE_FINISHED_BEFORE =
    "DELETE FROM queue_tasks WHERE status IN (3,4,5) AND completed_at<?;";

static constexpr const char* PING = "SELECT 1;";

} // namespace taskorch::db::sql
