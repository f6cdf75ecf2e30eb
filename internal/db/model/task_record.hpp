#pragma once

#include <cstdint>
#include <string>

#include "taskorch/v1.hpp"

namespace taskorch::db::model {

/*
  Persistent task row (queue_tasks).

  - status is the authoritative lifecycle state
  - payload is the JSON text of a google.protobuf.Struct
  - timestamps are unix microseconds, 0 = unset (NULL in SQL)
*/

struct TaskRecord {
  std::string task_id;
  std::string queue_name;
  std::string task_type;

  taskorch::v1::TaskStatus status = taskorch::v1::TASK_STATUS_UNSPECIFIED;

  // lower value runs first
  int32_t priority = 0;

  std::string payload = "{}";

  uint32_t retry_count = 0;
  uint32_t max_retries = 0;

  uint64_t created_at   = 0;
  uint64_t started_at   = 0;
  uint64_t completed_at = 0;

  std::string error;
};

}
