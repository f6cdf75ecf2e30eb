#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "retry_policy.hpp"

namespace taskorch::scheduler {

struct QueueOptions {
  std::string name;

  // Per-attempt executor deadline; also the age at which RUNNING counts as stalled.
  std::chrono::milliseconds timeout{300000};

  // Used when an enqueued task does not set its own.
  uint32_t max_retries = 3;

  // Idle wake-up interval when nothing signals new work.
  std::chrono::milliseconds poll_interval{1000};
};

struct SchedulerOptions {
  std::vector<QueueOptions> queues;

  RetryPolicy retry;

  // Pause after a StoreError before the loop tries again.
  std::chrono::milliseconds store_retry_backoff{1000};

  // How long Stop() lets the in-flight task run before cancelling it.
  std::chrono::milliseconds stop_grace{5000};
};

// A new task as submitted by callers.
struct TaskSpec {
  std::string              queue_name;
  std::string              task_type;
  google::protobuf::Struct payload;

  // lower runs first
  int32_t priority = 0;

  // negative: queue default
  int32_t max_retries = -1;
};

// Point-in-time view of one loop.
struct LoopState {
  std::string queue_name;
  bool        running = false;

  std::string current_task_id;
  std::string current_task_type;
  uint64_t    current_task_started_at = 0;  // unix micros

  uint64_t processed = 0;

  // waiting past stop_grace on an executor call that ignored its stop token
  bool blocked = false;
};

} // namespace taskorch::scheduler
