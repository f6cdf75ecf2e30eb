#pragma once

#include <cstdint>
#include <string>

namespace taskorch::db::model {

// One row of the per-queue GROUP BY aggregate.
struct QueueAggregateRecord {
  std::string queue_name;

  uint64_t pending   = 0;
  uint64_t running   = 0;
  uint64_t completed = 0;
  uint64_t failed    = 0;
  uint64_t cancelled = 0;

  // mean completed_at - started_at over COMPLETED rows
  double avg_duration_ms = 0.0;

  // newest of created_at / started_at / completed_at, unix micros
  uint64_t last_activity = 0;
};

}
