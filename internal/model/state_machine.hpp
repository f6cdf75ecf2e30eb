#pragma once

#include "taskorch/v1.hpp"

namespace taskorch::model {

using taskorch::v1::TaskStatus;

constexpr bool IsTerminal(TaskStatus state) {
  return state == taskorch::v1::TASK_STATUS_COMPLETED || state == taskorch::v1::TASK_STATUS_FAILED ||
         state == taskorch::v1::TASK_STATUS_CANCELLED;
}

/*
  PENDING -> RUNNING -> COMPLETED | FAILED | CANCELLED
  PENDING -> CANCELLED
  RUNNING -> PENDING  (retry)
*/
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == taskorch::v1::TASK_STATUS_UNSPECIFIED || from == to) {
    return false;
  }
  if (from == taskorch::v1::TASK_STATUS_PENDING) {
    return to == taskorch::v1::TASK_STATUS_RUNNING || to == taskorch::v1::TASK_STATUS_CANCELLED;
  }
  if (from == taskorch::v1::TASK_STATUS_RUNNING) {
    return true;
  }
  return false;
}

}  // namespace taskorch::model
