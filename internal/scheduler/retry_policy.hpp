#pragma once

#include <chrono>
#include <cstdint>

namespace taskorch::scheduler {

/*
  Exponential backoff between attempts of the same task:

    delay(n) = min(initial * multiplier^n, max)

  where n is the retry_count the task had when it failed.
*/
struct RetryPolicy {
  std::chrono::milliseconds initial{1000};
  std::chrono::milliseconds max{60000};
  double                    multiplier = 2.0;

  bool ShouldRetry(uint32_t retry_count, uint32_t max_retries) const {
    return retry_count < max_retries;
  }

  std::chrono::milliseconds Delay(uint32_t retry_count) const;
};

} // namespace taskorch::scheduler
