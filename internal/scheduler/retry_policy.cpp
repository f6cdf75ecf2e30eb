#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace taskorch::scheduler {

std::chrono::milliseconds RetryPolicy::Delay(uint32_t retry_count) const {
  if (initial.count() <= 0) return std::chrono::milliseconds{0};

  const double factor = std::pow(std::max(multiplier, 1.0), static_cast<double>(retry_count));
  const double raw    = static_cast<double>(initial.count()) * factor;
  const double cap    = max.count() > 0 ? static_cast<double>(max.count()) : 3600000.0;
  const double capped = std::min(raw, cap);
  return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

} // namespace taskorch::scheduler
