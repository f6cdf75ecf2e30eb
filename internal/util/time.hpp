#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace taskorch::util {

/*
  Time utilities, single place to control clock source.

  Persisted timestamps are unix microseconds; 0 means "unset".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

TimePoint       Now();
SteadyTimePoint SteadyNow();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

google::protobuf::Timestamp MicrosToProto(uint64_t unix_micros);

uint64_t ToUnixMillis(TimePoint tp);
uint64_t ToUnixMicros(TimePoint tp);
uint64_t NowMicros();

// Strictly increasing across calls in this process. Used for created_at so
// that acceptance order survives identical wall-clock readings.
uint64_t UniqueNowMicros();

} // namespace taskorch::util
