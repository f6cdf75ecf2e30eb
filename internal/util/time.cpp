#include "time.hpp"

#include <atomic>

namespace taskorch::util {

TimePoint Now() {
  return Clock::now();
}

SteadyTimePoint SteadyNow() {
  return SteadyClock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

google::protobuf::Timestamp MicrosToProto(uint64_t unix_micros) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(unix_micros / 1000000));
  ts.set_nanos(static_cast<int32_t>((unix_micros % 1000000) * 1000));
  return ts;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t ToUnixMicros(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMicros() {
  return ToUnixMicros(Now());
}

uint64_t UniqueNowMicros() {
  static std::atomic<uint64_t> last{0};

  uint64_t candidate = NowMicros();
  uint64_t previous  = last.load();
  for (;;) {
    const uint64_t next = candidate > previous ? candidate : previous + 1;
    if (last.compare_exchange_weak(previous, next)) {
      return next;
    }
  }
}

} // namespace taskorch::util
