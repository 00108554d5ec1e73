#include "time.hpp"

namespace healthd::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

UnixSeconds FromUnixSeconds(int64_t seconds) {
  return UnixSeconds{std::chrono::seconds{seconds}};
}

google::protobuf::Duration ToProto(std::chrono::nanoseconds d) {
  auto sec   = std::chrono::duration_cast<std::chrono::seconds>(d);
  auto nanos = d - sec;

  google::protobuf::Duration out;
  out.set_seconds(sec.count());
  out.set_nanos(static_cast<int32_t>(nanos.count()));
  return out;
}

std::chrono::nanoseconds FromProto(const google::protobuf::Duration& d) {
  if (d.seconds() >= kMaxProtoDurationSeconds) return std::chrono::nanoseconds::max();
  if (d.seconds() <= -kMaxProtoDurationSeconds) return std::chrono::nanoseconds::min();
  return std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos());
}

} // namespace healthd::util
