#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace healthd::util {

/*
  Time utilities. Unix conversions keep second precision over the full int64 range.
*/

using Clock       = std::chrono::system_clock;
using TimePoint   = Clock::time_point;
using UnixSeconds = std::chrono::sys_seconds;

TimePoint Now();

int64_t ToUnixSeconds(TimePoint tp);
int64_t ToUnixMillis(TimePoint tp);

// Full int64 range; does not go through nanosecond ticks.
UnixSeconds FromUnixSeconds(int64_t seconds);

// Largest whole-second magnitude a Duration may carry and still fit in nanoseconds.
inline constexpr int64_t kMaxProtoDurationSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::nanoseconds::max()).count();

google::protobuf::Duration ToProto(std::chrono::nanoseconds d);

// Saturates at nanoseconds::max()/min() beyond +/- kMaxProtoDurationSeconds.
std::chrono::nanoseconds FromProto(const google::protobuf::Duration& d);

} // namespace healthd::util
