#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace dispatch::util {

/*
  Time utilities: the single place that controls the clock source.

  Components take a NowFn so tests can drive time by hand.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// 0 means "unset" for stored millisecond columns.
google::protobuf::Timestamp MillisToProto(uint64_t ms);

} // namespace dispatch::util
