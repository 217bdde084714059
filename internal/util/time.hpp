#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace slotwatch::util {

/*
  Time utilities: single place to control clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable clock for throttles and tests.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// yyyyMMdd_HHmmss in local time, used in artifact file names.
std::string FormatCompact(TimePoint tp);

} // namespace slotwatch::util
