#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace slotwatch::util {

TimePoint Now() {
  return Clock::now();
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

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatCompact(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&t, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%Y%m%d_%H%M%S");
  return out.str();
}

} // namespace slotwatch::util
