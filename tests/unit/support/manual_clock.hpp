#pragma once

#include <chrono>
#include <memory>

#include "internal/util/time.hpp"

namespace slotwatch::testing {

// Clock that only moves when told to. Copies share the same time.
class ManualClock {
 public:
  ManualClock() : now_(std::make_shared<util::TimePoint>(util::TimePoint(std::chrono::hours(24 * 365 * 56)))) {
  }

  util::ClockFn Fn() const {
    auto now = now_;
    return [now] { return *now; };
  }

  util::TimePoint Now() const {
    return *now_;
  }

  void Advance(std::chrono::seconds delta) {
    *now_ += delta;
  }

 private:
  std::shared_ptr<util::TimePoint> now_;
};

} // namespace slotwatch::testing
