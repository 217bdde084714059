#pragma once

#include <cstdint>
#include <string_view>

namespace slotwatch::model {

enum class WorkerStatus : std::uint8_t {
  kInitializing = 0,
  kStarting     = 1,
  kLoggedIn     = 2,
  kLoginFailed  = 3,
  kChecking     = 4,
  kAvailable    = 5,
  kUnavailable  = 6,
  kBusy         = 7,
  kError        = 8,
  kStopped      = 9,
};

constexpr std::string_view ToString(WorkerStatus status) {
  switch (status) {
    case WorkerStatus::kStarting:
      return "starting";
    case WorkerStatus::kLoggedIn:
      return "logged_in";
    case WorkerStatus::kLoginFailed:
      return "login_failed";
    case WorkerStatus::kChecking:
      return "checking";
    case WorkerStatus::kAvailable:
      return "available";
    case WorkerStatus::kUnavailable:
      return "unavailable";
    case WorkerStatus::kBusy:
      return "busy";
    case WorkerStatus::kError:
      return "error";
    case WorkerStatus::kStopped:
      return "stopped";
    case WorkerStatus::kInitializing:
    default:
      return "initializing";
  }
}

} // namespace slotwatch::model
