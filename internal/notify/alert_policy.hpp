#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/model/appointment.hpp"
#include "internal/model/debug_artifact.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/util/time.hpp"

namespace slotwatch::runtime::config {
class DebugConfig;
}

namespace slotwatch::notify {

struct AlertSettings {
  bool                 debug_enabled = false;
  bool                 debug_emails  = false;
  std::chrono::seconds interval{300};

  static AlertSettings FromConfig(const slotwatch::runtime::config::DebugConfig& config);
};

// At most one pass per interval, measured from the last pass.
class NotificationThrottle {
 public:
  NotificationThrottle(std::chrono::seconds interval, util::ClockFn clock);

  bool TryPass();

  // Seconds since the last pass; nothing if there was none.
  std::optional<std::int64_t> SecondsSinceLast() const;

 private:
  std::chrono::seconds           interval_;
  util::ClockFn                  clock_;
  mutable std::mutex             mutex_;
  std::optional<util::TimePoint> last_pass_;
};

/*
  Decides which messages go out and composes them.

    slot found  -> always sent, never throttled
    startup     -> only when debug mode is off
    error       -> only when debug mode is off, throttled
    debug       -> only when debug mode and debug emails are on, throttled
    fatal       -> only when debug mode is off

  Error and debug messages share one throttle. Error bodies carry a short
  context phrase, never exception text.
*/
class AlertPolicy {
 public:
  AlertPolicy(std::shared_ptr<Notifier> notifier, AlertSettings settings, util::ClockFn clock = util::Now);

  bool NotifySlot(const model::UserAppointmentSpec& spec, const model::SlotResult& slot);
  bool NotifyStartup(const model::UserAppointmentSpec& spec);
  bool NotifyError(const model::UserAppointmentSpec& spec, const std::string& context);
  bool NotifyDebug(const model::DebugArtifact& artifact);
  bool NotifyFatal(const model::UserAppointmentSpec& spec, const std::string& context);

  const AlertSettings& settings() const {
    return settings_;
  }

 private:
  bool Send(const char* kind, const std::string& subject, const std::string& body);
  bool Throttled(const char* kind);

  std::shared_ptr<Notifier> notifier_;
  AlertSettings             settings_;
  NotificationThrottle      throttle_;
};

} // namespace slotwatch::notify
