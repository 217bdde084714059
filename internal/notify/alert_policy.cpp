#include "internal/notify/alert_policy.hpp"

#include <sstream>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/text.hpp"

namespace slotwatch::notify {

using observability::IntField;
using observability::StringField;

AlertSettings AlertSettings::FromConfig(const slotwatch::runtime::config::DebugConfig& config) {
  AlertSettings settings;
  settings.debug_enabled = config.enabled();
  settings.debug_emails  = config.send_email_notifications();
  if (config.email_interval_seconds() > 0) {
    settings.interval = std::chrono::seconds(config.email_interval_seconds());
  }
  return settings;
}

// ------------------------------------------------------------
// Throttle
// ------------------------------------------------------------

NotificationThrottle::NotificationThrottle(std::chrono::seconds interval, util::ClockFn clock) : interval_(interval), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = util::Now;
  }
}

bool NotificationThrottle::TryPass() {
  std::lock_guard lock(mutex_);
  const auto      now = clock_();
  if (last_pass_ && now - *last_pass_ < interval_) {
    return false;
  }
  last_pass_ = now;
  return true;
}

std::optional<std::int64_t> NotificationThrottle::SecondsSinceLast() const {
  std::lock_guard lock(mutex_);
  if (!last_pass_) {
    return std::nullopt;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(clock_() - *last_pass_).count();
}

// ------------------------------------------------------------
// Policy
// ------------------------------------------------------------

AlertPolicy::AlertPolicy(std::shared_ptr<Notifier> notifier, AlertSettings settings, util::ClockFn clock)
    : notifier_(std::move(notifier)), settings_(settings), throttle_(settings.interval, std::move(clock)) {
}

bool AlertPolicy::Send(const char* kind, const std::string& subject, const std::string& body) {
  bool sent = false;
  if (notifier_) {
    sent = notifier_->SendNotification(subject, body);
  }
  observability::Metrics::Instance().RecordNotification(kind, sent);
  return sent;
}

bool AlertPolicy::Throttled(const char* kind) {
  if (throttle_.TryPass()) {
    return false;
  }
  const auto elapsed = throttle_.SecondsSinceLast().value_or(0);
  SLOTWATCH_LOG_INFO("notification suppressed by interval",
                     {StringField("kind", kind), IntField("seconds_since_last", elapsed),
                      IntField("interval_seconds", settings_.interval.count())});
  observability::Metrics::Instance().RecordNotification(kind, false);
  return true;
}

bool AlertPolicy::NotifySlot(const model::UserAppointmentSpec&, const model::SlotResult& slot) {
  std::ostringstream body;
  body << "slotwatch found an available appointment:\n\n"
       << "Location: " << slot.city << "\n"
       << "Date: " << slot.date << "\n"
       << "Time: " << slot.time << "\n\n"
       << (slot.auto_booked ? "Status: AUTOMATICALLY BOOKED!\n" : "Status: Available (not booked)\n");

  return Send("slot", "Available Appointment Found!", body.str());
}

bool AlertPolicy::NotifyStartup(const model::UserAppointmentSpec& spec) {
  if (settings_.debug_enabled) {
    return false;
  }

  std::ostringstream body;
  body << "slotwatch has started searching for appointments with the following criteria:\n\n"
       << "User: " << spec.email << "\n"
       << "Location: " << spec.EffectiveLocation() << "\n"
       << "Date Range: " << spec.DateRangeDisplay() << "\n";
  if (!spec.ivr_number.empty()) {
    body << "IVR Number: " << spec.ivr_number << "\n";
  }
  body << "\nYou will be notified when available appointments are found.";

  return Send("startup", "slotwatch search started", body.str());
}

bool AlertPolicy::NotifyError(const model::UserAppointmentSpec& spec, const std::string& context) {
  if (settings_.debug_enabled || Throttled("error")) {
    return false;
  }

  std::ostringstream body;
  body << "slotwatch encountered an error while searching for appointments:\n\n"
       << "Error: " << context << "\n\n"
       << "Search Details:\n"
       << "User: " << spec.email << "\n"
       << "Location: " << spec.EffectiveLocation() << "\n"
       << "Date Range: " << spec.DateRangeDisplay() << "\n\n"
       << "The system will continue trying. You will be notified of any further updates.";

  return Send("error", "slotwatch error", body.str());
}

bool AlertPolicy::NotifyDebug(const model::DebugArtifact& artifact) {
  if (!settings_.debug_enabled || !settings_.debug_emails || Throttled("debug")) {
    return false;
  }

  std::ostringstream body;
  body << "slotwatch debug info (" << artifact.prefix << ")\n\n"
       << "Time: " << util::FormatCompact(artifact.captured_at) << "\n"
       << "Current URL: " << artifact.current_url << "\n";
  if (!artifact.screenshot_path.empty()) {
    body << "Screenshot: " << artifact.screenshot_path << "\n";
  }
  if (!artifact.page_source_path.empty()) {
    body << "HTML: " << artifact.page_source_path << "\n";
  }

  const bool is_error = util::ContainsIgnoreCase(artifact.prefix, "error");
  return Send("debug", is_error ? "slotwatch error information" : "slotwatch debug information", body.str());
}

bool AlertPolicy::NotifyFatal(const model::UserAppointmentSpec& spec, const std::string& context) {
  if (settings_.debug_enabled) {
    return false;
  }

  std::ostringstream body;
  body << "slotwatch stopped searching for appointments:\n\n"
       << "Reason: " << context << "\n\n"
       << "User: " << spec.email << "\n"
       << "Location: " << spec.EffectiveLocation() << "\n"
       << "Date Range: " << spec.DateRangeDisplay() << "\n\n"
       << "Check the configuration and restart the service.";

  return Send("fatal", "slotwatch stopped", body.str());
}

} // namespace slotwatch::notify
