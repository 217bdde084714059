#include "internal/notify/alert_policy.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "tests/unit/support/manual_clock.hpp"
#include "tests/unit/support/recording_notifier.hpp"

namespace {

using slotwatch::model::DebugArtifact;
using slotwatch::model::SlotResult;
using slotwatch::model::UserAppointmentSpec;
using slotwatch::notify::AlertPolicy;
using slotwatch::notify::AlertSettings;
using slotwatch::notify::NotificationThrottle;
using slotwatch::testing::ManualClock;
using slotwatch::testing::RecordingNotifier;

UserAppointmentSpec MakeSpec() {
  UserAppointmentSpec spec;
  spec.email      = "a@example.com";
  spec.password   = "secret";
  spec.location   = "Toronto";
  spec.start_date = "2026-11-01";
  spec.end_date   = "2026-11-30";
  spec.ivr_number = "111";
  return spec;
}

void TestThrottleWindow() {
  ManualClock          clock;
  NotificationThrottle throttle(std::chrono::seconds(300), clock.Fn());

  assert(!throttle.SecondsSinceLast().has_value());
  assert(throttle.TryPass());

  clock.Advance(std::chrono::seconds(90));
  assert(!throttle.TryPass());
  assert(throttle.SecondsSinceLast() == std::optional<std::int64_t>(90));

  clock.Advance(std::chrono::seconds(210));
  assert(throttle.TryPass());
}

void TestErrorsAreThrottled() {
  ManualClock clock;
  auto        notifier = std::make_shared<RecordingNotifier>();
  AlertPolicy policy(notifier, AlertSettings{}, clock.Fn());
  const auto  spec = MakeSpec();

  assert(policy.NotifyError(spec, "Error checking available dates"));
  clock.Advance(std::chrono::seconds(90));
  assert(!policy.NotifyError(spec, "Error checking available dates"));
  assert(notifier->CountSubject("slotwatch error") == 1);

  clock.Advance(std::chrono::seconds(220));
  assert(policy.NotifyError(spec, "Session expired"));
  assert(notifier->CountSubject("slotwatch error") == 2);

  const auto body = notifier->messages().back().body;
  assert(body.find("Error: Session expired") != std::string::npos);
  assert(body.find("Date Range: 2026-11-01 ~ 2026-11-30") != std::string::npos);
}

void TestSlotNotificationsAreNeverThrottled() {
  ManualClock clock;
  auto        notifier = std::make_shared<RecordingNotifier>();
  AlertPolicy policy(notifier, AlertSettings{}, clock.Fn());
  const auto  spec = MakeSpec();

  assert(policy.NotifyError(spec, "Error checking available dates"));
  for (int i = 0; i < 3; ++i) {
    assert(policy.NotifySlot(spec, SlotResult{"Toronto", "2026-11-02", "09:00", false}));
  }
  assert(notifier->CountSubject("Available Appointment Found!") == 3);

  const auto body = notifier->messages().back().body;
  assert(body.find("Location: Toronto") != std::string::npos);
  assert(body.find("Date: 2026-11-02") != std::string::npos);
  assert(body.find("Time: 09:00") != std::string::npos);
  assert(body.find("Status: Available (not booked)") != std::string::npos);
}

void TestDebugModeSilencesStartupErrorAndFatal() {
  ManualClock   clock;
  auto          notifier = std::make_shared<RecordingNotifier>();
  AlertSettings settings;
  settings.debug_enabled = true;
  AlertPolicy policy(notifier, settings, clock.Fn());
  const auto  spec = MakeSpec();

  assert(!policy.NotifyStartup(spec));
  assert(!policy.NotifyError(spec, "Error checking available dates"));
  assert(!policy.NotifyFatal(spec, "Login failed"));
  assert(notifier->messages().empty());

  // slots still go out in debug mode
  assert(policy.NotifySlot(spec, SlotResult{"Toronto", "2026-11-02", "09:00", false}));
  assert(notifier->messages().size() == 1);
}

void TestStartupAndFatalOutsideDebugMode() {
  auto        notifier = std::make_shared<RecordingNotifier>();
  AlertPolicy policy(notifier, AlertSettings{});
  const auto  spec = MakeSpec();

  assert(policy.NotifyStartup(spec));
  assert(policy.NotifyFatal(spec, "Login failed"));

  const auto messages = notifier->messages();
  assert(messages.size() == 2);
  assert(messages[0].subject == "slotwatch search started");
  assert(messages[0].body.find("IVR Number: 111") != std::string::npos);
  assert(messages[1].subject == "slotwatch stopped");
  assert(messages[1].body.find("Reason: Login failed") != std::string::npos);
}

void TestDebugMessagesNeedDebugEmails() {
  ManualClock   clock;
  auto          notifier = std::make_shared<RecordingNotifier>();
  AlertSettings settings;
  settings.debug_enabled = true;

  DebugArtifact artifact;
  artifact.prefix      = "monitor_error";
  artifact.captured_at = clock.Now();
  artifact.current_url = "https://visa.test/niv/groups/42";

  {
    AlertPolicy policy(notifier, settings, clock.Fn());
    assert(!policy.NotifyDebug(artifact));
  }

  settings.debug_emails = true;
  AlertPolicy policy(notifier, settings, clock.Fn());
  assert(policy.NotifyDebug(artifact));
  assert(notifier->messages().back().subject == "slotwatch error information");

  // error and debug messages share one interval
  artifact.prefix = "system_busy";
  clock.Advance(std::chrono::seconds(10));
  assert(!policy.NotifyDebug(artifact));
  clock.Advance(std::chrono::seconds(300));
  assert(policy.NotifyDebug(artifact));
  assert(notifier->messages().back().subject == "slotwatch debug information");
}

void TestFailedDeliveryIsReported() {
  auto notifier = std::make_shared<RecordingNotifier>();
  notifier->SetDeliver(false);
  AlertPolicy policy(notifier, AlertSettings{});

  assert(!policy.NotifySlot(MakeSpec(), SlotResult{"Toronto", "2026-11-02", "09:00", false}));
  assert(notifier->messages().size() == 1);

  AlertPolicy silent(nullptr, AlertSettings{});
  assert(!silent.NotifyStartup(MakeSpec()));
}

void TestSettingsFromConfig() {
  slotwatch::runtime::config::DebugConfig config;
  config.set_enabled(true);
  config.set_send_email_notifications(true);
  config.set_email_interval_seconds(45);

  const auto settings = AlertSettings::FromConfig(config);
  assert(settings.debug_enabled);
  assert(settings.debug_emails);
  assert(settings.interval == std::chrono::seconds(45));
}

} // namespace

int main() {
  TestThrottleWindow();
  TestErrorsAreThrottled();
  TestSlotNotificationsAreNeverThrottled();
  TestDebugModeSilencesStartupErrorAndFatal();
  TestStartupAndFatalOutsideDebugMode();
  TestDebugMessagesNeedDebugEmails();
  TestFailedDeliveryIsReported();
  TestSettingsFromConfig();

  std::cout << "slotwatch_unit_alert_policy: pass\n";
  return 0;
}
