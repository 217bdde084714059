#include "internal/notify/smtp_notifier.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "config/config.pb.h"

namespace {

using slotwatch::notify::SmtpNotifier;
using slotwatch::notify::SmtpSettings;

SmtpSettings CompleteSettings() {
  SmtpSettings settings;
  settings.sender    = "sender@gmail.com";
  settings.password  = "app password";
  settings.recipient = "me@example.com";
  return settings;
}

void TestMessageHeadersAndBody() {
  const auto message = SmtpNotifier::BuildMessage(CompleteSettings(), "Available Appointment Found!", "Location: Toronto\nDate: 2026-11-02\r\nTime: 09:00");

  assert(message.rfind("Date: ", 0) == 0);
  assert(message.find("From: <sender@gmail.com>\r\n") != std::string::npos);
  assert(message.find("To: <me@example.com>\r\n") != std::string::npos);
  assert(message.find("Subject: Available Appointment Found!\r\n") != std::string::npos);
  assert(message.find("Content-Type: text/plain; charset=UTF-8\r\n\r\n") != std::string::npos);
  assert(message.find("Location: Toronto\r\nDate: 2026-11-02\r\nTime: 09:00\r\n") != std::string::npos);
  assert(message.find("\r\r\n") == std::string::npos);
}

void TestSettingsFromConfig() {
  slotwatch::runtime::config::GmailConfig config;
  config.set_email("sender@gmail.com");
  config.set_app_password("pw");
  config.set_recipient_email("me@example.com");
  config.set_smtp_url("smtp://localhost:2525");

  auto settings = SmtpSettings::FromConfig(config);
  assert(settings.enabled);
  assert(settings.url == "smtp://localhost:2525");
  assert(settings.Complete());

  config.set_enabled(false);
  assert(!SmtpSettings::FromConfig(config).Complete());
}

void TestIncompleteSettingsSkipDelivery() {
  auto settings      = CompleteSettings();
  settings.recipient = "";
  SmtpNotifier notifier(settings);
  assert(!notifier.SendNotification("subject", "body"));
}

} // namespace

int main() {
  TestMessageHeadersAndBody();
  TestSettingsFromConfig();
  TestIncompleteSettingsSkipDelivery();

  std::cout << "slotwatch_unit_smtp_notifier: pass\n";
  return 0;
}
