#pragma once

#include <string>

#include "internal/notify/notifier.hpp"

namespace slotwatch::runtime::config {
class GmailConfig;
}

namespace slotwatch::notify {

struct SmtpSettings {
  bool        enabled = true;
  std::string url{"smtp://smtp.gmail.com:587"};
  std::string sender;
  std::string password;
  std::string recipient;

  static SmtpSettings FromConfig(const slotwatch::runtime::config::GmailConfig& config);

  bool Complete() const {
    return enabled && !url.empty() && !sender.empty() && !password.empty() && !recipient.empty();
  }
};

// Plain-text mail over SMTP with STARTTLS (libcurl).
class SmtpNotifier : public Notifier {
 public:
  explicit SmtpNotifier(SmtpSettings settings);

  bool SendNotification(const std::string& subject, const std::string& body) override;

  // RFC 5322 message text, CRLF line endings.
  static std::string BuildMessage(const SmtpSettings& settings, const std::string& subject, const std::string& body);

 private:
  SmtpSettings settings_;
};

} // namespace slotwatch::notify
