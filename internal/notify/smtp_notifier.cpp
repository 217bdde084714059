#include "internal/notify/smtp_notifier.hpp"

#include <curl/curl.h>

#include <cstring>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/curl.hpp"

namespace slotwatch::notify {
namespace {

struct UploadState {
  const std::string* data   = nullptr;
  std::size_t        offset = 0;
};

size_t ReadFromString(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto*             state     = static_cast<UploadState*>(userdata);
  const std::size_t room      = size * nitems;
  const std::size_t remaining = state->data->size() - state->offset;
  const std::size_t count     = remaining < room ? remaining : room;
  if (count > 0) {
    std::memcpy(buffer, state->data->data() + state->offset, count);
    state->offset += count;
  }
  return count;
}

std::string NormalizeLineEndings(const std::string& text) {
  std::string out;
  out.reserve(text.size() + text.size() / 16);
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n' && (i == 0 || text[i - 1] != '\r')) {
      out += "\r\n";
    } else {
      out += text[i];
    }
  }
  return out;
}

std::string RfcDate() {
  const std::time_t now = std::time(nullptr);
  std::tm           local{};
  localtime_r(&now, &local);

  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::put_time(&local, "%a, %d %b %Y %H:%M:%S %z");
  return out.str();
}

} // namespace

SmtpSettings SmtpSettings::FromConfig(const slotwatch::runtime::config::GmailConfig& config) {
  SmtpSettings settings;
  settings.enabled = !config.has_enabled() || config.enabled();
  if (!config.smtp_url().empty()) {
    settings.url = config.smtp_url();
  }
  settings.sender    = config.email();
  settings.password  = config.app_password();
  settings.recipient = config.recipient_email();
  return settings;
}

SmtpNotifier::SmtpNotifier(SmtpSettings settings) : settings_(std::move(settings)) {
  if (!settings_.Complete()) {
    SLOTWATCH_LOG_WARN("mail configuration is incomplete, notifications will be skipped");
    return;
  }
  util::EnsureCurlInitialized();
  SLOTWATCH_LOG_INFO("mail notifier ready", {observability::StringField("sender", settings_.sender), observability::StringField("url", settings_.url)});
}

std::string SmtpNotifier::BuildMessage(const SmtpSettings& settings, const std::string& subject, const std::string& body) {
  std::ostringstream out;
  out << "Date: " << RfcDate() << "\r\n"
      << "From: <" << settings.sender << ">\r\n"
      << "To: <" << settings.recipient << ">\r\n"
      << "Subject: " << subject << "\r\n"
      << "MIME-Version: 1.0\r\n"
      << "Content-Type: text/plain; charset=UTF-8\r\n"
      << "\r\n"
      << NormalizeLineEndings(body) << "\r\n";
  return out.str();
}

bool SmtpNotifier::SendNotification(const std::string& subject, const std::string& body) {
  if (!settings_.Complete()) {
    SLOTWATCH_LOG_WARN("mail configuration is incomplete, skipping notification", {observability::StringField("subject", subject)});
    return false;
  }

  SLOTWATCH_LOG_INFO("sending notification",
                     {observability::StringField("from", settings_.sender), observability::StringField("to", settings_.recipient),
                      observability::StringField("subject", subject)});

  CURL* curl = curl_easy_init();
  if (!curl) {
    SLOTWATCH_LOG_ERROR("failed to send notification", {observability::StringField("error", "curl_easy_init failed")});
    return false;
  }

  const std::string message   = BuildMessage(settings_, subject, body);
  const std::string mail_from = "<" + settings_.sender + ">";
  UploadState       upload{&message, 0};

  curl_slist* recipients = curl_slist_append(nullptr, ("<" + settings_.recipient + ">").c_str());

  curl_easy_setopt(curl, CURLOPT_URL, settings_.url.c_str());
  curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
  curl_easy_setopt(curl, CURLOPT_USERNAME, settings_.sender.c_str());
  curl_easy_setopt(curl, CURLOPT_PASSWORD, settings_.password.c_str());
  curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mail_from.c_str());
  curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
  curl_easy_setopt(curl, CURLOPT_READFUNCTION, ReadFromString);
  curl_easy_setopt(curl, CURLOPT_READDATA, &upload);
  curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);

  const CURLcode code = curl_easy_perform(curl);

  curl_slist_free_all(recipients);
  curl_easy_cleanup(curl);

  if (code != CURLE_OK) {
    SLOTWATCH_LOG_ERROR("failed to send notification",
                        {observability::StringField("subject", subject), observability::StringField("error", curl_easy_strerror(code))});
    return false;
  }

  SLOTWATCH_LOG_INFO("notification sent", {observability::StringField("subject", subject)});
  return true;
}

} // namespace slotwatch::notify
