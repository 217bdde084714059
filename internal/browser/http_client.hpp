#pragma once

#include <curl/curl.h>

#include <string>

namespace slotwatch::browser {

struct HttpResponse {
  long        status = 0;
  std::string body;
};

/*
  Minimal blocking JSON-over-HTTP client on one libcurl easy handle.

  Not thread-safe; each WebDriver session owns its own client.
*/
class HttpClient {
 public:
  explicit HttpClient(long timeout_seconds = 60);
  ~HttpClient();

  HttpClient(const HttpClient&)            = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // Throws util::DriverError on transport failure. HTTP error statuses are
  // returned to the caller.
  HttpResponse Request(const std::string& method, const std::string& url, const std::string& payload = "");

 private:
  CURL*       curl_    = nullptr;
  curl_slist* headers_ = nullptr;
};

} // namespace slotwatch::browser
