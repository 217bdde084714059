#include "internal/browser/http_client.hpp"

#include <curl/curl.h>

#include "internal/util/curl.hpp"
#include "internal/util/errors.hpp"

namespace slotwatch::browser {
namespace {

size_t WriteToString(void* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(static_cast<char*>(ptr), size * nmemb);
  return size * nmemb;
}

} // namespace

HttpClient::HttpClient(long timeout_seconds) {
  util::EnsureCurlInitialized();

  curl_ = curl_easy_init();
  if (!curl_) {
    throw util::DriverError("curl_easy_init failed");
  }

  curl_easy_setopt(curl_, CURLOPT_TCP_KEEPALIVE, 1L);
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds);
  curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);

  headers_ = curl_slist_append(headers_, "Content-Type: application/json; charset=utf-8");
  curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
}

HttpClient::~HttpClient() {
  if (headers_) {
    curl_slist_free_all(headers_);
  }
  if (curl_) {
    curl_easy_cleanup(curl_);
  }
}

HttpResponse HttpClient::Request(const std::string& method, const std::string& url, const std::string& payload) {
  HttpResponse response;

  curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);

  if (method == "GET") {
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, nullptr);
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
  } else {
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  }

  const CURLcode code = curl_easy_perform(curl_);
  if (code != CURLE_OK) {
    throw util::DriverError(method + " " + url + " failed: " + curl_easy_strerror(code));
  }

  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

} // namespace slotwatch::browser
