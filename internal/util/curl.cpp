#include "curl.hpp"

#include <curl/curl.h>

#include <mutex>

namespace slotwatch::util {

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace slotwatch::util
