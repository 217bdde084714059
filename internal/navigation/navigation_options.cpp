#include "internal/navigation/navigation_options.hpp"

#include "config/config.pb.h"

namespace slotwatch::navigation {

NavigationOptions NavigationOptions::FromConfig(const slotwatch::runtime::config::RuntimeConfig& config) {
  const auto& site   = config.site();
  const auto& timing = config.navigation();

  NavigationOptions options;
  options.base_url               = site.base_url();
  options.sign_in_path           = site.sign_in_path();
  options.post_login_url_pattern = site.post_login_url_pattern();
  options.card_identifier_label  = site.card_identifier_label();
  options.continue_text          = site.continue_text();
  options.reschedule_phrase      = site.reschedule_phrase();
  options.busy_markers.assign(site.busy_markers().begin(), site.busy_markers().end());
  options.login_markers.assign(site.login_markers().begin(), site.login_markers().end());

  options.element_wait        = std::chrono::milliseconds(timing.element_wait_ms());
  options.page_wait           = std::chrono::milliseconds(timing.page_wait_ms());
  options.card_wait           = std::chrono::milliseconds(timing.card_wait_ms());
  options.login_redirect_wait = std::chrono::milliseconds(timing.login_redirect_wait_ms());
  options.settle_delay        = std::chrono::milliseconds(timing.settle_delay_ms());
  options.post_click_delay    = std::chrono::milliseconds(timing.post_click_delay_ms());
  options.poll_interval       = std::chrono::milliseconds(timing.poll_interval_ms());

  while (!options.base_url.empty() && options.base_url.back() == '/') {
    options.base_url.pop_back();
  }
  return options;
}

} // namespace slotwatch::navigation
