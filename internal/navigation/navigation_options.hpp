#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/browser/wait.hpp"

namespace slotwatch::runtime::config {
class RuntimeConfig;
}

namespace slotwatch::navigation {

/*
  Site selectors, labels and timings shared by the navigation steps and the
  slot scanner. Defaults match the live site; every value can be overridden
  from the `site` and `navigation` config sections.
*/
struct NavigationOptions {
  std::string base_url{"https://ais.usvisa-info.com/en-ca/niv"};
  std::string sign_in_path{"/users/sign_in"};
  std::string post_login_url_pattern{"/groups/"};
  std::string card_identifier_label{"IVR Account Number: "};
  std::string continue_text{"Continue"};
  std::string reschedule_phrase{"Reschedule Appointment"};
  std::string reschedule_link_text{"Reschedule"};
  std::string facility_select_id{"appointments_consulate_appointment_facility_id"};

  std::vector<std::string> busy_markers{"system is busy", "please try again later", "system busy", "try again later"};
  std::vector<std::string> login_markers{"user_email", "user_password"};

  std::chrono::milliseconds element_wait{5000};
  std::chrono::milliseconds page_wait{10000};
  std::chrono::milliseconds card_wait{20000};
  std::chrono::milliseconds login_redirect_wait{10000};
  std::chrono::milliseconds settle_delay{500};
  std::chrono::milliseconds post_click_delay{1000};
  std::chrono::milliseconds poll_interval{250};

  // Expects defaults to have been applied to the config.
  static NavigationOptions FromConfig(const slotwatch::runtime::config::RuntimeConfig& config);

  browser::WaitOptions ElementWait() const {
    return {element_wait, poll_interval};
  }
  browser::WaitOptions PageWait() const {
    return {page_wait, poll_interval};
  }
  browser::WaitOptions CardWait() const {
    return {card_wait, poll_interval};
  }
  browser::WaitOptions LoginRedirectWait() const {
    return {login_redirect_wait, poll_interval};
  }

  std::string SignInUrl() const {
    return base_url + sign_in_path;
  }
};

} // namespace slotwatch::navigation
