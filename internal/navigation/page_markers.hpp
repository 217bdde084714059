#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/browser/browser_driver.hpp"

namespace slotwatch::navigation {

/*
  Recognizes the two page states the site reaches without warning: the
  "system busy" notice and a silent bounce back to the login form.
*/
class PageMarkers {
 public:
  PageMarkers(std::vector<std::string> busy_markers, std::vector<std::string> login_markers, std::string sign_in_path);

  // Case-insensitive marker scan of arbitrary text.
  bool IsBusyText(std::string_view text) const;

  // Full page source plus the dedicated error and alert regions. A driver
  // failure while looking is reported as not busy.
  bool IsBusy(browser::BrowserDriver& driver) const;

  bool IsLoginPage(browser::BrowserDriver& driver) const;

 private:
  std::vector<std::string> busy_markers_;
  std::vector<std::string> login_markers_;
  std::string              sign_in_path_;
};

} // namespace slotwatch::navigation
