#pragma once

#include <string>

#include "internal/browser/browser_driver.hpp"
#include "internal/navigation/navigation_options.hpp"

namespace slotwatch::navigation {

/*
  Sign-in sequence:

    sign-in page -> optional information interstitial -> login form
    -> credentials -> privacy consent (best effort) -> submit
    -> post-login url

  Any required step that does not complete within its wait throws
  util::LoginFailed.
*/
class LoginFlow {
 public:
  explicit LoginFlow(NavigationOptions options);

  void Login(browser::BrowserDriver& driver, const std::string& email, const std::string& password) const;

 private:
  void DismissInterstitial(browser::BrowserDriver& driver) const;
  void FillCredentials(browser::BrowserDriver& driver, const std::string& email, const std::string& password) const;
  void ConfirmPrivacyPolicy(browser::BrowserDriver& driver) const;
  void Submit(browser::BrowserDriver& driver) const;

  NavigationOptions options_;
};

} // namespace slotwatch::navigation
