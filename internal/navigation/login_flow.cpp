#include "internal/navigation/login_flow.hpp"

#include <utility>

#include "internal/browser/probe.hpp"
#include "internal/browser/wait.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace slotwatch::navigation {

using browser::Locator;

LoginFlow::LoginFlow(NavigationOptions options) : options_(std::move(options)) {
}

void LoginFlow::Login(browser::BrowserDriver& driver, const std::string& email, const std::string& password) const {
  observability::SpanScope span("navigation.login");

  try {
    SLOTWATCH_LOG_INFO("loading sign-in page", {observability::StringField("url", options_.SignInUrl())});
    driver.Navigate(options_.SignInUrl());

    DismissInterstitial(driver);

    try {
      browser::WaitForElement(driver, Locator::Id("sign_in_form"), options_.PageWait());
    } catch (const util::ElementNotFound&) {
      throw util::LoginFailed("login form did not appear");
    }

    FillCredentials(driver, email, password);
    ConfirmPrivacyPolicy(driver);
    Submit(driver);

    if (!browser::WaitForUrlContains(driver, options_.post_login_url_pattern, options_.LoginRedirectWait())) {
      throw util::LoginFailed("post-login page was not reached");
    }
  } catch (const util::LoginFailed& e) {
    span.RecordException(e.what());
    throw;
  } catch (const util::ElementNotFound& e) {
    span.RecordException(e.what());
    throw util::LoginFailed(e.what());
  } catch (const util::DriverError& e) {
    span.RecordException(e.what());
    throw util::LoginFailed(std::string("browser error during login: ") + e.what());
  }

  SLOTWATCH_LOG_INFO("login succeeded", {observability::StringField("user", email)});
}

void LoginFlow::DismissInterstitial(browser::BrowserDriver& driver) const {
  const std::vector<browser::Probe<bool>> probes = {
      {"interstitial control",
       [&]() -> std::optional<bool> {
         auto arrow = browser::WaitForClickable(driver, Locator::ClassName("down-arrow"), options_.ElementWait());
         driver.Click(arrow);
         return true;
       }},
      {"page landmark",
       [&]() -> std::optional<bool> {
         browser::WaitForElement(driver, Locator::Id("header"), options_.ElementWait());
         return true;
       }},
  };

  if (auto hit = browser::FirstSuccess(probes, "information interstitial")) {
    SLOTWATCH_LOG_INFO("information interstitial handled", {observability::StringField("method", hit->method)});
  } else {
    SLOTWATCH_LOG_INFO("no information interstitial found");
  }
}

void LoginFlow::FillCredentials(browser::BrowserDriver& driver, const std::string& email, const std::string& password) const {
  auto email_field = browser::WaitForElement(driver, Locator::Id("user_email"), options_.ElementWait());
  driver.Clear(email_field);
  driver.SendKeys(email_field, email);

  auto password_field = browser::WaitForElement(driver, Locator::Id("user_password"), options_.ElementWait());
  driver.Clear(password_field);
  driver.SendKeys(password_field, password);
}

void LoginFlow::ConfirmPrivacyPolicy(browser::BrowserDriver& driver) const {
  try {
    auto checkbox = browser::WaitForElement(driver, Locator::Id("policy_confirmed"), options_.ElementWait());
    if (driver.IsSelected(checkbox)) {
      SLOTWATCH_LOG_INFO("privacy policy already confirmed");
      return;
    }
    driver.ScrollIntoView(checkbox);
    browser::Pause(options_.settle_delay);
    driver.ScriptClick(checkbox);
    SLOTWATCH_LOG_INFO("privacy policy confirmed");
  } catch (const util::ElementNotFound&) {
    SLOTWATCH_LOG_INFO("privacy policy checkbox not present");
  } catch (const util::DriverError& e) {
    SLOTWATCH_LOG_WARN("privacy policy checkbox not confirmed", {observability::StringField("error", e.what())});
  }
}

void LoginFlow::Submit(browser::BrowserDriver& driver) const {
  auto button = browser::WaitForClickable(driver, Locator::Css("input.button.primary[name='commit']"), options_.ElementWait());
  driver.Click(button);
}

} // namespace slotwatch::navigation
