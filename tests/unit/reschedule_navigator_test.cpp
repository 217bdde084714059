#include "internal/navigation/reschedule_navigator.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/navigation/login_flow.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/support/fake_browser.hpp"
#include "tests/unit/support/fake_site.hpp"

namespace {

using slotwatch::browser::BrowserDriver;
using slotwatch::browser::Locator;
using slotwatch::navigation::LoginFlow;
using slotwatch::navigation::PageState;
using slotwatch::navigation::RescheduleNavigator;
using slotwatch::testing::FakeBrowser;
using slotwatch::testing::FakeSite;
using slotwatch::testing::kActionsUrl;
using slotwatch::testing::kGroupsUrl;
using slotwatch::testing::kRescheduleUrl;
using slotwatch::testing::kSignInUrl;
using slotwatch::testing::SiteScript;
using slotwatch::testing::TestMarkers;
using slotwatch::testing::TestNavigationOptions;

struct Harness {
  explicit Harness(SiteScript script)
      : options(TestNavigationOptions()),
        flow(options),
        navigator(options, TestMarkers(options), [this](BrowserDriver& driver) {
          ++logins;
          flow.Login(driver, "a@example.com", "secret");
        }) {
    FakeSite(std::move(script)).Install(browser);
  }

  slotwatch::navigation::NavigationOptions options;
  FakeBrowser                              browser;
  LoginFlow                                flow;
  RescheduleNavigator                      navigator;
  int                                      logins = 0;
};

void TestClassifiesPages() {
  Harness h{SiteScript{}};

  assert(h.navigator.Classify(h.browser) == PageState::kLoggedOut);
  h.browser.SetUrl("about:blank");
  assert(h.navigator.Classify(h.browser) == PageState::kLoggedOut);
  h.browser.SetUrl(kSignInUrl);
  assert(h.navigator.Classify(h.browser) == PageState::kLoggedOut);
  h.browser.SetUrl(kGroupsUrl);
  assert(h.navigator.Classify(h.browser) == PageState::kOnGroupPage);
  h.browser.SetUrl(kActionsUrl);
  assert(h.navigator.Classify(h.browser) == PageState::kOnUnknownPage);
  h.browser.SetUrl(kRescheduleUrl);
  assert(h.navigator.Classify(h.browser) == PageState::kOnReschedulePage);
}

void TestFreshSessionReachesReschedulePage() {
  Harness h{SiteScript{}};

  h.navigator.NavigateToReschedule(h.browser, "111");

  assert(h.navigator.state() == PageState::kOnReschedulePage);
  assert(h.browser.CurrentUrl() == kRescheduleUrl);
  assert(h.logins == 1);
  assert(h.navigator.relogins() == 0);
}

void TestSecondCallStaysOnReschedulePage() {
  Harness h{SiteScript{}};
  h.navigator.NavigateToReschedule(h.browser, "111");
  const auto navigations = h.browser.navigations.size();

  h.navigator.NavigateToReschedule(h.browser, "111");

  assert(h.logins == 1);
  assert(h.browser.navigations.size() == navigations);
  assert(h.browser.refreshes == 1);
  assert(h.navigator.state() == PageState::kOnReschedulePage);
}

void TestReloadOnExpiredSessionLogsInAgain() {
  Harness h{SiteScript{}};
  h.navigator.NavigateToReschedule(h.browser, "111");
  assert(h.browser.refreshes == 0);

  // the site forgot the session, so the reload lands on the sign-in form
  h.browser.on_refresh = [](FakeBrowser& b) { b.SetUrl(kSignInUrl); };
  h.navigator.NavigateToReschedule(h.browser, "111");

  assert(h.browser.refreshes == 1);
  assert(h.logins == 2);
  assert(h.navigator.relogins() == 1);
  assert(h.navigator.state() == PageState::kOnReschedulePage);
  assert(h.browser.CurrentUrl() == kRescheduleUrl);
}

void TestOneBounceToLoginIsRecovered() {
  SiteScript script;
  script.login_bounces = 1;
  Harness h{script};

  h.navigator.NavigateToReschedule(h.browser, "111");

  assert(h.navigator.state() == PageState::kOnReschedulePage);
  assert(h.logins == 2);
  assert(h.navigator.relogins() == 1);
}

void TestSecondBounceExpiresSession() {
  SiteScript script;
  script.login_bounces = 2;
  Harness h{script};

  bool expired = false;
  try {
    h.navigator.NavigateToReschedule(h.browser, "111");
  } catch (const slotwatch::util::SessionExpired&) {
    expired = true;
  }
  assert(expired);
  assert(h.navigator.state() == PageState::kError);
  assert(h.logins == 2);
}

void TestUnknownPageRecoversThroughSignIn() {
  Harness     h{SiteScript{}};
  const char* lost = "https://visa.test/niv/somewhere";
  h.browser.PageAt(lost).source = "<html>lost</html>";
  h.browser.SetUrl(lost);

  // the recovery navigation lands on the sign-in page, so the session logs in
  // again and then walks the normal route
  h.navigator.NavigateToReschedule(h.browser, "111");
  assert(h.browser.navigations.front() == kSignInUrl);
  assert(h.navigator.state() == PageState::kOnReschedulePage);
  assert(h.navigator.relogins() == 1);
}

void TestMissingAccordionTwiceFailsNavigation() {
  Harness h{SiteScript{}};
  h.browser.on_navigate = [](FakeBrowser& b, const std::string&) { b.SetUrl("https://visa.test/niv/still-lost"); };
  h.browser.SetUrl("https://visa.test/niv/lost");

  bool failed = false;
  try {
    h.navigator.NavigateToReschedule(h.browser, "111");
  } catch (const slotwatch::util::NavigationFailed&) {
    failed = true;
  }
  assert(failed);
  assert(h.navigator.state() == PageState::kError);
  assert(h.logins == 0);
}

void TestLoginFailurePropagates() {
  SiteScript script;
  script.accept_credentials = false;
  Harness h{script};

  bool failed = false;
  try {
    h.navigator.NavigateToReschedule(h.browser, "111");
  } catch (const slotwatch::util::LoginFailed&) {
    failed = true;
  }
  assert(failed);
  assert(h.navigator.state() == PageState::kError);
}

} // namespace

int main() {
  TestClassifiesPages();
  TestFreshSessionReachesReschedulePage();
  TestSecondCallStaysOnReschedulePage();
  TestReloadOnExpiredSessionLogsInAgain();
  TestOneBounceToLoginIsRecovered();
  TestSecondBounceExpiresSession();
  TestUnknownPageRecoversThroughSignIn();
  TestMissingAccordionTwiceFailsNavigation();
  TestLoginFailurePropagates();

  std::cout << "slotwatch_unit_reschedule_navigator: pass\n";
  return 0;
}
