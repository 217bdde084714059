#include "internal/navigation/reschedule_navigator.hpp"

#include <utility>

#include "internal/browser/wait.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace slotwatch::navigation {

using browser::Element;
using browser::Locator;

RescheduleNavigator::RescheduleNavigator(NavigationOptions options, PageMarkers markers, LoginAction login)
    : options_(options), markers_(markers), cards_(std::move(options), std::move(markers)), login_(std::move(login)) {
  if (!login_) {
    throw util::InitializationError("reschedule navigator requires a login action");
  }
}

bool RescheduleNavigator::IsFreshUrl(const std::string& url) {
  return url.empty() || url == "about:blank" || url.rfind("data:", 0) == 0;
}

PageState RescheduleNavigator::Classify(browser::BrowserDriver& driver) const {
  const auto url = driver.CurrentUrl();
  if (IsFreshUrl(url) || markers_.IsLoginPage(driver)) {
    return PageState::kLoggedOut;
  }
  if (!driver.FindElements(Locator::Id(options_.facility_select_id)).empty()) {
    return PageState::kOnReschedulePage;
  }
  if (util::Contains(url, options_.post_login_url_pattern)) {
    return PageState::kOnGroupPage;
  }
  return PageState::kOnUnknownPage;
}

// ------------------------------------------------------------
// State machine
// ------------------------------------------------------------

void RescheduleNavigator::NavigateToReschedule(browser::BrowserDriver& driver, const std::string& ivr_number) {
  observability::SpanScope span("navigation.reschedule");

  relogins_              = 0;
  bool recovered_unknown = false;

  // a page left over from the last cycle is stale; reloading it is also what
  // reveals an expired site session
  if (!IsFreshUrl(driver.CurrentUrl())) {
    SLOTWATCH_LOG_DEBUG("reloading current page");
    driver.Refresh();
  }

  for (int step = 0; step < kMaxTransitions; ++step) {
    const bool fresh = IsFreshUrl(driver.CurrentUrl());
    state_           = Classify(driver);
    SLOTWATCH_LOG_DEBUG("page classified", {observability::StringField("state", ToString(state_)), observability::IntField("step", step)});

    switch (state_) {
      case PageState::kOnReschedulePage:
        SLOTWATCH_LOG_INFO("on reschedule page");
        return;

      case PageState::kLoggedOut:
        if (!fresh) {
          if (++relogins_ > 1) {
            state_ = PageState::kError;
            span.RecordException("login form returned twice");
            throw util::SessionExpired("login form returned again after re-login");
          }
          SLOTWATCH_LOG_INFO("login form detected, logging in again");
        }
        state_ = PageState::kLoggingIn;
        try {
          login_(driver);
        } catch (const std::exception& e) {
          state_ = PageState::kError;
          span.RecordException(e.what());
          throw;
        }
        break;

      case PageState::kOnGroupPage:
        try {
          cards_.Continue(driver, ivr_number);
        } catch (const util::SessionExpired& e) {
          SLOTWATCH_LOG_INFO("session expired on group page", {observability::StringField("detail", e.what())});
        }
        break;

      case PageState::kOnUnknownPage:
        try {
          OpenRescheduleAccordion(driver);
        } catch (const util::ElementNotFound& e) {
          if (recovered_unknown) {
            state_ = PageState::kError;
            throw util::NavigationFailed(std::string("reschedule option not reachable: ") + e.what());
          }
          SLOTWATCH_LOG_INFO("unexpected page, returning to start", {observability::StringField("url", driver.CurrentUrl())});
          recovered_unknown = true;
          driver.Navigate(options_.SignInUrl());
        }
        break;

      case PageState::kLoggingIn:
      case PageState::kError:
      default:
        break;
    }
  }

  state_ = PageState::kError;
  throw util::NavigationFailed("reschedule page not reached");
}

void RescheduleNavigator::OpenRescheduleAccordion(browser::BrowserDriver& driver) const {
  browser::WaitForElement(driver, Locator::ClassName("accordion"), options_.PageWait());

  for (const auto& item : driver.FindElements(Locator::Css(".accordion-item a.accordion-title"))) {
    if (!util::Contains(driver.Text(item), options_.reschedule_phrase)) {
      continue;
    }

    browser::ScrollAndClick(driver, item, options_.settle_delay);

    Element    content;
    const bool expanded = browser::WaitFor(
        [&] {
          for (const auto& candidate : driver.FindElements(Locator::ClassName("accordion-content"))) {
            if (!driver.IsDisplayed(candidate)) {
              continue;
            }
            for (const auto& link : driver.FindChildren(candidate, Locator::TagName("a"))) {
              if (util::Contains(driver.Text(link), options_.reschedule_link_text)) {
                content = candidate;
                return true;
              }
            }
          }
          return false;
        },
        options_.ElementWait());
    if (!expanded) {
      throw util::ElementNotFound("reschedule section did not expand");
    }

    auto links = driver.FindChildren(content, Locator::Css("a.button.small.primary"));
    if (links.empty()) {
      throw util::ElementNotFound("reschedule link missing from section");
    }
    browser::ScrollAndClick(driver, links.front(), options_.settle_delay);
    SLOTWATCH_LOG_INFO("reschedule link clicked");

    browser::WaitFor([&] { return !driver.FindElements(Locator::Id(options_.facility_select_id)).empty(); }, options_.PageWait());
    return;
  }

  throw util::ElementNotFound("no accordion item mentions " + options_.reschedule_phrase);
}

} // namespace slotwatch::navigation
