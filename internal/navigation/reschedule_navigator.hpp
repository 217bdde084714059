#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "internal/browser/browser_driver.hpp"
#include "internal/navigation/card_selector.hpp"
#include "internal/navigation/navigation_options.hpp"
#include "internal/navigation/page_markers.hpp"

namespace slotwatch::navigation {

enum class PageState : std::uint8_t {
  kLoggedOut        = 0,
  kLoggingIn        = 1,
  kOnGroupPage      = 2,
  kOnReschedulePage = 3,
  kOnUnknownPage    = 4,
  kError            = 5,
};

constexpr std::string_view ToString(PageState state) {
  switch (state) {
    case PageState::kLoggedOut:
      return "logged_out";
    case PageState::kLoggingIn:
      return "logging_in";
    case PageState::kOnGroupPage:
      return "group_page";
    case PageState::kOnReschedulePage:
      return "reschedule_page";
    case PageState::kOnUnknownPage:
      return "unknown_page";
    case PageState::kError:
    default:
      return "error";
  }
}

/*
  Drives a session from whatever page it is on to the reschedule page.

      LoggedOut -> LoggingIn -> OnGroupPage -> OnUnknownPage -> OnReschedulePage
                                    |  ^            |
                                    v  |            v
                                 (login form)   (accordion)

  A session that already shows a page is reloaded first. The first login of
  a fresh session is free. After that the login form may
  come back once per call; a second return throws util::SessionExpired.
*/
class RescheduleNavigator {
 public:
  using LoginAction = std::function<void(browser::BrowserDriver&)>;

  static constexpr int kMaxTransitions = 8;

  RescheduleNavigator(NavigationOptions options, PageMarkers markers, LoginAction login);

  PageState Classify(browser::BrowserDriver& driver) const;

  void NavigateToReschedule(browser::BrowserDriver& driver, const std::string& ivr_number);

  PageState state() const {
    return state_;
  }

  int relogins() const {
    return relogins_;
  }

 private:
  void OpenRescheduleAccordion(browser::BrowserDriver& driver) const;

  static bool IsFreshUrl(const std::string& url);

  NavigationOptions options_;
  PageMarkers       markers_;
  CardSelector      cards_;
  LoginAction       login_;

  PageState state_    = PageState::kLoggedOut;
  int       relogins_ = 0;
};

} // namespace slotwatch::navigation
