#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/browser/browser_driver.hpp"
#include "internal/navigation/navigation_options.hpp"
#include "internal/navigation/page_markers.hpp"

namespace slotwatch::navigation {

// Index of the first card whose text contains needle (exact substring).
std::optional<std::size_t> MatchCard(const std::vector<std::string>& card_texts, std::string_view needle);

/*
  Group page step: picks the applicant card labelled with the account
  identifier and follows its continue link. Without a matching card the
  page-wide continue affordance is searched with an ordered fallback chain.

  Throws util::SessionExpired when the login form shows up instead, and
  util::NavigationFailed when nothing clickable is found.
*/
class CardSelector {
 public:
  CardSelector(NavigationOptions options, PageMarkers markers);

  // Returns the name of the method that located the click target.
  std::string Continue(browser::BrowserDriver& driver, const std::string& ivr_number) const;

 private:
  std::optional<browser::Element> FindInCard(browser::BrowserDriver& driver, const browser::Element& card, std::string* method) const;
  std::optional<browser::Element> FindOnPage(browser::BrowserDriver& driver, std::string* method) const;

  NavigationOptions options_;
  PageMarkers       markers_;
};

} // namespace slotwatch::navigation
