#include "internal/navigation/card_selector.hpp"

#include <utility>

#include "internal/browser/probe.hpp"
#include "internal/browser/wait.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace slotwatch::navigation {

using browser::Element;
using browser::Locator;
using ElementProbe = browser::Probe<Element>;

std::optional<std::size_t> MatchCard(const std::vector<std::string>& card_texts, std::string_view needle) {
  for (std::size_t i = 0; i < card_texts.size(); ++i) {
    if (util::Contains(card_texts[i], needle)) {
      return i;
    }
  }
  return std::nullopt;
}

CardSelector::CardSelector(NavigationOptions options, PageMarkers markers) : options_(std::move(options)), markers_(std::move(markers)) {
}

std::string CardSelector::Continue(browser::BrowserDriver& driver, const std::string& ivr_number) const {
  std::vector<Element> cards;
  try {
    cards = browser::WaitForElements(driver, Locator::ClassName("application"), options_.CardWait());
  } catch (const util::ElementNotFound&) {
    SLOTWATCH_LOG_INFO("no applicant cards on page");
  }

  std::optional<Element> target;
  std::string            method;

  if (!cards.empty()) {
    std::vector<std::string> texts;
    texts.reserve(cards.size());
    for (const auto& card : cards) {
      texts.push_back(driver.Text(card));
    }

    const std::string needle = options_.card_identifier_label + ivr_number;
    if (auto index = MatchCard(texts, needle)) {
      SLOTWATCH_LOG_INFO("applicant card matched", {observability::IntField("index", static_cast<std::int64_t>(*index))});
      target = FindInCard(driver, cards[*index], &method);
    } else {
      SLOTWATCH_LOG_INFO("no applicant card matched", {observability::IntField("cards", static_cast<std::int64_t>(cards.size()))});
    }
  }

  if (!target) {
    target = FindOnPage(driver, &method);
  }

  if (!target) {
    if (markers_.IsLoginPage(driver)) {
      throw util::SessionExpired("login form shown while selecting applicant");
    }
    throw util::NavigationFailed("continue affordance not found");
  }

  browser::ScrollAndClick(driver, *target, options_.settle_delay);
  SLOTWATCH_LOG_INFO("continue clicked", {observability::StringField("method", method)});
  return method;
}

std::optional<Element> CardSelector::FindInCard(browser::BrowserDriver& driver, const Element& card, std::string* method) const {
  const std::vector<ElementProbe> probes = {
      {"card button",
       [&]() -> std::optional<Element> {
         auto found = driver.FindChildren(card, Locator::Css("a.button.primary.small"));
         return found.empty() ? std::nullopt : std::optional<Element>(found.front());
       }},
      {"card link text",
       [&]() -> std::optional<Element> {
         auto found = driver.FindChildren(card, Locator::LinkText(options_.continue_text));
         return found.empty() ? std::nullopt : std::optional<Element>(found.front());
       }},
      {"card first link",
       [&]() -> std::optional<Element> {
         auto found = driver.FindChildren(card, Locator::TagName("a"));
         return found.empty() ? std::nullopt : std::optional<Element>(found.front());
       }},
  };

  auto hit = browser::FirstSuccess(probes, "card continue");
  if (!hit) {
    return std::nullopt;
  }
  *method = hit->method;
  return hit->value;
}

std::optional<Element> CardSelector::FindOnPage(browser::BrowserDriver& driver, std::string* method) const {
  const auto clickable = [&](const Element& element) { return driver.IsDisplayed(element) && driver.IsEnabled(element); };

  const auto first_clickable = [&](const Locator& locator) -> std::optional<Element> {
    for (const auto& element : driver.FindElements(locator)) {
      if (clickable(element)) {
        return element;
      }
    }
    return std::nullopt;
  };

  const std::vector<ElementProbe> probes = {
      {"link text", [&] { return first_clickable(Locator::LinkText(options_.continue_text)); }},
      {"partial link text", [&] { return first_clickable(Locator::PartialLinkText(options_.continue_text)); }},
      {"styled button",
       [&]() -> std::optional<Element> {
         for (const auto& element : driver.FindElements(Locator::Css("a.button.primary.small"))) {
           if (clickable(element) && util::Contains(driver.Text(element), options_.continue_text)) {
             return element;
           }
         }
         return std::nullopt;
       }},
      {"link scan",
       [&]() -> std::optional<Element> {
         for (const auto& element : driver.FindElements(Locator::TagName("a"))) {
           if (util::Trim(driver.Text(element)) == options_.continue_text) {
             return element;
           }
         }
         return std::nullopt;
       }},
  };

  auto hit = browser::FirstSuccess(probes, "page continue");
  if (!hit) {
    return std::nullopt;
  }
  *method = hit->method;
  return hit->value;
}

} // namespace slotwatch::navigation
