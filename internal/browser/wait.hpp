#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "internal/browser/browser_driver.hpp"

namespace slotwatch::browser {

struct WaitOptions {
  std::chrono::milliseconds timeout{5000};
  std::chrono::milliseconds poll{250};
};

// Polls until the condition holds or the timeout expires. A DriverError from
// the condition counts as "not yet". The condition is evaluated at least once.
bool WaitFor(const std::function<bool()>& condition, const WaitOptions& options);

// Throw util::ElementNotFound on timeout.
Element              WaitForElement(BrowserDriver& driver, const Locator& locator, const WaitOptions& options);
std::vector<Element> WaitForElements(BrowserDriver& driver, const Locator& locator, const WaitOptions& options);
Element              WaitForClickable(BrowserDriver& driver, const Locator& locator, const WaitOptions& options);

bool WaitForUrlContains(BrowserDriver& driver, const std::string& fragment, const WaitOptions& options);

void Pause(std::chrono::milliseconds delay);

// Scrolls the element to the viewport center, lets the page settle, then
// clicks. A rejected native click is retried through script.
void ScrollAndClick(BrowserDriver& driver, const Element& element, std::chrono::milliseconds settle);

} // namespace slotwatch::browser
