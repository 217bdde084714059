#include "internal/browser/wait.hpp"

#include <algorithm>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace slotwatch::browser {

bool WaitFor(const std::function<bool()>& condition, const WaitOptions& options) {
  const auto deadline = std::chrono::steady_clock::now() + options.timeout;
  for (;;) {
    try {
      if (condition()) {
        return true;
      }
    } catch (const util::DriverError&) {
      // element went stale or page is mid-navigation; poll again
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(options.poll, deadline - now));
  }
}

std::vector<Element> WaitForElements(BrowserDriver& driver, const Locator& locator, const WaitOptions& options) {
  std::vector<Element> found;
  const bool           ok = WaitFor(
      [&] {
        found = driver.FindElements(locator);
        return !found.empty();
      },
      options);
  if (!ok) {
    throw util::ElementNotFound("timed out waiting for " + locator.Describe());
  }
  return found;
}

Element WaitForElement(BrowserDriver& driver, const Locator& locator, const WaitOptions& options) {
  return WaitForElements(driver, locator, options).front();
}

Element WaitForClickable(BrowserDriver& driver, const Locator& locator, const WaitOptions& options) {
  Element    clickable;
  const bool ok = WaitFor(
      [&] {
        for (const auto& element : driver.FindElements(locator)) {
          if (driver.IsDisplayed(element) && driver.IsEnabled(element)) {
            clickable = element;
            return true;
          }
        }
        return false;
      },
      options);
  if (!ok) {
    throw util::ElementNotFound("timed out waiting for clickable " + locator.Describe());
  }
  return clickable;
}

bool WaitForUrlContains(BrowserDriver& driver, const std::string& fragment, const WaitOptions& options) {
  return WaitFor([&] { return driver.CurrentUrl().find(fragment) != std::string::npos; }, options);
}

void Pause(std::chrono::milliseconds delay) {
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
}

void ScrollAndClick(BrowserDriver& driver, const Element& element, std::chrono::milliseconds settle) {
  driver.ScrollIntoView(element);
  Pause(settle);
  try {
    driver.Click(element);
  } catch (const util::DriverError& e) {
    SLOTWATCH_LOG_INFO("native click rejected, using script click", {observability::StringField("error", e.what())});
    driver.ScriptClick(element);
  }
}

} // namespace slotwatch::browser
