#include "internal/navigation/page_markers.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace slotwatch::navigation {

using browser::Locator;

PageMarkers::PageMarkers(std::vector<std::string> busy_markers, std::vector<std::string> login_markers, std::string sign_in_path)
    : busy_markers_(std::move(busy_markers)), login_markers_(std::move(login_markers)), sign_in_path_(std::move(sign_in_path)) {
}

bool PageMarkers::IsBusyText(std::string_view text) const {
  return util::ContainsAnyIgnoreCase(text, busy_markers_);
}

bool PageMarkers::IsBusy(browser::BrowserDriver& driver) const {
  try {
    if (IsBusyText(driver.PageSource())) {
      return true;
    }

    for (const auto& region : {Locator::ClassName("error-message"), Locator::ClassName("alert")}) {
      for (const auto& element : driver.FindElements(region)) {
        if (IsBusyText(driver.Text(element))) {
          return true;
        }
      }
    }
  } catch (const std::exception& e) {
    SLOTWATCH_LOG_DEBUG("busy check failed", {observability::StringField("error", e.what())});
  }
  return false;
}

bool PageMarkers::IsLoginPage(browser::BrowserDriver& driver) const {
  if (!sign_in_path_.empty() && util::Contains(driver.CurrentUrl(), sign_in_path_)) {
    return true;
  }

  if (!driver.FindElements(Locator::Id("sign_in_form")).empty()) {
    return true;
  }

  if (login_markers_.empty()) {
    return false;
  }
  const auto source = driver.PageSource();
  for (const auto& marker : login_markers_) {
    if (!util::Contains(source, marker)) {
      return false;
    }
  }
  return true;
}

} // namespace slotwatch::navigation
