#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace slotwatch::browser {

enum class By : std::uint8_t {
  kId,
  kClassName,
  kCss,
  kTagName,
  kLinkText,
  kPartialLinkText,
  kXPath,
};

constexpr std::string_view ToString(By by) {
  switch (by) {
    case By::kId:
      return "id";
    case By::kClassName:
      return "class name";
    case By::kTagName:
      return "tag name";
    case By::kLinkText:
      return "link text";
    case By::kPartialLinkText:
      return "partial link text";
    case By::kXPath:
      return "xpath";
    case By::kCss:
    default:
      return "css selector";
  }
}

struct Locator {
  By          by = By::kCss;
  std::string value;

  static Locator Id(std::string value) {
    return {By::kId, std::move(value)};
  }
  static Locator ClassName(std::string value) {
    return {By::kClassName, std::move(value)};
  }
  static Locator Css(std::string value) {
    return {By::kCss, std::move(value)};
  }
  static Locator TagName(std::string value) {
    return {By::kTagName, std::move(value)};
  }
  static Locator LinkText(std::string value) {
    return {By::kLinkText, std::move(value)};
  }
  static Locator PartialLinkText(std::string value) {
    return {By::kPartialLinkText, std::move(value)};
  }

  std::string Describe() const {
    return std::string(ToString(by)) + "=" + value;
  }
};

// Opaque reference to an element of the current page.
struct Element {
  std::string handle;

  bool operator==(const Element& other) const {
    return handle == other.handle;
  }
};

/*
  Browser automation capability.

  Every call is a single round trip; waiting is layered on top (wait.hpp).
  Failures of the underlying driver throw util::DriverError; a reference to
  an element that is gone also surfaces as DriverError.
*/
class BrowserDriver {
 public:
  virtual ~BrowserDriver() = default;

  virtual void        Navigate(const std::string& url) = 0;
  virtual void        Refresh()                        = 0;
  virtual std::string CurrentUrl()                     = 0;
  virtual std::string Title()                          = 0;
  virtual std::string PageSource()                     = 0;

  virtual std::vector<Element> FindElements(const Locator& locator)                         = 0;
  virtual std::vector<Element> FindChildren(const Element& parent, const Locator& locator) = 0;

  virtual void Click(const Element& element)                               = 0;
  virtual void ScriptClick(const Element& element)                         = 0;
  virtual void Clear(const Element& element)                               = 0;
  virtual void SendKeys(const Element& element, const std::string& text)   = 0;
  virtual void ScrollIntoView(const Element& element)                      = 0;

  virtual std::string                Text(const Element& element)                                = 0;
  virtual std::optional<std::string> Attribute(const Element& element, const std::string& name) = 0;
  virtual bool                       IsSelected(const Element& element)                          = 0;
  virtual bool                       IsDisplayed(const Element& element)                         = 0;
  virtual bool                       IsEnabled(const Element& element)                           = 0;

  // PNG bytes of the current viewport.
  virtual std::string Screenshot() = 0;

  virtual void Quit() = 0;
};

using DriverFactory = std::function<std::unique_ptr<BrowserDriver>()>;

} // namespace slotwatch::browser
