#pragma once

#include <google/protobuf/struct.pb.h>

#include <memory>
#include <string>

#include "internal/browser/browser_driver.hpp"
#include "internal/browser/http_client.hpp"

namespace slotwatch::runtime::config {
class BrowserConfig;
}

namespace slotwatch::browser {

struct WebDriverOptions {
  std::string endpoint{"http://localhost:9515"};
  std::string browser_type{"chrome"};
  bool        headless = true;
  std::string binary_location;
  std::string user_agent;
  int         page_load_timeout_seconds = 60;

  static WebDriverOptions FromConfig(const slotwatch::runtime::config::BrowserConfig& config);
};

/*
  W3C WebDriver client for a chromedriver/geckodriver/msedgedriver endpoint.

  One instance owns one remote session; the session is created by the
  constructor and deleted by Quit() or the destructor.
*/
class WebDriverClient : public BrowserDriver {
 public:
  explicit WebDriverClient(WebDriverOptions options);
  ~WebDriverClient() override;

  const std::string& SessionId() const {
    return session_id_;
  }

  void        Navigate(const std::string& url) override;
  void        Refresh() override;
  std::string CurrentUrl() override;
  std::string Title() override;
  std::string PageSource() override;

  std::vector<Element> FindElements(const Locator& locator) override;
  std::vector<Element> FindChildren(const Element& parent, const Locator& locator) override;

  void Click(const Element& element) override;
  void ScriptClick(const Element& element) override;
  void Clear(const Element& element) override;
  void SendKeys(const Element& element, const std::string& text) override;
  void ScrollIntoView(const Element& element) override;

  std::string                Text(const Element& element) override;
  std::optional<std::string> Attribute(const Element& element, const std::string& name) override;
  bool                       IsSelected(const Element& element) override;
  bool                       IsDisplayed(const Element& element) override;
  bool                       IsEnabled(const Element& element) override;

  std::string Screenshot() override;

  void Quit() override;

 private:
  google::protobuf::Value Call(const std::string& method, const std::string& path, const google::protobuf::Struct* body = nullptr);
  google::protobuf::Value ExecuteScript(const std::string& script, const Element& element);

  std::string SessionPath(const std::string& suffix) const;
  std::string ElementPath(const Element& element, const std::string& suffix) const;

  google::protobuf::Struct BuildCapabilities() const;

  WebDriverOptions            options_;
  std::unique_ptr<HttpClient> http_;
  std::string                 session_id_;
};

} // namespace slotwatch::browser
