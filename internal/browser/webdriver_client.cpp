#include "internal/browser/webdriver_client.hpp"

#include <google/protobuf/util/json_util.h>

#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace slotwatch::browser {
namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

constexpr const char* kElementKey = "element-6066-11e4-a52e-4f735466cecf";

Value StringValue(const std::string& value) {
  Value result;
  result.set_string_value(value);
  return result;
}

Value NumberValue(double value) {
  Value result;
  result.set_number_value(value);
  return result;
}

Value ElementReference(const Element& element) {
  Value result;
  (*result.mutable_struct_value()->mutable_fields())[kElementKey] = StringValue(element.handle);
  return result;
}

// id and class name are not W3C strategies; both map onto css selectors.
std::pair<std::string, std::string> Strategy(const Locator& locator) {
  switch (locator.by) {
    case By::kId:
      return {"css selector", "[id=\"" + locator.value + "\"]"};
    case By::kClassName:
      return {"css selector", "." + locator.value};
    case By::kTagName:
      return {"css selector", locator.value};
    case By::kLinkText:
      return {"link text", locator.value};
    case By::kPartialLinkText:
      return {"partial link text", locator.value};
    case By::kXPath:
      return {"xpath", locator.value};
    case By::kCss:
    default:
      return {"css selector", locator.value};
  }
}

Struct LocatorBody(const Locator& locator) {
  const auto [strategy, value] = Strategy(locator);

  Struct body;
  (*body.mutable_fields())["using"] = StringValue(strategy);
  (*body.mutable_fields())["value"] = StringValue(value);
  return body;
}

std::vector<Element> ParseElements(const Value& value) {
  std::vector<Element> elements;
  for (const auto& item : value.list_value().values()) {
    const auto& fields = item.struct_value().fields();
    auto        it     = fields.find(kElementKey);
    if (it != fields.end()) {
      elements.push_back(Element{it->second.string_value()});
    }
  }
  return elements;
}

std::string ErrorText(const Value& value) {
  const auto& fields = value.struct_value().fields();
  std::string error;
  std::string message;
  if (auto it = fields.find("error"); it != fields.end()) {
    error = it->second.string_value();
  }
  if (auto it = fields.find("message"); it != fields.end()) {
    message = it->second.string_value();
  }
  if (error.empty() && message.empty()) {
    return "unknown webdriver error";
  }
  return error + ": " + message;
}

} // namespace

WebDriverOptions WebDriverOptions::FromConfig(const slotwatch::runtime::config::BrowserConfig& config) {
  WebDriverOptions options;
  if (!config.webdriver_url().empty()) {
    options.endpoint = config.webdriver_url();
  }
  if (!config.type().empty()) {
    options.browser_type = config.type();
  }
  options.headless        = !config.has_headless() || config.headless();
  options.binary_location = config.binary_location();
  options.user_agent      = config.user_agent();
  if (config.page_load_timeout_seconds() > 0) {
    options.page_load_timeout_seconds = config.page_load_timeout_seconds();
  }
  return options;
}

WebDriverClient::WebDriverClient(WebDriverOptions options)
    : options_(std::move(options)), http_(std::make_unique<HttpClient>(options_.page_load_timeout_seconds + 30)) {
  while (!options_.endpoint.empty() && options_.endpoint.back() == '/') {
    options_.endpoint.pop_back();
  }

  Struct body;
  *(*body.mutable_fields())["capabilities"].mutable_struct_value() = BuildCapabilities();

  auto value = Call("POST", "/session", &body);

  const auto& fields = value.struct_value().fields();
  auto        it     = fields.find("sessionId");
  if (it == fields.end() || it->second.string_value().empty()) {
    throw util::DriverError("webdriver did not return a session id");
  }
  session_id_ = it->second.string_value();

  Struct timeouts;
  (*timeouts.mutable_fields())["pageLoad"] = NumberValue(options_.page_load_timeout_seconds * 1000.0);
  try {
    Call("POST", SessionPath("/timeouts"), &timeouts);
  } catch (const util::DriverError& e) {
    SLOTWATCH_LOG_WARN("page load timeout not applied", {observability::StringField("error", e.what())});
  }

  SLOTWATCH_LOG_INFO("browser session created",
                     {observability::StringField("browser", options_.browser_type), observability::StringField("session", session_id_),
                      observability::BoolField("headless", options_.headless)});
}

WebDriverClient::~WebDriverClient() {
  try {
    Quit();
  } catch (const std::exception& e) {
    SLOTWATCH_LOG_WARN("browser session delete failed", {observability::StringField("error", e.what())});
  }
}

Struct WebDriverClient::BuildCapabilities() const {
  Value args;
  auto* list = args.mutable_list_value();
  if (options_.headless) {
    *list->add_values() = StringValue(options_.browser_type == "firefox" ? "-headless" : "--headless=new");
  }
  if (options_.browser_type != "firefox") {
    for (const char* arg : {"--no-sandbox", "--disable-dev-shm-usage", "--disable-gpu", "--window-size=1920,1080"}) {
      *list->add_values() = StringValue(arg);
    }
    if (!options_.user_agent.empty()) {
      *list->add_values() = StringValue("--user-agent=" + options_.user_agent);
    }
  }

  Struct browser_options;
  (*browser_options.mutable_fields())["args"] = args;
  if (!options_.binary_location.empty()) {
    (*browser_options.mutable_fields())["binary"] = StringValue(options_.binary_location);
  }

  std::string browser_name = "chrome";
  std::string options_key  = "goog:chromeOptions";
  if (options_.browser_type == "firefox") {
    browser_name = "firefox";
    options_key  = "moz:firefoxOptions";
  } else if (options_.browser_type == "edge") {
    browser_name = "MicrosoftEdge";
    options_key  = "ms:edgeOptions";
  }

  Struct always_match;
  (*always_match.mutable_fields())["browserName"] = StringValue(browser_name);
  *(*always_match.mutable_fields())[options_key].mutable_struct_value() = browser_options;

  Struct capabilities;
  *(*capabilities.mutable_fields())["alwaysMatch"].mutable_struct_value() = always_match;
  return capabilities;
}

std::string WebDriverClient::SessionPath(const std::string& suffix) const {
  return "/session/" + session_id_ + suffix;
}

std::string WebDriverClient::ElementPath(const Element& element, const std::string& suffix) const {
  return SessionPath("/element/" + element.handle + suffix);
}

Value WebDriverClient::Call(const std::string& method, const std::string& path, const Struct* body) {
  std::string payload;
  if (method != "GET") {
    payload = "{}";
    if (body != nullptr) {
      auto status = google::protobuf::util::MessageToJsonString(*body, &payload);
      if (!status.ok()) {
        throw util::DriverError("failed to encode webdriver request: " + std::string(status.message()));
      }
    }
  }

  auto response = http_->Request(method, options_.endpoint + path, payload);

  Struct envelope;
  if (!response.body.empty()) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(response.body, &envelope, options);
    if (!status.ok()) {
      throw util::DriverError("invalid webdriver response from " + path + ": " + std::string(status.message()));
    }
  }

  Value value;
  if (auto it = envelope.fields().find("value"); it != envelope.fields().end()) {
    value = it->second;
  }

  if (response.status < 200 || response.status >= 300) {
    throw util::DriverError("webdriver " + method + " " + path + " returned " + std::to_string(response.status) + ": " + ErrorText(value));
  }
  return value;
}

Value WebDriverClient::ExecuteScript(const std::string& script, const Element& element) {
  Struct body;
  (*body.mutable_fields())["script"] = StringValue(script);
  *(*body.mutable_fields())["args"].mutable_list_value()->add_values() = ElementReference(element);
  return Call("POST", SessionPath("/execute/sync"), &body);
}

void WebDriverClient::Navigate(const std::string& url) {
  Struct body;
  (*body.mutable_fields())["url"] = StringValue(url);
  Call("POST", SessionPath("/url"), &body);
}

void WebDriverClient::Refresh() {
  Call("POST", SessionPath("/refresh"));
}

std::string WebDriverClient::CurrentUrl() {
  return Call("GET", SessionPath("/url")).string_value();
}

std::string WebDriverClient::Title() {
  return Call("GET", SessionPath("/title")).string_value();
}

std::string WebDriverClient::PageSource() {
  return Call("GET", SessionPath("/source")).string_value();
}

std::vector<Element> WebDriverClient::FindElements(const Locator& locator) {
  auto body = LocatorBody(locator);
  return ParseElements(Call("POST", SessionPath("/elements"), &body));
}

std::vector<Element> WebDriverClient::FindChildren(const Element& parent, const Locator& locator) {
  auto body = LocatorBody(locator);
  return ParseElements(Call("POST", ElementPath(parent, "/elements"), &body));
}

void WebDriverClient::Click(const Element& element) {
  Call("POST", ElementPath(element, "/click"));
}

void WebDriverClient::ScriptClick(const Element& element) {
  ExecuteScript("arguments[0].click();", element);
}

void WebDriverClient::Clear(const Element& element) {
  Call("POST", ElementPath(element, "/clear"));
}

void WebDriverClient::SendKeys(const Element& element, const std::string& text) {
  Struct body;
  (*body.mutable_fields())["text"] = StringValue(text);
  Call("POST", ElementPath(element, "/value"), &body);
}

void WebDriverClient::ScrollIntoView(const Element& element) {
  ExecuteScript("arguments[0].scrollIntoView({block: 'center', inline: 'center'});", element);
}

std::string WebDriverClient::Text(const Element& element) {
  return Call("GET", ElementPath(element, "/text")).string_value();
}

std::optional<std::string> WebDriverClient::Attribute(const Element& element, const std::string& name) {
  auto value = Call("GET", ElementPath(element, "/attribute/" + name));
  if (value.kind_case() != Value::kStringValue) {
    return std::nullopt;
  }
  return value.string_value();
}

bool WebDriverClient::IsSelected(const Element& element) {
  return Call("GET", ElementPath(element, "/selected")).bool_value();
}

bool WebDriverClient::IsDisplayed(const Element& element) {
  return Call("GET", ElementPath(element, "/displayed")).bool_value();
}

bool WebDriverClient::IsEnabled(const Element& element) {
  return Call("GET", ElementPath(element, "/enabled")).bool_value();
}

std::string WebDriverClient::Screenshot() {
  try {
    return util::DecodeBase64(Call("GET", SessionPath("/screenshot")).string_value());
  } catch (const util::DriverError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::DriverError(std::string("invalid screenshot payload: ") + e.what());
  }
}

void WebDriverClient::Quit() {
  if (session_id_.empty()) {
    return;
  }
  const std::string path = SessionPath("");
  session_id_.clear();
  Call("DELETE", path);
}

} // namespace slotwatch::browser
