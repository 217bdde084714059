#include "config_loader.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace slotwatch::config {

using slotwatch::runtime::config::RuntimeConfig;

using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;

static void YamlToProtoValue(const YAML::Node& node, const FieldDescriptor* field, const Descriptor* message, google::protobuf::Value* value);

// Accepts the proto name and the lowerCamel JSON name.
static const FieldDescriptor* FindField(const Descriptor* message, const std::string& key) {
  if (message == nullptr) {
    return nullptr;
  }
  if (const auto* field = message->FindFieldByName(key)) {
    return field;
  }
  return message->FindFieldByCamelcaseName(key);
}

static const Descriptor* MessageOf(const FieldDescriptor* field) {
  return field != nullptr && field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE ? field->message_type() : nullptr;
}

static void SetScalarValue(const YAML::Node& node, const FieldDescriptor* field, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and are always strings;
  // plain scalars bound for a string field are kept as written
  if (node.Tag() == "!" || (field != nullptr && field->cpp_type() == FieldDescriptor::CPPTYPE_STRING)) {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, const FieldDescriptor* field, const Descriptor* message, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, field, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], field, message, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();

      // map fields: every entry takes the map's value type
      if (field != nullptr && field->is_map()) {
        const auto* value_field = field->message_type()->map_value();
        for (auto it : node) {
          YamlToProtoValue(it.second, value_field, MessageOf(value_field), &(*struct_value->mutable_fields())[it.first.Scalar()]);
        }
        break;
      }

      for (auto it : node) {
        const auto  key       = it.first.Scalar();
        const auto* sub_field = FindField(message, key);
        YamlToProtoValue(it.second, sub_field, MessageOf(sub_field), &(*struct_value->mutable_fields())[key]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, nullptr, RuntimeConfig::descriptor(), &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* monitoring = config.mutable_monitoring();
  if (monitoring->check_interval_seconds() <= 0) {
    monitoring->set_check_interval_seconds(300);
  }
  if (monitoring->error_retry_interval_seconds() <= 0) {
    monitoring->set_error_retry_interval_seconds(60);
  }

  auto* browser = config.mutable_browser();
  if (browser->type().empty()) {
    browser->set_type("chrome");
  }
  if (!browser->has_headless()) {
    browser->set_headless(true);
  }
  if (browser->webdriver_url().empty()) {
    browser->set_webdriver_url("http://localhost:9515");
  }
  if (browser->page_load_timeout_seconds() <= 0) {
    browser->set_page_load_timeout_seconds(60);
  }

  auto* debug = config.mutable_debug();
  if (debug->email_interval_seconds() <= 0) {
    debug->set_email_interval_seconds(300);
  }

  auto* gmail = config.mutable_notification()->mutable_gmail();
  if (gmail->smtp_url().empty()) {
    gmail->set_smtp_url("smtp://smtp.gmail.com:587");
  }

  auto* site = config.mutable_site();
  if (site->base_url().empty()) {
    site->set_base_url("https://ais.usvisa-info.com/en-ca/niv");
  }
  if (site->sign_in_path().empty()) {
    site->set_sign_in_path("/users/sign_in");
  }
  if (site->post_login_url_pattern().empty()) {
    site->set_post_login_url_pattern("/groups/");
  }
  if (site->card_identifier_label().empty()) {
    site->set_card_identifier_label("IVR Account Number: ");
  }
  if (site->continue_text().empty()) {
    site->set_continue_text("Continue");
  }
  if (site->reschedule_phrase().empty()) {
    site->set_reschedule_phrase("Reschedule Appointment");
  }
  if (site->busy_markers().empty()) {
    for (const char* marker : {"system is busy", "please try again later", "system busy", "try again later"}) {
      site->add_busy_markers(marker);
    }
  }
  if (site->login_markers().empty()) {
    for (const char* marker : {"user_email", "user_password"}) {
      site->add_login_markers(marker);
    }
  }

  auto* navigation = config.mutable_navigation();
  if (navigation->element_wait_ms() <= 0) {
    navigation->set_element_wait_ms(5000);
  }
  if (navigation->page_wait_ms() <= 0) {
    navigation->set_page_wait_ms(10000);
  }
  if (navigation->card_wait_ms() <= 0) {
    navigation->set_card_wait_ms(20000);
  }
  if (navigation->login_redirect_wait_ms() <= 0) {
    navigation->set_login_redirect_wait_ms(10000);
  }
  if (navigation->settle_delay_ms() <= 0) {
    navigation->set_settle_delay_ms(500);
  }
  if (navigation->post_click_delay_ms() <= 0) {
    navigation->set_post_click_delay_ms(1000);
  }
  if (navigation->poll_interval_ms() <= 0) {
    navigation->set_poll_interval_ms(250);
  }

  auto* storage = config.mutable_storage();
  if (storage->state_dir().empty()) {
    storage->set_state_dir("state");
  }
  if (storage->logs_dir().empty()) {
    storage->set_logs_dir("logs");
  }

  // a user entry without an email is keyed by the map key
  for (auto& [key, user] : *config.mutable_users()) {
    if (user.email().empty()) {
      user.set_email(key);
    }
  }
}

} // namespace slotwatch::config
