#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace aff4::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static aff4::store::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  aff4::store::config::RuntimeConfig config;

  // an empty document is a valid, all-defaults config
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

aff4::store::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

aff4::store::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(aff4::store::config::RuntimeConfig& config) {
  if (config.database().backend_case() == aff4::store::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  if (config.flows().content_flow_name().empty()) {
    config.mutable_flows()->set_content_flow_name("MultiGetFile");
  }

  if (config.logging().level().empty()) {
    config.mutable_logging()->set_level("info");
  }
}

} // namespace aff4::config
