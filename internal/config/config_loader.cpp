#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <cstdint>

#include "internal/util/errors.hpp"

namespace adrgen::config {

using adrgen::util::ConfigError;

static constexpr const char* kDefaultDirectory     = "docs/adr";
static constexpr const char* kDefaultIndexFile     = "README.md";
static constexpr const char* kDefaultTemplateFile  = "template.md";
static constexpr const char* kDefaultIndexHeading  = "Architecture Decision Records";
static constexpr uint32_t    kDefaultSequenceWidth = 3;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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
      throw ConfigError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

adrgen::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  adrgen::runtime::config::RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(adrgen::runtime::config::RuntimeConfig* config) {
  auto* store = config->mutable_store();
  if (store->directory().empty()) {
    store->set_directory(kDefaultDirectory);
  }
  if (store->index_file().empty()) {
    store->set_index_file(kDefaultIndexFile);
  }
  if (store->template_file().empty()) {
    store->set_template_file(kDefaultTemplateFile);
  }
  if (store->sequence_width() == 0) {
    store->set_sequence_width(kDefaultSequenceWidth);
  }
  if (store->index_heading().empty()) {
    store->set_index_heading(kDefaultIndexHeading);
  }
}

void ConfigLoader::ApplyEnvironment(adrgen::runtime::config::RuntimeConfig* config) {
  if (const char* dir = std::getenv("ADRGEN_DIR")) {
    if (*dir != '\0') {
      config->mutable_store()->set_directory(dir);
    }
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

adrgen::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  adrgen::runtime::config::RuntimeConfig config;

  // An empty document means "all defaults".
  if (yaml.IsNull()) {
    ApplyDefaults(&config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  return config;
}

} // namespace adrgen::config
