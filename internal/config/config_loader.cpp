#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace artifact::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings: version: "1.20"
  if (node.Tag() == "!") {
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

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

artifact::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  artifact::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

void ConfigLoader::Validate(const artifact::runtime::config::RuntimeConfig& config) {
  if (config.node().id().empty()) {
    throw std::runtime_error("Invalid configuration: node.id is required");
  }

  const auto& role = config.node().role();
  if (role != "primary" && role != "follower") {
    throw std::runtime_error("Invalid configuration: node.role must be primary or follower, got '" + role + "'");
  }

  if (role == "primary" && config.artifact().source_dir().empty()) {
    throw std::runtime_error("Invalid configuration: artifact.source_dir is required on the primary");
  }

  if (config.coordination().target_version().empty()) {
    throw std::runtime_error("Invalid configuration: coordination.target_version is required");
  }

  const auto& storage = config.shared_storage();
  if (storage.enabled() && storage.root_path().empty()) {
    throw std::runtime_error("Invalid configuration: shared_storage.root_path is required when shared storage is enabled");
  }
  if (!storage.enabled() && storage.local_root_path().empty()) {
    throw std::runtime_error("Invalid configuration: shared_storage.local_root_path is required when shared storage is disabled");
  }

  if (config.service().name().empty()) {
    throw std::runtime_error("Invalid configuration: service.name is required");
  }

  const auto negative = [](const google::protobuf::Duration& d) { return d.seconds() < 0 || d.nanos() < 0; };
  if (negative(config.lock().stale_after()) || negative(config.coordination().wait_timeout()) || negative(config.coordination().poll_initial()) ||
      negative(config.coordination().poll_max()) || negative(config.upgrade().ready_timeout()) ||
      negative(config.upgrade().complete_grace_period()) || negative(config.service().op_timeout()) ||
      negative(config.runtime().reconcile_interval())) {
    throw std::runtime_error("Invalid configuration: durations must not be negative");
  }
}

} // namespace artifact::config
