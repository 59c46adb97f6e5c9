#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace routebroker::config {

using routebroker::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress     = "0.0.0.0:50051";
constexpr double      kDefaultToleranceNm     = 1.0;
constexpr const char* kDefaultStatusUrlPrefix = "/api/route/";
constexpr uint32_t    kDefaultWorkerThreads   = 2;
constexpr uint32_t    kDefaultImportInterval  = 600;
constexpr uint32_t    kDefaultMaxFinished     = 10000;

} // namespace

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
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  // an empty document is an empty config
  if (json_value.has_null_value()) {
    json_value.mutable_struct_value();
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
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

  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (config.database().backend_case() == routebroker::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* routing = config.mutable_routing();
  if (routing->waypoint_distance_tolerance_nm() == 0.0) {
    routing->set_waypoint_distance_tolerance_nm(kDefaultToleranceNm);
  }
  if (routing->status_url_prefix().empty()) {
    routing->set_status_url_prefix(kDefaultStatusUrlPrefix);
  }

  if (config.mesh_import().interval_sec() == 0) {
    config.mutable_mesh_import()->set_interval_sec(kDefaultImportInterval);
  }

  if (config.computation_workers().threads() == 0) {
    config.mutable_computation_workers()->set_threads(kDefaultWorkerThreads);
  }
  if (config.computation_workers().max_finished_tasks() == 0) {
    config.mutable_computation_workers()->set_max_finished_tasks(kDefaultMaxFinished);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.routing().waypoint_distance_tolerance_nm() < 0.0) {
    throw std::runtime_error("Invalid configuration: routing.waypoint_distance_tolerance_nm must be positive");
  }

  if (config.mesh_import().enabled() && config.mesh_import().mesh_dir().empty()) {
    throw std::runtime_error("Invalid configuration: mesh_import.mesh_dir is required when mesh_import.enabled is set");
  }

  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
}

} // namespace routebroker::config
