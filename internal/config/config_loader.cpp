#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <spdlog/common.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/model/resource_type.hpp"

namespace draftstore::config {

using draftstore::runtime::config::RuntimeConfig;

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

  return config;
}

static void ApplyEnvironmentOverrides(RuntimeConfig& config) {
  if (const char* path = std::getenv("DRAFTSTORE_SQLITE_PATH")) {
    config.mutable_database()->mutable_sqlite()->set_path(path);
  }
}

static model::DependencyRule ParseRule(const draftstore::runtime::config::DependencyRule& rule) {
  auto parent = model::ParseResourceTypeTag(rule.parent());
  auto child  = model::ParseResourceTypeTag(rule.child());
  if (!parent) {
    throw std::runtime_error("Invalid configuration: unknown resource type '" + rule.parent() + "'");
  }
  if (!child) {
    throw std::runtime_error("Invalid configuration: unknown resource type '" + rule.child() + "'");
  }
  return {*parent, *child};
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

  auto config = ParseYamlNode(yaml);
  ApplyEnvironmentOverrides(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseYamlNode(yaml);
  ApplyEnvironmentOverrides(config);
  Validate(config);
  return config;
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& db = config.database();
  switch (db.backend_case()) {
    case draftstore::runtime::config::DatabaseConfig::kSqlite:
      if (db.sqlite().path().empty()) {
        throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
      }
      break;
    case draftstore::runtime::config::DatabaseConfig::kPostgres:
      if (db.postgres().connection_uri().empty()) {
        throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
      }
      break;
    default:
      break;
  }

  if (!config.logging().level().empty() &&
      spdlog::level::from_str(config.logging().level()) == spdlog::level::off && config.logging().level() != "off") {
    throw std::runtime_error("Invalid configuration: unknown logging.level '" + config.logging().level() + "'");
  }

  for (const auto& rule : config.versioning().dependency_rules()) {
    ParseRule(rule);
  }
}

std::vector<model::DependencyRule> ConfigLoader::DependencyRules(const RuntimeConfig& config) {
  if (config.versioning().dependency_rules().empty()) {
    return model::DefaultDependencyRules();
  }

  std::vector<model::DependencyRule> rules;
  rules.reserve(config.versioning().dependency_rules_size());
  for (const auto& rule : config.versioning().dependency_rules()) {
    rules.push_back(ParseRule(rule));
  }
  return rules;
}

} // namespace draftstore::config
