#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <stdexcept>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace optimist::config {

using optimist::runtime::config::RuntimeConfig;

namespace {

constexpr std::chrono::milliseconds kDefaultHoldDelay{1000};
constexpr std::chrono::milliseconds kDefaultScenarioTimeout{60000};
constexpr std::chrono::milliseconds kDefaultStatementTimeout{10000};
constexpr std::chrono::milliseconds kDefaultLockTimeout{5000};
constexpr uint32_t                  kDefaultMaxConnections = 16;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
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
  }
}

RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  // an empty document is a valid, all-defaults config
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

void DefaultDuration(google::protobuf::Duration* d, std::chrono::milliseconds fallback) {
  if (util::IsZero(*d)) {
    *d = util::FromMillis(fallback);
  }
}

} // namespace

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
  auto* database = config.mutable_database();
  if (database->backend_case() == optimist::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  DefaultDuration(database->mutable_statement_timeout(), kDefaultStatementTimeout);
  DefaultDuration(database->mutable_lock_timeout(), kDefaultLockTimeout);

  if (database->has_postgres()) {
    auto* pg = database->mutable_postgres();
    if (pg->schema().empty()) pg->set_schema("optimist");
    if (pg->max_connections() == 0) pg->set_max_connections(kDefaultMaxConnections);
  }

  auto* scenario = config.mutable_scenario();
  if (scenario->isolation_level() == optimist::runtime::config::ISOLATION_LEVEL_UNSPECIFIED) {
    scenario->set_isolation_level(optimist::runtime::config::ISOLATION_LEVEL_READ_COMMITTED);
  }
  if (scenario->hold_mode() == optimist::runtime::config::HOLD_MODE_UNSPECIFIED) {
    scenario->set_hold_mode(optimist::runtime::config::HOLD_MODE_HOLD_FIRST_TRANSACTION);
  }
  // hold_delay of zero is meaningful only when written explicitly; proto3 cannot
  // tell the difference, so an unset delay takes the default
  if (!scenario->has_hold_delay()) {
    *scenario->mutable_hold_delay() = util::FromMillis(kDefaultHoldDelay);
  }
  DefaultDuration(scenario->mutable_timeout(), kDefaultScenarioTimeout);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path must be set");
  }
  if (database.has_sqlite() && database.sqlite().path() == ":memory:") {
    throw std::runtime_error("Invalid configuration: database.sqlite.path must name a file; transactions use separate connections");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri must be set");
  }

  if (util::ToMillis(database.statement_timeout()).count() <= 0) {
    throw std::runtime_error("Invalid configuration: database.statement_timeout must be positive");
  }
  if (util::ToMillis(database.lock_timeout()).count() <= 0) {
    throw std::runtime_error("Invalid configuration: database.lock_timeout must be positive");
  }

  const auto& scenario = config.scenario();
  if (util::ToMillis(scenario.hold_delay()).count() < 0) {
    throw std::runtime_error("Invalid configuration: scenario.hold_delay must not be negative");
  }
  if (util::ToMillis(scenario.timeout()).count() <= 0) {
    throw std::runtime_error("Invalid configuration: scenario.timeout must be positive");
  }
  if (util::ToMillis(scenario.hold_delay()) >= util::ToMillis(scenario.timeout())) {
    throw std::runtime_error("Invalid configuration: scenario.hold_delay must be shorter than scenario.timeout");
  }
  if (!scenario.primary_key().empty()) {
    try {
      util::FromString(scenario.primary_key());
    } catch (const std::invalid_argument&) {
      throw std::runtime_error("Invalid configuration: scenario.primary_key must be a UUID");
    }
  }
}

} // namespace optimist::config
