#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace asqueue::config {

namespace {

constexpr uint32_t kDefaultBatchSize      = 100;
constexpr uint32_t kDefaultPollIntervalMs = 1000;
constexpr uint32_t kDefaultBusyTimeoutMs  = 5000;
constexpr uint32_t kDefaultMaxConnections = 16;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
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

asqueue::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  asqueue::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

void ConfigLoader::Validate(asqueue::runtime::config::RuntimeConfig& config) {
  auto* database = config.mutable_database();
  if (database->has_sqlite()) {
    if (database->sqlite().path().empty()) {
      throw std::runtime_error("Invalid configuration: database.sqlite.path must be set");
    }
    if (!database->sqlite().has_wal_mode()) {
      database->mutable_sqlite()->set_wal_mode(true);
    }
    if (database->sqlite().busy_timeout_ms() == 0) {
      database->mutable_sqlite()->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
    }
  } else if (database->has_postgres()) {
    if (database->postgres().connection_uri().empty()) {
      throw std::runtime_error("Invalid configuration: database.postgres.connection_uri must be set");
    }
    if (database->postgres().max_connections() == 0) {
      database->mutable_postgres()->set_max_connections(kDefaultMaxConnections);
    }
  }

  auto* queue = config.mutable_queue();
  if (queue->batch_size() == 0) {
    queue->set_batch_size(kDefaultBatchSize);
  }
  if (queue->poll_interval_ms() == 0) {
    queue->set_poll_interval_ms(kDefaultPollIntervalMs);
  }
}

} // namespace asqueue::config
