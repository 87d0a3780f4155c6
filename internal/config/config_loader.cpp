#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

#include "internal/businessdate/business_date.hpp"
#include "internal/recovery/recovery_manager.hpp"
#include "internal/util/errors.hpp"

namespace resync::config {

using resync::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific tag "!" and always stay strings
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
      throw util::ConfigError("Unsupported YAML node");
  }
}

static RuntimeConfig ParseDocument(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::ConfigError("Invalid configuration: " + std::string(status.message()));
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
    throw util::ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseDocument(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& document) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(document);
  } catch (const std::exception& e) {
    throw util::ConfigError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseDocument(yaml);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

#define RESYNC_DEFAULT(msg, field, value) \
  if ((msg)->field() == 0) (msg)->set_##field(value)

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* node = config.mutable_node();
  if (node->node_id().empty()) node->set_node_id("resync-node");
  if (node->role() == resync::runtime::config::NODE_ROLE_UNSPECIFIED) node->set_role(resync::runtime::config::NODE_ROLE_TERMINAL);

  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50051");

  if (!config.database().has_sqlite() && !config.database().has_postgres() && !config.database().has_memory()) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_postgres()) {
    RESYNC_DEFAULT(config.mutable_database()->mutable_postgres(), max_connections, 8);
  }

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
  RESYNC_DEFAULT(logging, max_file_size_mb, 16);
  RESYNC_DEFAULT(logging, max_files, 4);

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) observability->set_service_name("resync");
  RESYNC_DEFAULT(observability, collection_interval_ms, 10000);

  auto* connectivity = config.mutable_connectivity();
  RESYNC_DEFAULT(connectivity, cloud_heartbeat_interval_ms, 15000);
  RESYNC_DEFAULT(connectivity, relay_heartbeat_interval_ms, 10000);
  RESYNC_DEFAULT(connectivity, missed_heartbeat_threshold, 3);
  RESYNC_DEFAULT(connectivity, heartbeat_timeout_ms, 2000);
  RESYNC_DEFAULT(connectivity, tick_interval_ms, 1000);
  for (auto& peripheral : *connectivity->mutable_peripherals()) {
    RESYNC_DEFAULT(&peripheral, heartbeat_interval_ms, 10000);
  }

  auto* fiscal = config.mutable_fiscal();
  RESYNC_DEFAULT(fiscal, tick_interval_ms, 60000);
  RESYNC_DEFAULT(fiscal, max_iterations, 30);

  auto* replay = config.mutable_replay();
  RESYNC_DEFAULT(replay, tick_interval_ms, 5000);
  RESYNC_DEFAULT(replay, batch_size, 10);
  RESYNC_DEFAULT(replay, dispatch_timeout_ms, 5000);

  auto* recovery = config.mutable_recovery();
  RESYNC_DEFAULT(recovery, max_recovery_attempts, 3);
  RESYNC_DEFAULT(recovery, recovery_backoff_ms, 1000);
  RESYNC_DEFAULT(recovery, health_check_interval_ms, 30000);
  if (!recovery->has_auto_recovery_enabled()) recovery->set_auto_recovery_enabled(true);
  auto* breaker = recovery->mutable_circuit_breaker();
  RESYNC_DEFAULT(breaker, failure_threshold, 3);
  RESYNC_DEFAULT(breaker, recovery_time_ms, 30000);
  RESYNC_DEFAULT(breaker, half_open_max_attempts, 2);

  auto* locks = config.mutable_locks();
  RESYNC_DEFAULT(locks, flush_timeout_ms, 5000);
  RESYNC_DEFAULT(locks, presence_heartbeat_interval_ms, 10000);
  RESYNC_DEFAULT(locks, presence_missed_threshold, 3);

  for (auto& property : *config.mutable_properties()) {
    if (property.timezone().empty()) property.set_timezone(businessdate::kDefaultTimezone);
    if (property.rollover_time().empty()) property.set_rollover_time(businessdate::kDefaultRolloverTime);
    if (property.rollover_mode().empty()) property.set_rollover_mode("auto");
    if (property.name().empty()) property.set_name(property.id());
  }
}

#undef RESYNC_DEFAULT

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::ConfigError("database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw util::ConfigError("database.postgres.connection_uri is required");
  }

  if (config.recovery().max_recovery_attempts() > recovery::kMaxRecoveryAttempts) {
    throw util::ConfigError("recovery.max_recovery_attempts must be at most " + std::to_string(recovery::kMaxRecoveryAttempts));
  }

  std::set<std::string> peripheral_names;
  for (const auto& peripheral : config.connectivity().peripherals()) {
    if (peripheral.name().empty() || peripheral.address().empty()) {
      throw util::ConfigError("connectivity.peripherals entries need a name and an address");
    }
    if (!peripheral_names.insert(peripheral.name()).second) {
      throw util::ConfigError("duplicate peripheral '" + peripheral.name() + "'");
    }
  }

  for (const auto& manager : config.locks().managers()) {
    if (manager.employee_id().empty() || manager.pin().empty()) {
      throw util::ConfigError("locks.managers entries need an employee_id and a pin");
    }
  }

  std::set<std::string> property_ids;
  for (const auto& property : config.properties()) {
    if (!property_ids.insert(property.id()).second) {
      throw util::ConfigError("duplicate property '" + property.id() + "'");
    }
    businessdate::ValidateProperty(PropertyFromConfig(property));
  }
}

db::model::PropertyRecord PropertyFromConfig(const resync::runtime::config::PropertyConfig& property) {
  db::model::PropertyRecord record;
  record.id                    = property.id();
  record.name                  = property.name();
  record.timezone              = property.timezone();
  record.rollover_time         = property.rollover_time();
  record.current_business_date = property.current_business_date();
  record.allow_pm_rollover     = property.allow_pm_rollover();
  record.auto_clock_out        = property.auto_clock_out();

  if (property.rollover_mode().empty() || property.rollover_mode() == "auto") {
    record.rollover_mode = resync::v1::ROLLOVER_MODE_AUTO;
  } else if (property.rollover_mode() == "manual") {
    record.rollover_mode = resync::v1::ROLLOVER_MODE_MANUAL;
  } else {
    throw util::ConfigError("property '" + property.id() + "': rollover_mode must be auto or manual, got '" + property.rollover_mode() + "'");
  }

  businessdate::ApplyPropertyDefaults(record);
  return record;
}

} // namespace resync::config
