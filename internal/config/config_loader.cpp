#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace fieldgate::config {

using fieldgate::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1" must not become a number)
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
// Defaults / validation
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  auto* device = config.mutable_device();
  if (device->transport().empty()) device->set_transport("simulated");

  auto* endpoint = device->mutable_endpoint();
  if (endpoint->host().empty()) endpoint->set_host("127.0.0.1");
  if (endpoint->connect_timeout_ms() == 0) endpoint->set_connect_timeout_ms(5000);

  auto* read_retry = device->mutable_read_retry();
  if (read_retry->max_attempts() == 0) read_retry->set_max_attempts(2);
  if (read_retry->delay_ms() == 0) read_retry->set_delay_ms(2000);

  auto* reconnect = device->mutable_reconnect();
  if (reconnect->max_attempts() == 0) reconnect->set_max_attempts(3);
  if (reconnect->backoff_ms() == 0) reconnect->set_backoff_ms(1000);
  if (reconnect->error_threshold() == 0) reconnect->set_error_threshold(3);

  auto* polling = config.mutable_polling();
  if (polling->interval_ms() == 0) polling->set_interval_ms(5000);

  auto* batch = config.mutable_batch();
  if (batch->cycle_threshold() == 0) batch->set_cycle_threshold(12);
  if (batch->max_age_ms() == 0) batch->set_max_age_ms(batch->cycle_threshold() * polling->interval_ms() * 2);
  if (batch->max_points() == 0) batch->set_max_points(500);
  if (batch->check_interval_ms() == 0) batch->set_check_interval_ms(1000);
  if (batch->measurement().empty()) batch->set_measurement("sensor_data");

  auto* store = config.mutable_store();
  if (store->backend_case() == fieldgate::runtime::config::StoreConfig::BACKEND_NOT_SET) store->mutable_memory();
  if (store->write_timeout_ms() == 0) store->set_write_timeout_ms(30000);

  auto* overflow = config.mutable_overflow();
  if (overflow->path().empty()) overflow->set_path("data/overflow.db");
  if (overflow->capacity() == 0) overflow->set_capacity(100000);
  if (overflow->replay_interval_ms() == 0) overflow->set_replay_interval_ms(60000);
  if (overflow->replay_batch_size() == 0) overflow->set_replay_batch_size(100);

  auto* realtime = config.mutable_realtime();
  if (realtime->push_interval_ms() == 0) realtime->set_push_interval_ms(1000);
  if (realtime->heartbeat_timeout_ms() == 0) realtime->set_heartbeat_timeout_ms(45000);
  if (realtime->reap_interval_ms() == 0) realtime->set_reap_interval_ms(10000);
  if (realtime->write_timeout_ms() == 0) realtime->set_write_timeout_ms(5000);
  if (realtime->max_pending_messages() == 0) realtime->set_max_pending_messages(8);
  if (realtime->source().empty()) realtime->set_source(device->transport() == "simulated" ? "mock" : "plc");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  using util::InvalidConfig;

  if (config.device().transport() != "simulated") {
    throw InvalidConfig("device.transport '" + config.device().transport() + "' is not built in (supported: simulated)");
  }

  if (config.blocks().empty()) {
    throw InvalidConfig("at least one register block must be configured");
  }

  for (const auto& block : config.blocks()) {
    if (block.size() == 0) {
      throw InvalidConfig("block " + std::to_string(block.block_id()) + " has size 0");
    }
    if (block.devices().empty()) {
      throw InvalidConfig("block " + std::to_string(block.block_id()) + " has no devices");
    }
  }

  if (config.realtime().heartbeat_timeout_ms() <= config.realtime().reap_interval_ms()) {
    throw InvalidConfig("realtime.heartbeat_timeout_ms must exceed realtime.reap_interval_ms");
  }

  if (config.realtime().push_interval_ms() >= config.polling().interval_ms()) {
    throw InvalidConfig("realtime.push_interval_ms must be shorter than polling.interval_ms");
  }

  if (config.store().has_sqlite() && config.store().sqlite().path().empty()) {
    throw InvalidConfig("store.sqlite.path is required");
  }
  if (config.store().has_postgres() && config.store().postgres().connection_uri().empty()) {
    throw InvalidConfig("store.postgres.connection_uri is required");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidConfig("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace fieldgate::config
