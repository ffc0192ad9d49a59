#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace meshdispatch::config {

using meshdispatch::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("4403" for an address, not a number)
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

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
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

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

static void DefaultDuration(google::protobuf::Duration* d, std::int64_t seconds) {
  if (d->seconds() == 0 && d->nanos() == 0) {
    d->set_seconds(seconds);
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
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  if (yaml.IsNull()) {
    RuntimeConfig config;
    ApplyDefaults(config);
    return config;
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50061");
  }

  if (!config.database().has_sqlite() && !config.database().has_memory()) {
    auto* sqlite = config.mutable_database()->mutable_sqlite();
    sqlite->set_path("mesh_dispatch.db");
    sqlite->set_wal_mode(true);
  }

  auto* radio = config.mutable_radio();
  if (radio->has_tcp() && radio->tcp().port() == 0) {
    radio->mutable_tcp()->set_port(4403);
  }
  if (radio->has_serial() && radio->serial().baud() == 0) {
    radio->mutable_serial()->set_baud(115200);
  }
  DefaultDuration(radio->mutable_reconnect_interval(), 5);
  DefaultDuration(radio->mutable_write_timeout(), 2);
  if (radio->max_frame_bytes() == 0) {
    radio->set_max_frame_bytes(4096);
  }

  if (config.inbound().queue_capacity() == 0) {
    config.mutable_inbound()->set_queue_capacity(500);
  }

  auto* reliability = config.mutable_reliability();
  DefaultDuration(reliability->mutable_ack_timeout(), 45);
  if (reliability->backoff() == meshdispatch::runtime::config::BACKOFF_KIND_UNSPECIFIED) {
    reliability->set_backoff(meshdispatch::runtime::config::BACKOFF_KIND_FIXED);
  }
  if (reliability->backoff_multiplier() <= 0.0) {
    reliability->set_backoff_multiplier(2.0);
  }
  DefaultDuration(reliability->mutable_max_backoff(), 600);
  if (reliability->max_attempts() == 0) {
    reliability->set_max_attempts(5);
  }
  if (!reliability->has_scheduler_tick()) {
    reliability->mutable_scheduler_tick()->set_nanos(500'000'000);
  }
  DefaultDuration(reliability->mutable_recovery_delay(), 5);

  auto* units = config.mutable_units();
  DefaultDuration(units->mutable_offline_timeout(), 300);
  DefaultDuration(units->mutable_sweep_interval(), 30);
  if (units->arrival_proximity_meters() <= 0.0) {
    units->set_arrival_proximity_meters(50.0);
  }

  auto* geocoder = config.mutable_geocoder();
  if (geocoder->retries() == 0) {
    geocoder->set_retries(3);
  }
  DefaultDuration(geocoder->mutable_retry_base_delay(), 1);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  std::ostringstream problems;

  const auto& radio = config.radio();
  if (radio.has_tcp() && radio.tcp().host().empty()) {
    problems << "radio.tcp.host is required; ";
  }
  if (radio.has_tcp() && radio.tcp().port() > 65535) {
    problems << "radio.tcp.port out of range; ";
  }
  if (radio.has_serial() && radio.serial().device_path().empty()) {
    problems << "radio.serial.device_path is required; ";
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    problems << "database.sqlite.path is required; ";
  }
  if (config.reliability().backoff_multiplier() < 1.0) {
    problems << "reliability.backoff_multiplier must be >= 1; ";
  }

  const auto& base = config.units().base();
  if (base.lat() < -90.0 || base.lat() > 90.0 || base.lon() < -180.0 || base.lon() > 180.0) {
    problems << "units.base coordinates out of range; ";
  }

  for (const auto& entry : config.geocoder().gazetteer()) {
    if (entry.address().empty()) {
      problems << "geocoder.gazetteer entry without address; ";
    }
  }

  const auto message = problems.str();
  if (!message.empty()) {
    throw std::runtime_error("Invalid configuration: " + message);
  }
}

} // namespace meshdispatch::config
