#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include "internal/config/paths.hpp"

namespace mprisrelay::config {

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

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

mprisrelay::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  mprisrelay::runtime::config::RuntimeConfig config;

  // An empty file is a valid "all defaults" config.
  if (yaml.IsNull()) {
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

  return config;
}

mprisrelay::runtime::config::RuntimeConfig ConfigLoader::Load(const std::string& path) {
  mprisrelay::runtime::config::RuntimeConfig config;

  if (!path.empty()) {
    config = LoadFromYaml(path);
  } else {
    const auto fallback = DefaultConfigPath();
    std::error_code ec;
    if (std::filesystem::exists(fallback, ec)) {
      config = LoadFromYaml(fallback.string());
    }
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(mprisrelay::runtime::config::RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->relay_address().empty()) server->set_relay_address("0.0.0.0:40051");
  if (server->pairing_address().empty()) server->set_pairing_address("0.0.0.0:40052");

  auto* credentials = config->mutable_credentials();
  if (credentials->path().empty() && !credentials->in_memory()) {
    credentials->set_path(DefaultCredentialsPath().string());
  }

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* pairing = config->mutable_pairing();
  if (pairing->confirmation_timeout_sec() == 0) pairing->set_confirmation_timeout_sec(60);
  if (pairing->max_sessions() == 0) pairing->set_max_sessions(4);
  if (pairing->sas_digits() == 0) pairing->set_sas_digits(6);
  if (pairing->confirmer().empty()) pairing->set_confirmer("console");

  auto* relay = config->mutable_relay();
  if (relay->max_outbound_events() == 0) relay->set_max_outbound_events(256);
  if (relay->auth_max_skew_sec() == 0) relay->set_auth_max_skew_sec(120);
  if (relay->command_timeout_ms() == 0) relay->set_command_timeout_ms(2000);

  auto* monitor = config->mutable_monitor();
  if (monitor->probe_attempts() == 0) monitor->set_probe_attempts(3);
  if (monitor->probe_backoff_ms() == 0) monitor->set_probe_backoff_ms(100);
  if (monitor->bus_connect_attempts() == 0) monitor->set_bus_connect_attempts(5);
  if (monitor->bus_retry_ms() == 0) monitor->set_bus_retry_ms(1000);
}

void ConfigLoader::Validate(const mprisrelay::runtime::config::RuntimeConfig& config) {
  const auto& pairing = config.pairing();
  if (pairing.sas_digits() < 4 || pairing.sas_digits() > 8) {
    throw std::runtime_error("Invalid configuration: pairing.sas_digits must be between 4 and 8");
  }
  if (pairing.confirmer() != "console" && pairing.confirmer() != "desktop") {
    throw std::runtime_error("Invalid configuration: pairing.confirmer must be 'console' or 'desktop'");
  }
  if (config.server().relay_address() == config.server().pairing_address()) {
    throw std::runtime_error("Invalid configuration: relay and pairing must listen on distinct addresses");
  }
  const auto& tls = config.server().tls();
  if (tls.cert_file().empty() != tls.key_file().empty()) {
    throw std::runtime_error("Invalid configuration: server.tls needs both cert_file and key_file");
  }
}

} // namespace mprisrelay::config
