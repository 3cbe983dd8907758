#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>
#include <stdexcept>

namespace orchestrator::config {

using orchestrator::runtime::config::RuntimeConfig;

namespace {

// Expands ${NAME} and ${NAME:-fallback} from the environment. An unset
// variable without a fallback is an error rather than an empty string.
std::string ExpandEnv(const std::string& text) {
  std::string out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto open = text.find("${", pos);
    if (open == std::string::npos) {
      out.append(text, pos, std::string::npos);
      break;
    }
    const auto close = text.find('}', open + 2);
    if (close == std::string::npos) {
      throw std::runtime_error("unterminated ${ in config value: " + text);
    }
    out.append(text, pos, open - pos);

    const std::string body     = text.substr(open + 2, close - open - 2);
    const auto        sep      = body.find(":-");
    const std::string name     = body.substr(0, sep);
    const char*       variable = std::getenv(name.c_str());
    if (variable != nullptr && *variable != '\0') {
      out.append(variable);
    } else if (sep != std::string::npos) {
      out.append(body, sep + 2, std::string::npos);
    } else {
      throw std::runtime_error("config references unset environment variable " + name);
    }
    pos = close + 1;
  }
  return out;
}

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string scalar = ExpandEnv(node.Scalar());

  // Quoted scalars are always strings: port: "8080" stays "8080".
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }
  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end != nullptr && *end == '\0') {
    value->set_number_value(number);
    return;
  }
  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      return;
    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      return;
    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) YamlToProtoValue(item, list->add_values());
      return;
    }
    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) YamlToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      return;
    }
    default:
      throw std::runtime_error("unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(json_value, &json); !status.ok()) {
    throw std::runtime_error("config: YAML to JSON failed: " + std::string(status.message()));
  }

  RuntimeConfig                            config;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw std::runtime_error("config: " + std::string(status.message()));
  }
  return config;
}

void RequireNonNegative(const google::protobuf::Duration& duration, const char* field) {
  if (duration.seconds() < 0 || duration.nanos() < 0) {
    throw std::invalid_argument(std::string(field) + " must not be negative");
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("config: cannot load " + path + ": " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("config: cannot parse YAML: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::invalid_argument("database.postgres.connection_uri is required");
  }

  const auto& policy = config.scheduler().placement_policy();
  if (!policy.empty() && policy != "least_loaded" && policy != "round_robin") {
    throw std::invalid_argument("scheduler.placement_policy must be least_loaded or round_robin, got " + policy);
  }

  RequireNonNegative(config.server().shutdown_grace(), "server.shutdown_grace");
  RequireNonNegative(config.leases().heartbeat_interval(), "leases.heartbeat_interval");
  RequireNonNegative(config.leases().lease_duration(), "leases.lease_duration");
  RequireNonNegative(config.leases().sweep_interval(), "leases.sweep_interval");
  RequireNonNegative(config.scheduler().placement_timeout(), "scheduler.placement_timeout");
  RequireNonNegative(config.router().wait_timeout(), "router.wait_timeout");
  RequireNonNegative(config.router().drain_grace(), "router.drain_grace");
  RequireNonNegative(config.retention().terminal_retention(), "retention.terminal_retention");

  if (config.has_leases() && config.leases().has_lease_duration() && config.leases().has_heartbeat_interval()) {
    using google::protobuf::util::TimeUtil;
    const auto lease_ms     = TimeUtil::DurationToMilliseconds(config.leases().lease_duration());
    const auto heartbeat_ms = TimeUtil::DurationToMilliseconds(config.leases().heartbeat_interval());
    if (lease_ms > 0 && lease_ms <= heartbeat_ms) {
      throw std::invalid_argument("leases.lease_duration must exceed leases.heartbeat_interval");
    }
  }
}

} // namespace orchestrator::config
