#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace planner::config {

namespace {

constexpr std::uint32_t kDefaultUnresponsiveSecs   = 25;
constexpr std::uint32_t kDefaultStaleSecs          = 60;
constexpr std::uint32_t kDefaultSweepIntervalMs    = 5000;
constexpr std::uint32_t kDefaultPingIntervalSecs   = 30;
constexpr std::uint32_t kDefaultCallbackTimeoutMs  = 2000;
constexpr std::uint32_t kDefaultSnapshotEvery      = 50;
constexpr std::uint32_t kDefaultChannelCapacity    = 64;
constexpr std::uint32_t kDefaultMaxRetries         = 2;
constexpr std::uint64_t kDefaultBackoffSecs        = 5;
constexpr std::uint32_t kDefaultRpcTimeoutMs       = 5000;
constexpr std::uint32_t kDefaultHeartbeatEverySecs = 5;
constexpr std::uint32_t kDefaultHostHeartbeatSecs  = 30;
constexpr std::uint32_t kDefaultHostBackoffMs      = 5000;
constexpr std::uint32_t kDefaultHostMaxBackoffMs   = 60000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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
      for (const auto& item : node) {
        YamlToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (const auto& it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

template <typename T, typename Setter>
void DefaultIfZero(T current, T fallback, Setter set) {
  if (current == 0) {
    set(fallback);
  }
}

} // namespace

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ApplyDefaults(planner::runtime::config::RuntimeConfig* config) {
  auto* daemon = config->mutable_daemon();
  if (daemon->bind_host().empty()) {
    daemon->set_bind_host("127.0.0.1");
  }
  DefaultIfZero(daemon->unresponsive_timeout_secs(), kDefaultUnresponsiveSecs, [&](auto v) { daemon->set_unresponsive_timeout_secs(v); });
  DefaultIfZero(daemon->stale_timeout_secs(), kDefaultStaleSecs, [&](auto v) { daemon->set_stale_timeout_secs(v); });
  DefaultIfZero(daemon->sweep_interval_ms(), kDefaultSweepIntervalMs, [&](auto v) { daemon->set_sweep_interval_ms(v); });
  DefaultIfZero(daemon->subscriber_ping_interval_secs(), kDefaultPingIntervalSecs, [&](auto v) { daemon->set_subscriber_ping_interval_secs(v); });
  DefaultIfZero(daemon->callback_timeout_ms(), kDefaultCallbackTimeoutMs, [&](auto v) { daemon->set_callback_timeout_ms(v); });

  auto* upstream = daemon->mutable_upstream();
  if (upstream->host().empty()) {
    upstream->set_host("auto");
  }
  DefaultIfZero(upstream->heartbeat_interval_secs(), kDefaultHostHeartbeatSecs, [&](auto v) { upstream->set_heartbeat_interval_secs(v); });
  DefaultIfZero(upstream->initial_backoff_ms(), kDefaultHostBackoffMs, [&](auto v) { upstream->set_initial_backoff_ms(v); });
  DefaultIfZero(upstream->max_backoff_ms(), kDefaultHostMaxBackoffMs, [&](auto v) { upstream->set_max_backoff_ms(v); });

  auto* workflow = config->mutable_workflow();
  if (!workflow->has_snapshot_every()) {
    workflow->set_snapshot_every(kDefaultSnapshotEvery);
  }
  DefaultIfZero(workflow->event_channel_capacity(), kDefaultChannelCapacity, [&](auto v) { workflow->set_event_channel_capacity(v); });

  auto* policy = workflow->mutable_failure_policy();
  if (!policy->has_max_retries()) {
    policy->set_max_retries(kDefaultMaxRetries);
  }
  if (!policy->has_backoff_secs()) {
    policy->set_backoff_secs(kDefaultBackoffSecs);
  }

  auto* client = config->mutable_client();
  DefaultIfZero(client->rpc_timeout_ms(), kDefaultRpcTimeoutMs, [&](auto v) { client->set_rpc_timeout_ms(v); });
  DefaultIfZero(client->heartbeat_interval_secs(), kDefaultHeartbeatEverySecs, [&](auto v) { client->set_heartbeat_interval_secs(v); });
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

planner::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  planner::runtime::config::RuntimeConfig config;

  // empty document means "all defaults"
  if (!yaml.IsNull()) {
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
  }

  ApplyDefaults(&config);
  return config;
}

planner::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  planner::runtime::config::RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

} // namespace planner::config
