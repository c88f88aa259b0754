#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace epg::config {

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";
constexpr const char* kDefaultUserAgent   = "epg-guide/1.0";
constexpr uint32_t    kDefaultBatchSize   = 100;

const char* const kDefaultDenylist[] = {"Adult", "XXX", "Porn"};

bool IsUnset(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

bool IsNegative(const google::protobuf::Duration& d) {
  return d.seconds() < 0 || d.nanos() < 0;
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
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

epg::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  epg::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(epg::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address(kDefaultBindAddress);
  }

  if (!config.database().has_sqlite() && !config.database().has_memory()) {
    config.mutable_database()->mutable_memory();
  }

  auto* feed = config.mutable_feed();
  if (feed->user_agent().empty()) {
    feed->set_user_agent(kDefaultUserAgent);
  }
  if (IsUnset(feed->connect_timeout())) {
    feed->mutable_connect_timeout()->set_seconds(10);
  }

  auto* sync = config.mutable_sync();
  if (sync->batch_size() == 0) {
    sync->set_batch_size(kDefaultBatchSize);
  }
  if (IsUnset(sync->retention())) {
    sync->mutable_retention()->set_seconds(24 * 60 * 60);
  }
  if (sync->denylist_size() == 0) {
    for (const char* keyword : kDefaultDenylist) {
      sync->add_denylist(keyword);
    }
  }
  if (IsUnset(sync->initial_backoff())) {
    sync->mutable_initial_backoff()->set_seconds(30);
  }
  if (IsUnset(sync->max_backoff())) {
    sync->mutable_max_backoff()->set_seconds(60 * 60);
  }
}

void ConfigLoader::Validate(const epg::runtime::config::RuntimeConfig& config) {
  if (config.feed().url().empty()) {
    throw std::runtime_error("Invalid configuration: feed.url is required");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.sync().batch_size() == 0) {
    throw std::runtime_error("Invalid configuration: sync.batch_size must be positive");
  }

  const auto& sync = config.sync();
  if (IsNegative(sync.retention()) || IsNegative(sync.interval()) || IsNegative(sync.initial_backoff()) ||
      IsNegative(sync.max_backoff()) || IsNegative(config.feed().connect_timeout())) {
    throw std::runtime_error("Invalid configuration: durations must not be negative");
  }
  if (sync.max_backoff().seconds() < sync.initial_backoff().seconds()) {
    throw std::runtime_error("Invalid configuration: sync.max_backoff must be >= sync.initial_backoff");
  }
}

} // namespace epg::config
