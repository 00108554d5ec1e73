#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace healthd::config {

namespace {

constexpr auto kDefaultRetentionPeriod = std::chrono::hours(72);
constexpr auto kMinRetentionPeriod     = std::chrono::minutes(1);
constexpr auto kDefaultScrapeInterval  = std::chrono::minutes(1);
constexpr auto kDefaultPurgeInterval   = std::chrono::minutes(5);

bool IsUnset(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

void CheckRange(const google::protobuf::Duration& d, const std::string& field) {
  if (d.seconds() >= util::kMaxProtoDurationSeconds || d.seconds() <= -util::kMaxProtoDurationSeconds) {
    throw util::InvalidArgument(field + " is out of range, got " + std::to_string(d.seconds()) + "s");
  }
}

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

healthd::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  healthd::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(healthd::runtime::config::RuntimeConfig* config) {
  auto* events = config->mutable_events();
  if (IsUnset(events->retention_period())) {
    *events->mutable_retention_period() = util::ToProto(kDefaultRetentionPeriod);
  }

  auto* metrics = config->mutable_metrics();
  if (IsUnset(metrics->scrape_interval())) {
    *metrics->mutable_scrape_interval() = util::ToProto(kDefaultScrapeInterval);
  }
  if (IsUnset(metrics->purge_interval())) {
    *metrics->mutable_purge_interval() = util::ToProto(kDefaultPurgeInterval);
  }
  if (IsUnset(metrics->retain_duration())) {
    *metrics->mutable_retain_duration() = events->retention_period();
  }
}

void ConfigLoader::Validate(const healthd::runtime::config::RuntimeConfig& config) {
  if (config.state().path().empty()) {
    throw util::InvalidArgument("state.path is required");
  }

  CheckRange(config.state().compact_period(), "state.compact_period");
  CheckRange(config.events().retention_period(), "events.retention_period");
  CheckRange(config.metrics().scrape_interval(), "metrics.scrape_interval");
  CheckRange(config.metrics().purge_interval(), "metrics.purge_interval");
  CheckRange(config.metrics().retain_duration(), "metrics.retain_duration");

  const auto retention = util::FromProto(config.events().retention_period());
  if (retention < kMinRetentionPeriod) {
    throw util::InvalidArgument("events.retention_period must be at least 1 minute, got " +
                                std::to_string(std::chrono::duration_cast<std::chrono::seconds>(retention).count()) + "s");
  }

  if (util::FromProto(config.state().compact_period()) < std::chrono::nanoseconds::zero()) {
    throw util::InvalidArgument("state.compact_period must not be negative");
  }

  if (config.metrics().enabled()) {
    if (util::FromProto(config.metrics().scrape_interval()) <= std::chrono::nanoseconds::zero()) {
      throw util::InvalidArgument("metrics.scrape_interval must be positive");
    }
    if (util::FromProto(config.metrics().purge_interval()) <= std::chrono::nanoseconds::zero()) {
      throw util::InvalidArgument("metrics.purge_interval must be positive");
    }
    if (util::FromProto(config.metrics().retain_duration()) <= std::chrono::nanoseconds::zero()) {
      throw util::InvalidArgument("metrics.retain_duration must be positive");
    }
  }
}

} // namespace healthd::config
