#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace ingest::config {

using ingest::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // Quoted scalars stay strings ("123" is not a number).
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
  RuntimeConfig config;

  // An empty document is a valid all-defaults config.
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
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

  ConfigLoader::ApplyDefaults(config);
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
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  constexpr uint64_t kMaxFileSize = 100ULL * 1024 * 1024;

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* database = config.mutable_database();
  if (database->backend_case() == ingest::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }

  auto* policy = config.mutable_policy();
  if (policy->max_file_size_bytes() == 0) policy->set_max_file_size_bytes(kMaxFileSize);
  if (policy->allowed_mime_types().empty()) {
    policy->add_allowed_mime_types("image/*");
    policy->add_allowed_mime_types("video/*");
    policy->add_allowed_mime_types("application/pdf");
  }

  auto* resumable = config.mutable_resumable();
  if (resumable->temp_directory().empty()) resumable->set_temp_directory("/tmp/ingest-uploads");
  if (resumable->session_ttl_seconds() == 0) resumable->set_session_ttl_seconds(24 * 3600);
  if (resumable->sweep_interval_seconds() == 0) resumable->set_sweep_interval_seconds(3600);

  auto* queue = config.mutable_queue();
  if (queue->accept_workers() == 0) queue->set_accept_workers(2);
  if (queue->processing_workers() == 0) queue->set_processing_workers(2);
  if (queue->max_attempts() == 0) queue->set_max_attempts(3);
  if (queue->backoff_initial_ms() == 0) queue->set_backoff_initial_ms(2000);

  auto* providers = config.mutable_providers();
  if (providers->request_timeout_ms() == 0) providers->set_request_timeout_ms(30000);
  if (providers->signed_url_ttl_seconds() == 0) providers->set_signed_url_ttl_seconds(3600);

  auto* media = providers->mutable_media();
  if (media->folder().empty()) media->set_folder("uploads");
  if (media->api_base_url().empty()) media->set_api_base_url("https://api.cloudinary.com/v1_1");
  if (media->delivery_base_url().empty()) media->set_delivery_base_url("https://res.cloudinary.com");
  if (media->max_file_size_bytes() == 0) media->set_max_file_size_bytes(kMaxFileSize);

  auto* object_store = providers->mutable_object_store();
  if (object_store->root_uri().empty() && object_store->bucket().empty()) {
    object_store->set_root_uri("/tmp/ingest-objects");
  }
  if (object_store->region().empty()) object_store->set_region("us-east-1");
  if (object_store->scheme().empty()) object_store->set_scheme("https");

  auto* backup = providers->mutable_backup();
  if (backup->folder().empty()) backup->set_folder("backups");

  auto* virus_scan = config.mutable_virus_scan();
  if (virus_scan->host().empty()) virus_scan->set_host("localhost");
  if (virus_scan->port() == 0) virus_scan->set_port(3310);
  if (virus_scan->timeout_ms() == 0) virus_scan->set_timeout_ms(60000);

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) observability->set_service_name("ingest-manager");
  if (observability->metrics_interval_ms() == 0) observability->set_metrics_interval_ms(10000);
}

} // namespace ingest::config
