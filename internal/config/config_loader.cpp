#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace zget::config {

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
  if (endptr && *endptr == '\0') {
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

zget::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  zget::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  return config;
}

zget::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  zget::runtime::config::RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

static std::string DefaultHome() {
  if (const char* home = std::getenv("ZGET_HOME"); home && *home) {
    return home;
  }
  const char* user_home = std::getenv("HOME");
  const auto  base      = user_home && *user_home ? std::filesystem::path(user_home) : std::filesystem::current_path();
  return (base / "Downloads" / "zget").string();
}

static void DefaultPath(std::string* field, const std::filesystem::path& value) {
  if (field->empty()) {
    *field = value.string();
  }
}

void ConfigLoader::ApplyDefaults(zget::runtime::config::RuntimeConfig& config) {
  auto* library = config.mutable_library();
  if (library->home().empty()) {
    library->set_home(DefaultHome());
  }
  const std::filesystem::path home(library->home());
  DefaultPath(library->mutable_videos_dir(), home / "videos");
  DefaultPath(library->mutable_thumbnails_dir(), home / "thumbnails");
  DefaultPath(library->mutable_exports_dir(), home / "exports");
  DefaultPath(library->mutable_temp_dir(), std::filesystem::temp_directory_path());

  auto* sqlite = config.mutable_database()->mutable_sqlite();
  DefaultPath(sqlite->mutable_path(), home / "library.db");
  if (sqlite->busy_timeout_ms() == 0) {
    sqlite->set_busy_timeout_ms(5000);
  }

  auto* queue = config.mutable_queue();
  if (queue->max_concurrent() == 0) {
    queue->set_max_concurrent(32);
  }

  auto* ingest = config.mutable_ingest();
  if (ingest->hash_chunk_bytes() == 0) {
    ingest->set_hash_chunk_bytes(1u << 20);
  }

  auto* extractor = config.mutable_extractor();
  if (extractor->command().empty()) {
    extractor->set_command("yt-dlp");
  }
  if (extractor->max_quality().empty()) {
    extractor->set_max_quality("best");
  }

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) {
    logging->set_level("info");
  }
}

} // namespace zget::config
