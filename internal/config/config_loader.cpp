#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace docman::config {

namespace {

constexpr uint32_t kDefaultHashChunkBytes = 8192;

const std::vector<std::string>& DefaultExtensions() {
  static const std::vector<std::string> kExtensions = {
      ".pdf", ".docx", ".doc", ".pptx", ".ppt", ".xlsx", ".xls", ".txt", ".md", ".html", ".htm"};
  return kExtensions;
}

const std::vector<std::string>& DefaultExcludedDirs() {
  static const std::vector<std::string> kDirs = {
      ".docman", ".git", ".svn", ".hg", "__pycache__", "node_modules", ".venv", "venv",
      ".env", ".tox", "dist", "build", ".pytest_cache", ".mypy_cache", ".ruff_cache"};
  return kDirs;
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (!scalar_value.empty()) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
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

static docman::config::v1::AppConfig FromYamlNode(const YAML::Node& yaml) {
  docman::config::v1::AppConfig config;

  // empty document
  if (!yaml || yaml.IsNull()) {
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

docman::config::v1::AppConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

docman::config::v1::AppConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

docman::config::v1::AppConfig ConfigLoader::Load(const std::optional<std::string>& path) {
  if (path) {
    return LoadFromYaml(*path);
  }

  const auto default_path = ResolveAppConfigDir() / "config.yaml";
  std::error_code ec;
  if (std::filesystem::is_regular_file(default_path, ec)) {
    return LoadFromYaml(default_path.string());
  }
  return Defaults();
}

docman::config::v1::AppConfig ConfigLoader::Defaults() {
  docman::config::v1::AppConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(docman::config::v1::AppConfig& config) {
  auto* database = config.mutable_database();
  if (!database->has_sqlite() && !database->has_memory()) {
    database->mutable_sqlite();
  }
  if (database->has_sqlite()) {
    auto* sqlite = database->mutable_sqlite();
    if (sqlite->path().empty()) {
      sqlite->set_path((ResolveAppConfigDir() / "docman.db").string());
    }
    if (!sqlite->has_wal_mode()) {
      sqlite->set_wal_mode(true);
    }
  }

  auto* scan = config.mutable_scan();
  if (scan->supported_extensions_size() == 0) {
    for (const auto& ext : DefaultExtensions()) scan->add_supported_extensions(ext);
  } else {
    for (auto& ext : *scan->mutable_supported_extensions()) {
      ext = Lower(ext);
      if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
    }
  }
  if (scan->excluded_dirs_size() == 0) {
    for (const auto& dir : DefaultExcludedDirs()) scan->add_excluded_dirs(dir);
  }
  if (scan->hash_chunk_bytes() == 0) {
    scan->set_hash_chunk_bytes(kDefaultHashChunkBytes);
  }

  auto* apply = config.mutable_apply();
  if (apply->conflict_policy().empty()) {
    apply->set_conflict_policy("skip");
  }
  apply->set_conflict_policy(Lower(apply->conflict_policy()));
  if (apply->conflict_policy() != "skip" && apply->conflict_policy() != "overwrite" &&
      apply->conflict_policy() != "rename") {
    throw std::runtime_error("Invalid configuration: apply.conflict_policy must be skip, overwrite or rename");
  }
  if (!apply->has_create_dirs()) {
    apply->set_create_dirs(true);
  }

  config.mutable_logging();
}

std::filesystem::path ResolveAppConfigDir() {
  if (const char* dir = std::getenv("DOCMAN_APP_CONFIG_DIR"); dir && *dir) {
    return std::filesystem::path(dir);
  }
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "docman";
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "docman";
  }
  return std::filesystem::current_path() / ".docman-config";
}

} // namespace docman::config
