#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "docman/config/v1/config.pb.h"

namespace docman::config {

/*
  Loads AppConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Every loaded config has
  defaults applied, so callers never see an empty section.
*/
class ConfigLoader {
 public:
  static docman::config::v1::AppConfig LoadFromYaml(const std::string& path);
  static docman::config::v1::AppConfig LoadFromYamlString(const std::string& text);

  // --config path if given, else <app_config_dir>/config.yaml if present,
  // else defaults.
  static docman::config::v1::AppConfig Load(const std::optional<std::string>& path);

  static docman::config::v1::AppConfig Defaults();
  static void ApplyDefaults(docman::config::v1::AppConfig& config);
};

// DOCMAN_APP_CONFIG_DIR, else $XDG_CONFIG_HOME/docman, else $HOME/.config/docman.
std::filesystem::path ResolveAppConfigDir();

} // namespace docman::config
