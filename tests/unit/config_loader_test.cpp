#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "docman_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& test_name, const std::string& yaml) {
  try {
    (void)docman::config::ConfigLoader::LoadFromYaml(WriteYaml(test_name, yaml).string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestEmptyFileYieldsDefaults() {
  ::setenv("DOCMAN_APP_CONFIG_DIR", "/tmp/docman-app-config", 1);

  auto config = docman::config::ConfigLoader::LoadFromYaml(WriteYaml("empty", "").string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/docman-app-config/docman.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.scan().hash_chunk_bytes() == 8192);
  assert(config.scan().supported_extensions_size() == 11);
  assert(config.scan().excluded_dirs_size() == 15);
  assert(config.apply().conflict_policy() == "skip");
  assert(config.apply().create_dirs());
}

void TestExplicitSections() {
  auto config = docman::config::ConfigLoader::LoadFromYaml(WriteYaml("explicit",
                                                                     R"(database:
  memory: {}
logging:
  level: debug
  pattern: "%v"
scan:
  supported_extensions: [PDF, ".Txt"]
  excluded_dirs: [archive]
  hash_chunk_bytes: 4096
apply:
  conflict_policy: rename
  create_dirs: false
)")
                                                               .string());
  assert(config.database().has_memory());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.scan().supported_extensions_size() == 2);
  assert(config.scan().supported_extensions(0) == ".pdf");
  assert(config.scan().supported_extensions(1) == ".txt");
  assert(config.scan().excluded_dirs_size() == 1);
  assert(config.scan().hash_chunk_bytes() == 4096);
  assert(config.apply().conflict_policy() == "rename");
  assert(!config.apply().create_dirs());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = docman::config::ConfigLoader::LoadFromYaml(WriteYaml("quoted_backslash",
                                                                     R"(database:
  sqlite:
    path: "C:\\docman\\\"quoted\"\\db.sqlite"
    wal_mode: false
)")
                                                               .string());
  assert(config.database().sqlite().path() == "C:\\docman\\\"quoted\"\\db.sqlite");
  assert(!config.database().sqlite().wal_mode());
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field", "unknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
  assert(Rejects("unknown_nested", "scan:\n  follow_symlinks: true\n"));
}

void TestInvalidPolicyAndMalformedYaml() {
  assert(Rejects("bad_policy", "apply:\n  conflict_policy: merge\n"));
  assert(Rejects("malformed", "scan: [unclosed\n"));
  assert(Rejects("not_a_map", "- a\n- b\n"));
}

void TestAppConfigDirResolution() {
  ::setenv("DOCMAN_APP_CONFIG_DIR", "/tmp/explicit-docman", 1);
  assert(docman::config::ResolveAppConfigDir() == std::filesystem::path("/tmp/explicit-docman"));

  ::unsetenv("DOCMAN_APP_CONFIG_DIR");
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-home", 1);
  assert(docman::config::ResolveAppConfigDir() == std::filesystem::path("/tmp/xdg-home/docman"));

  ::unsetenv("XDG_CONFIG_HOME");
  ::setenv("HOME", "/tmp/some-home", 1);
  assert(docman::config::ResolveAppConfigDir() == std::filesystem::path("/tmp/some-home/.config/docman"));
}

void TestLoadFallsBackToDefaults() {
  const auto dir = std::filesystem::temp_directory_path() / "docman_config_loader_tests" / "app_dir";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  ::setenv("DOCMAN_APP_CONFIG_DIR", dir.c_str(), 1);

  auto defaults = docman::config::ConfigLoader::Load(std::nullopt);
  assert(defaults.database().sqlite().path() == (dir / "docman.db").string());

  std::ofstream(dir / "config.yaml") << "database:\n  memory: {}\n";
  auto from_app_dir = docman::config::ConfigLoader::Load(std::nullopt);
  assert(from_app_dir.database().has_memory());
}

} // namespace

int main() {
  TestEmptyFileYieldsDefaults();
  TestExplicitSections();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestInvalidPolicyAndMalformedYaml();
  TestAppConfigDirResolution();
  TestLoadFallsBackToDefaults();

  std::cout << "docman_unit_config_loader: pass\n";
  return 0;
}
