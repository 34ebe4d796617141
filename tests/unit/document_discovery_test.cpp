#include "internal/storage/document_discovery.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using docman::storage::DiscoverDocumentFiles;
using docman::storage::DiscoveryOptions;

fs::path MakeRoot(const std::string& name) {
  auto root = fs::temp_directory_path() / "docman_discovery_tests" / name;
  fs::remove_all(root);
  fs::create_directories(root);
  return fs::canonical(root);
}

void Touch(const fs::path& path) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << "x";
}

DiscoveryOptions DefaultOptions() {
  return DiscoveryOptions::FromConfig(docman::config::ConfigLoader::Defaults().scan());
}

void TestRecursiveDiscoveryFiltersAndSorts() {
  const auto root = MakeRoot("recursive");
  Touch(root / "b.pdf");
  Touch(root / "a.TXT");
  Touch(root / "image.png");
  Touch(root / "docs" / "report.docx");
  Touch(root / "docs" / "deep" / "notes.md");
  Touch(root / ".git" / "objects.pdf");
  Touch(root / "node_modules" / "pkg" / "readme.md");
  Touch(root / ".docman" / "cache.pdf");

  auto files = DiscoverDocumentFiles(root, root, true, DefaultOptions());
  const std::vector<std::string> expected = {"a.TXT", "b.pdf", "docs/deep/notes.md", "docs/report.docx"};
  assert(files == expected);
}

void TestShallowDiscoveryFromSubdirectory() {
  const auto root = MakeRoot("shallow");
  Touch(root / "top.pdf");
  Touch(root / "docs" / "one.pdf");
  Touch(root / "docs" / "inner" / "two.pdf");

  auto files = DiscoverDocumentFiles(root, root / "docs", false, DefaultOptions());
  assert(files.size() == 1);
  assert(files[0] == "docs/one.pdf");

  auto all = DiscoverDocumentFiles(root, root / "docs", true, DefaultOptions());
  assert(all.size() == 2);
  assert(all[0] == "docs/inner/two.pdf");
  assert(all[1] == "docs/one.pdf");
}

void TestCustomOptions() {
  const auto root = MakeRoot("custom");
  Touch(root / "keep.csv");
  Touch(root / "skip.pdf");
  Touch(root / "private" / "hidden.csv");

  DiscoveryOptions options;
  options.supported_extensions = {".csv"};
  options.excluded_dirs        = {"private"};

  auto files = DiscoverDocumentFiles(root, root, true, options);
  assert(files.size() == 1);
  assert(files[0] == "keep.csv");
}

void TestRepositoryRootDiscovery() {
  const auto root = MakeRoot("repo_root");
  fs::create_directories(root / ".docman");
  fs::create_directories(root / "a" / "b");

  auto found = docman::storage::FindRepositoryRoot(root / "a" / "b");
  assert(found.has_value());
  assert(*found == root);

  // marker without config.yaml is not a valid repository
  assert(!docman::storage::ValidateRepository(root));
  bool threw = false;
  try {
    (void)docman::storage::GetRepositoryRoot(root / "a");
  } catch (const docman::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  Touch(root / ".docman" / "config.yaml");
  assert(docman::storage::ValidateRepository(root));
  assert(docman::storage::GetRepositoryRoot(root / "a" / "b") == root);
}

void TestNoRepository() {
  const auto root = MakeRoot("no_repo");
  // the temp tree itself is not expected to sit under a .docman directory
  auto found = docman::storage::FindRepositoryRoot(root);
  assert(!found.has_value() || *found != root);
}

void TestInitRepository() {
  const auto root = MakeRoot("init");
  assert(!docman::storage::ValidateRepository(root));

  assert(docman::storage::InitRepository(root));
  assert(fs::is_regular_file(root / ".docman" / "config.yaml"));
  assert(fs::file_size(root / ".docman" / "config.yaml") == 0);
  assert(docman::storage::GetRepositoryRoot(root) == root);

  // second run leaves the existing marker alone
  std::ofstream(root / ".docman" / "config.yaml") << "scan: {}\n";
  assert(!docman::storage::InitRepository(root));
  assert(fs::file_size(root / ".docman" / "config.yaml") > 0);

  bool threw = false;
  try {
    (void)docman::storage::InitRepository(root / "missing");
  } catch (const docman::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  Touch(root / "file.txt");
  threw = false;
  try {
    (void)docman::storage::InitRepository(root / "file.txt");
  } catch (const docman::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestIsSupportedDocument() {
  const auto options = DefaultOptions();
  assert(docman::storage::IsSupportedDocument("inbox/Report.PDF", options));
  assert(docman::storage::IsSupportedDocument("notes.md", options));
  assert(!docman::storage::IsSupportedDocument("image.png", options));
  assert(!docman::storage::IsSupportedDocument("README", options));
}

} // namespace

int main() {
  TestRecursiveDiscoveryFiltersAndSorts();
  TestShallowDiscoveryFromSubdirectory();
  TestCustomOptions();
  TestRepositoryRootDiscovery();
  TestNoRepository();
  TestInitRepository();
  TestIsSupportedDocument();

  std::cout << "docman_unit_document_discovery: pass\n";
  return 0;
}
