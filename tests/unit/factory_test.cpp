#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "internal/config/config_loader.hpp"

namespace {

namespace fs = std::filesystem;

fs::path MakeTree(const std::string& name) {
  auto root = fs::temp_directory_path() / "docman_factory_tests" / name;
  fs::remove_all(root);
  fs::create_directories(root);
  return fs::canonical(root);
}

void RunScanAndApply(docman::factory::Runtime& rt, const fs::path& root) {
  std::ofstream(root / "notes.md") << "# notes";
  std::ofstream(root / "skip.bin") << "binary";

  auto files = docman::storage::DiscoverDocumentFiles(root, root, true, rt.discovery);
  assert(files.size() == 1);

  auto summary = rt.processor->ScanRepository(root, files);
  assert(summary.new_documents == 1);

  auto copies = rt.catalog->SelectCopies(root.string(), {});
  assert(copies.size() == 1);

  auto pending = rt.catalog->RecordSuggestion(copies[0].id, {"Notes", "notes.md", "markdown", 0.6, "f1"});
  auto result  = rt.applier->Apply(pending.id, docman::storage::ConflictPolicy::kSkip);
  assert(result.status == docman::core::ApplyStatus::kApplied);
  assert(fs::exists(root / "Notes" / "notes.md"));
}

void TestMemoryRuntime() {
  auto config = docman::config::ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");
  auto rt     = docman::factory::BuildRuntime(config);
  assert(rt.repository && rt.processor && rt.catalog && rt.applier);
  RunScanAndApply(rt, MakeTree("memory"));
}

#if DOCMAN_DB_SQLITE
void TestSqliteRuntimeCreatesStore() {
  const auto store_dir = MakeTree("sqlite_store") / "nested";
  auto       config    = docman::config::ConfigLoader::Defaults();
  config.mutable_database()->mutable_sqlite()->set_path((store_dir / "docman.db").string());
  config.mutable_database()->mutable_sqlite()->set_wal_mode(false);

  {
    auto rt = docman::factory::BuildRuntime(config);
    RunScanAndApply(rt, MakeTree("sqlite_tree"));
  }
  assert(fs::exists(store_dir / "docman.db"));

  // reopening bootstraps idempotently and sees the earlier run
  auto rt     = docman::factory::BuildRuntime(config);
  auto copies = rt.catalog->SelectCopies(MakeTree("sqlite_tree").string(), {});
  assert(copies.size() == 1);
  assert(copies[0].file_path == "Notes/notes.md");
}
#endif

} // namespace

int main() {
  TestMemoryRuntime();
#if DOCMAN_DB_SQLITE
  TestSqliteRuntimeCreatesStore();
#endif

  std::cout << "docman_unit_factory: pass\n";
  return 0;
}
