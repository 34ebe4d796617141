#include "internal/core/document_catalog.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/document_processor.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/extraction/plain_text_extractor.hpp"
#include "internal/storage/content_hasher.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using docman::core::CopyFilter;
using docman::core::DocumentCatalog;
using docman::core::Suggestion;
using docman::model::OrganizationStatus;

struct Fixture {
  fs::path                        root;
  std::shared_ptr<docman::db::Repository> repo = std::make_shared<docman::db::memory::MemoryRepository>();
  docman::core::DocumentProcessor processor{repo, std::make_shared<docman::storage::Sha256ContentHasher>(),
                                            std::make_shared<docman::extraction::PlainTextExtractor>()};
  DocumentCatalog                 catalog{repo};

  explicit Fixture(const std::string& name) {
    root = fs::temp_directory_path() / "docman_catalog_tests" / name;
    fs::remove_all(root);
    fs::create_directories(root);
    root = fs::canonical(root);
  }

  docman::db::model::DocumentCopyRecord Add(const std::string& rel, const std::string& data) {
    const auto path = root / rel;
    fs::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << data;
    auto processed = processor.ProcessDocumentFile(root, rel);
    assert(processed.copy);
    return *processed.copy;
  }

  std::optional<docman::db::model::DocumentCopyRecord> Copy(int64_t id) {
    auto tx = repo->Begin();
    return repo->GetCopy(*tx, id);
  }

  std::optional<docman::db::model::DocumentRecord> Document(int64_t id) {
    auto tx = repo->Begin();
    return repo->GetDocument(*tx, id);
  }
};

void TestRecordSuggestionReplacesPrevious() {
  Fixture f("suggestion");
  auto    copy = f.Add("a.txt", "alpha");

  auto first  = f.catalog.RecordSuggestion(copy.id, {"Letters", "a.txt", "first try", 0.4, "h1"});
  auto second = f.catalog.RecordSuggestion(copy.id, {"Greek", "alpha.txt", "second try", 0.8, "h2"});
  assert(first.id > 0 && second.id > 0);

  auto pending = f.catalog.ListPendingOperations(f.root.string());
  assert(pending.size() == 1);
  assert(pending[0].document_copy_id == copy.id);
  assert(pending[0].suggested_directory_path == "Greek");
  assert(pending[0].suggested_filename == "alpha.txt");
  assert(pending[0].prompt_hash == "h2");

  bool threw = false;
  try {
    f.catalog.RecordSuggestion(9999, {"X", "y.txt", "", 0.1, ""});
  } catch (const docman::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestIgnoreAndUnmark() {
  Fixture f("ignore");
  auto    a = f.Add("a.txt", "alpha");
  auto    b = f.Add("b.txt", "beta");
  f.catalog.RecordSuggestion(a.id, {"Letters", "a.txt", "", 0.5, ""});

  assert(f.catalog.IgnoreCopies({a.id, b.id}) == 2);
  assert(f.Copy(a.id)->organization_status == OrganizationStatus::kIgnored);
  assert(f.catalog.ListPendingOperations(f.root.string()).empty());

  // already ignored
  assert(f.catalog.IgnoreCopies({a.id}) == 0);

  assert(f.catalog.UnmarkCopies({a.id}) == 1);
  assert(f.Copy(a.id)->organization_status == OrganizationStatus::kUnorganized);
  assert(f.Copy(b.id)->organization_status == OrganizationStatus::kIgnored);

  bool threw = false;
  try {
    f.catalog.IgnoreCopies({a.id, 4242});
  } catch (const docman::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  // nothing from the failed batch landed
  assert(f.Copy(a.id)->organization_status == OrganizationStatus::kUnorganized);
}

void TestSelectCopies() {
  Fixture f("select");
  f.Add("top.txt", "1");
  f.Add("docs/one.txt", "2");
  f.Add("docs/inner/two.txt", "3");
  auto other = f.Add("docsextra/three.txt", "4");
  f.catalog.IgnoreCopies({other.id});

  assert(f.catalog.SelectCopies(f.root.string(), {}).size() == 4);
  assert(f.catalog.SelectCopies(f.root.string(), {"", false, std::nullopt}).size() == 1);
  assert(f.catalog.SelectCopies(f.root.string(), {"docs", true, std::nullopt}).size() == 2);

  auto shallow = f.catalog.SelectCopies(f.root.string(), {"docs", false, std::nullopt});
  assert(shallow.size() == 1);
  assert(shallow[0].file_path == "docs/one.txt");

  auto single = f.catalog.SelectCopies(f.root.string(), {"docs/inner/two.txt", false, std::nullopt});
  assert(single.size() == 1);

  auto ignored = f.catalog.SelectCopies(f.root.string(), {"", true, OrganizationStatus::kIgnored});
  assert(ignored.size() == 1);
  assert(ignored[0].id == other.id);

  assert(f.catalog.SelectCopies("/elsewhere", {}).empty());
}

void TestDuplicateGroupsAndRemoval() {
  Fixture f("duplicates");
  auto    keep  = f.Add("a.txt", "same");
  auto    dup1  = f.Add("copies/b.txt", "same");
  auto    dup2  = f.Add("copies/c.txt", "same");
  auto    alone = f.Add("d.txt", "different");
  f.catalog.RecordSuggestion(dup1.id, {"Elsewhere", "b.txt", "", 0.3, ""});

  auto groups = f.catalog.FindDuplicateGroups(f.root.string());
  assert(groups.size() == 1);
  assert(groups.begin()->first == keep.document_id);
  assert(groups.begin()->second.size() == 3);

  auto summary = DocumentCatalog::Summarize(groups);
  assert(summary.groups == 1);
  assert(summary.copies == 3);

  bool threw = false;
  try {
    f.catalog.RemoveDuplicateCopies(f.root, keep.document_id, alone.id);
  } catch (const docman::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  assert(f.catalog.RemoveDuplicateCopies(f.root, keep.document_id, keep.id) == 2);
  assert(fs::exists(f.root / "a.txt"));
  assert(!fs::exists(f.root / "copies" / "b.txt"));
  assert(!fs::exists(f.root / "copies" / "c.txt"));
  assert(!f.Copy(dup1.id));
  assert(!f.Copy(dup2.id));
  assert(f.Copy(keep.id));
  assert(f.catalog.ListPendingOperations(f.root.string()).empty());
  assert(f.catalog.FindDuplicateGroups(f.root.string()).empty());
}

void TestDetectTargetConflicts() {
  Fixture f("conflicts");
  auto    a = f.Add("a.txt", "1");
  auto    b = f.Add("b.txt", "2");
  auto    c = f.Add("c.txt", "3");
  f.catalog.RecordSuggestion(a.id, {"Reports", "q1.txt", "", 0.9, ""});
  f.catalog.RecordSuggestion(b.id, {"Reports", "q1.txt", "", 0.7, ""});
  f.catalog.RecordSuggestion(c.id, {"Reports", "q2.txt", "", 0.7, ""});

  auto conflicts = f.catalog.DetectTargetConflicts(f.root.string());
  assert(conflicts.size() == 1);
  assert(conflicts.count("Reports/q1.txt") == 1);
  assert(conflicts["Reports/q1.txt"].size() == 2);
}

void TestCleanupOrphanedCopies() {
  Fixture f("cleanup");
  auto    kept    = f.Add("kept.txt", "stay");
  auto    lonely  = f.Add("lonely.txt", "only copy");
  auto    shared1 = f.Add("shared1.txt", "shared");
  auto    shared2 = f.Add("shared2.txt", "shared");
  f.catalog.RecordSuggestion(lonely.id, {"Misc", "lonely.txt", "", 0.2, ""});

  fs::remove(f.root / "lonely.txt");
  fs::remove(f.root / "shared1.txt");

  auto result = f.catalog.CleanupOrphanedCopies(f.root);
  assert(result.deleted == 2);
  assert(result.updated == 2);

  assert(!f.Copy(lonely.id));
  assert(!f.Document(lonely.document_id));
  assert(!f.Copy(shared1.id));
  assert(f.Document(shared1.document_id));
  assert(f.Copy(shared2.id)->last_seen_at_ms);
  assert(f.Copy(kept.id)->last_seen_at_ms);
  assert(f.catalog.ListPendingOperations(f.root.string()).empty());
}

void TestRepositoryStatus() {
  Fixture f("status");
  auto    a = f.Add("a.txt", "same");
  auto    b = f.Add("sub/b.txt", "same");
  auto    c = f.Add("c.txt", "unique");
  f.Add("d.txt", "other");

  f.catalog.IgnoreCopies({c.id});
  f.catalog.RecordSuggestion(a.id, {"Docs", "x.txt", "", 0.5, ""});
  f.catalog.RecordSuggestion(b.id, {"Docs", "x.txt", "", 0.5, ""});

  auto status = f.catalog.Status(f.root.string());
  assert(status.copies == 4);
  assert(status.unorganized == 3);
  assert(status.ignored == 1);
  assert(status.organized == 0);
  assert(status.pending == 2);
  assert(status.conflicting == 2);
  assert(status.duplicates.groups == 1);
  assert(status.duplicates.copies == 2);

  auto empty = f.catalog.Status((f.root / "elsewhere").string());
  assert(empty.copies == 0 && empty.pending == 0 && empty.duplicates.groups == 0);
}

} // namespace

int main() {
  TestRecordSuggestionReplacesPrevious();
  TestIgnoreAndUnmark();
  TestSelectCopies();
  TestDuplicateGroupsAndRemoval();
  TestDetectTargetConflicts();
  TestCleanupOrphanedCopies();
  TestRepositoryStatus();

  std::cout << "docman_unit_document_catalog: pass\n";
  return 0;
}
