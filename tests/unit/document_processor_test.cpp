#include "internal/core/document_processor.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/document_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/content_hasher.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using docman::core::DocumentProcessor;
using docman::core::ProcessingResult;

class CountingHasher final : public docman::storage::ContentHasher {
 public:
  std::string Hash(const fs::path& path) override {
    ++calls;
    if (fail) throw docman::util::FileOperationError("Failed to read " + path.string());
    return inner_.Hash(path);
  }

  bool fail  = false;
  int  calls = 0;

 private:
  docman::storage::Sha256ContentHasher inner_;
};

// Returns the file's bytes, or nothing while `fail` is set.
class FakeExtractor final : public docman::extraction::ContentExtractor {
 public:
  std::optional<std::string> Extract(const fs::path& path) override {
    ++calls;
    if (fail) return std::nullopt;
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  bool fail  = false;
  int  calls = 0;
};

struct Fixture {
  fs::path                                            root;
  std::shared_ptr<docman::db::memory::MemoryRepository> repo      = std::make_shared<docman::db::memory::MemoryRepository>();
  std::shared_ptr<CountingHasher>                     hasher    = std::make_shared<CountingHasher>();
  std::shared_ptr<FakeExtractor>                      extractor = std::make_shared<FakeExtractor>();
  DocumentProcessor                                   processor{repo, hasher, extractor};

  explicit Fixture(const std::string& name) {
    root = fs::temp_directory_path() / "docman_processor_tests" / name;
    fs::remove_all(root);
    fs::create_directories(root);
    root = fs::canonical(root);
  }

  void Write(const std::string& rel, const std::string& data) {
    const auto path = root / rel;
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << data;
  }

  // Pushes mtime forward so a rewrite is always observable.
  void Touch(const std::string& rel, int seconds) {
    const auto path = root / rel;
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(seconds));
  }

  std::optional<docman::db::model::DocumentRecord> Document(int64_t id) {
    auto tx = repo->Begin();
    return repo->GetDocument(*tx, id);
  }
};

void TestNewThenDuplicate() {
  Fixture f("new_then_duplicate");
  f.Write("a.txt", "alpha");
  f.Write("sub/b.txt", "alpha");

  auto first = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(first.result == ProcessingResult::kNewDocument);
  assert(first.copy);
  assert(first.copy->repository_path == f.root.string());
  assert(first.copy->file_path == "a.txt");
  assert(first.copy->stored_size && *first.copy->stored_size == 5);
  assert(first.copy->stored_mtime_ns);
  assert(first.copy->stored_content_hash ==
         std::optional<std::string>("8ed3f6ad685b959ead7022518e1af76cd816f8e8ec7ccdda1ed4018e8f2223f8"));

  auto document = f.Document(first.copy->document_id);
  assert(document && document->content == std::optional<std::string>("alpha"));

  auto second = f.processor.ProcessDocumentFile(f.root, "sub/b.txt");
  assert(second.result == ProcessingResult::kDuplicateDocument);
  assert(second.copy->document_id == first.copy->document_id);
  assert(second.copy->id != first.copy->id);
  assert(f.hasher->calls == 2);
}

void TestUnchangedFileSkipsHashing() {
  Fixture f("reuse");
  f.Write("a.txt", "alpha");

  auto first = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(first.result == ProcessingResult::kNewDocument);
  assert(f.hasher->calls == 1);

  auto again = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(again.result == ProcessingResult::kReusedCopy);
  assert(again.copy->id == first.copy->id);
  assert(f.hasher->calls == 1);

  auto forced = f.processor.ProcessDocumentFile(f.root, "a.txt", /*force_rescan=*/true);
  assert(forced.result == ProcessingResult::kReusedCopy);
  assert(f.hasher->calls == 2);
}

void TestTouchedButIdenticalContentRefreshesMetadata() {
  Fixture f("touched");
  f.Write("a.txt", "alpha");
  auto first = f.processor.ProcessDocumentFile(f.root, "a.txt");

  f.Touch("a.txt", 10);
  auto again = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(again.result == ProcessingResult::kReusedCopy);
  assert(f.hasher->calls == 2);
  assert(again.copy->document_id == first.copy->document_id);
  assert(*again.copy->stored_mtime_ns != *first.copy->stored_mtime_ns);

  // the refreshed cache is trusted on the next pass
  f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(f.hasher->calls == 2);
}

void TestDivergentCachedHashForcesRehash() {
  Fixture f("divergent");
  f.Write("a.txt", "alpha");
  auto first = f.processor.ProcessDocumentFile(f.root, "a.txt");

  {
    auto tx   = f.repo->Begin();
    auto copy = *first.copy;
    copy.stored_content_hash = std::string(64, '0');
    auto r = f.repo->UpdateCopy(*tx, copy);
    assert(r);
    tx->Commit();
  }

  auto again = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(again.result == ProcessingResult::kReusedCopy);
  assert(f.hasher->calls == 2);
  assert(*again.copy->stored_content_hash == *first.copy->stored_content_hash);
}

void TestRewrittenFileRepointsAndDropsSuggestion() {
  Fixture f("repoint");
  f.Write("a.txt", "alpha");
  auto first = f.processor.ProcessDocumentFile(f.root, "a.txt");

  docman::core::DocumentCatalog catalog(f.repo);
  catalog.RecordSuggestion(first.copy->id, {"Notes", "alpha.txt", "greek letters", 0.9, "p1"});
  assert(catalog.ListPendingOperations(f.root.string()).size() == 1);

  f.Write("a.txt", "beta");
  f.Touch("a.txt", 20);
  auto updated = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(updated.result == ProcessingResult::kUpdatedDocument);
  assert(updated.copy->id == first.copy->id);
  assert(updated.copy->document_id != first.copy->document_id);
  assert(*updated.copy->stored_size == 4);
  assert(catalog.ListPendingOperations(f.root.string()).empty());

  // the old document is left in place without copies
  assert(f.Document(first.copy->document_id));
  assert(f.Document(updated.copy->document_id)->content == std::optional<std::string>("beta"));
}

void TestRewrittenFileToKnownContent() {
  Fixture f("repoint_known");
  f.Write("a.txt", "alpha");
  f.Write("b.txt", "beta");
  auto a = f.processor.ProcessDocumentFile(f.root, "a.txt");
  auto b = f.processor.ProcessDocumentFile(f.root, "b.txt");

  f.Write("a.txt", "beta");
  f.Touch("a.txt", 30);
  auto updated = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(updated.result == ProcessingResult::kUpdatedDocument);
  assert(updated.copy->document_id == b.copy->document_id);
  assert(updated.copy->document_id != a.copy->document_id);
}

void TestExtractionFailureAndRetry() {
  Fixture f("extraction");
  f.Write("c.txt", "gamma");
  f.extractor->fail = true;

  auto failed = f.processor.ProcessDocumentFile(f.root, "c.txt");
  assert(failed.result == ProcessingResult::kExtractionFailed);
  assert(failed.copy);
  assert(!f.Document(failed.copy->document_id)->content);

  // still failing: unchanged file is not rehashed but stays flagged
  auto still = f.processor.ProcessDocumentFile(f.root, "c.txt");
  assert(still.result == ProcessingResult::kExtractionFailed);
  assert(f.hasher->calls == 1);

  f.extractor->fail = false;
  auto retried = f.processor.ProcessDocumentFile(f.root, "c.txt");
  assert(retried.result == ProcessingResult::kReusedCopy);
  assert(f.hasher->calls == 1);
  assert(f.Document(failed.copy->document_id)->content == std::optional<std::string>("gamma"));
}

void TestDuplicateFillsMissingContent() {
  Fixture f("duplicate_extraction");
  f.Write("a.txt", "delta");
  f.Write("b.txt", "delta");

  f.extractor->fail = true;
  auto first = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(first.result == ProcessingResult::kExtractionFailed);

  f.extractor->fail = false;
  auto second = f.processor.ProcessDocumentFile(f.root, "b.txt");
  assert(second.result == ProcessingResult::kDuplicateDocument);
  assert(f.Document(first.copy->document_id)->content == std::optional<std::string>("delta"));
}

void TestMissingFileIsHashFailure() {
  Fixture f("missing");
  auto missing = f.processor.ProcessDocumentFile(f.root, "nope.txt");
  assert(missing.result == ProcessingResult::kHashFailed);
  assert(!missing.copy);
  assert(f.hasher->calls == 0);

  auto tx = f.repo->Begin();
  assert(f.repo->ListCopies(*tx, f.root.string()).empty());
}

void TestUnreadableTrackedFileKeepsRecord() {
  Fixture f("unreadable_tracked");
  f.Write("a.txt", "alpha");
  auto first = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(first.result == ProcessingResult::kNewDocument);

  docman::core::DocumentCatalog catalog(f.repo);
  catalog.RecordSuggestion(first.copy->id, {"Notes", "a.txt", "notes", 0.5, "p"});

  f.Write("a.txt", "beta!");
  f.Touch("a.txt", 5);
  f.hasher->fail = true;

  auto failed = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(failed.result == ProcessingResult::kHashFailed);
  assert(failed.copy && failed.copy->id == first.copy->id);
  assert(failed.copy->document_id == first.copy->document_id);
  assert(failed.copy->stored_content_hash == first.copy->stored_content_hash);

  auto tx   = f.repo->Begin();
  auto copy = f.repo->GetCopy(*tx, first.copy->id);
  assert(copy && copy->document_id == first.copy->document_id);
  assert(copy->stored_size == first.copy->stored_size);
  assert(f.repo->FindPendingOperationForCopy(*tx, first.copy->id));
}

void TestTrackedPathTurnedDirectoryIsHashFailure() {
  Fixture f("tracked_now_directory");
  f.Write("a.txt", "alpha");
  auto first = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(first.copy);

  fs::remove(f.root / "a.txt");
  fs::create_directories(f.root / "a.txt");

  auto failed = f.processor.ProcessDocumentFile(f.root, "a.txt");
  assert(failed.result == ProcessingResult::kHashFailed);
  assert(failed.copy && failed.copy->id == first.copy->id);
  assert(f.hasher->calls == 1);

  auto tx   = f.repo->Begin();
  auto copy = f.repo->GetCopy(*tx, first.copy->id);
  assert(copy && copy->stored_content_hash == first.copy->stored_content_hash);
  assert(f.Document(first.copy->document_id));
}

void TestScanRepositorySummary() {
  Fixture f("scan");
  f.Write("one.txt", "1");
  f.Write("two.txt", "2");
  f.Write("dup.txt", "1");

  auto summary = f.processor.ScanRepository(f.root, {"dup.txt", "one.txt", "two.txt", "gone.txt"});
  assert(summary.new_documents == 2);
  assert(summary.duplicate_documents == 1);
  assert(summary.hash_failed == 1);
  assert(summary.errors == 0);
  assert(summary.Total() == 4);

  auto rescan = f.processor.ScanRepository(f.root, {"dup.txt", "one.txt", "two.txt"});
  assert(rescan.reused_copies == 3);
  assert(rescan.Total() == 3);
}

} // namespace

int main() {
  TestNewThenDuplicate();
  TestUnchangedFileSkipsHashing();
  TestTouchedButIdenticalContentRefreshesMetadata();
  TestDivergentCachedHashForcesRehash();
  TestRewrittenFileRepointsAndDropsSuggestion();
  TestRewrittenFileToKnownContent();
  TestExtractionFailureAndRetry();
  TestDuplicateFillsMissingContent();
  TestMissingFileIsHashFailure();
  TestUnreadableTrackedFileKeepsRecord();
  TestTrackedPathTurnedDirectoryIsHashFailure();
  TestScanRepositorySummary();

  std::cout << "docman_unit_document_processor: pass\n";
  return 0;
}
