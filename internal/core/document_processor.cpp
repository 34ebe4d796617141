#include "internal/core/document_processor.hpp"

#include <system_error>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace docman::core {

namespace fs = std::filesystem;

using docman::observability::IntField;
using docman::observability::StringField;

namespace {

// Cached metadata can only be trusted while it still agrees with the
// document the copy points at; any divergence forces a rehash.
bool IsFresh(const db::model::DocumentCopyRecord& copy,
             const db::model::DocumentRecord&     document,
             uint64_t                             size,
             int64_t                              mtime_ns) {
  return copy.stored_size && *copy.stored_size == size && copy.stored_mtime_ns && *copy.stored_mtime_ns == mtime_ns &&
         copy.stored_content_hash && *copy.stored_content_hash == document.content_hash;
}

void StampMetadata(db::model::DocumentCopyRecord& copy, const std::string& hash, uint64_t size, int64_t mtime_ns) {
  copy.stored_content_hash = hash;
  copy.stored_size         = size;
  copy.stored_mtime_ns     = mtime_ns;
}

} // namespace

void ScanSummary::Count(ProcessingResult result) {
  switch (result) {
    case ProcessingResult::kNewDocument:
      ++new_documents;
      break;
    case ProcessingResult::kUpdatedDocument:
      ++updated_documents;
      break;
    case ProcessingResult::kDuplicateDocument:
      ++duplicate_documents;
      break;
    case ProcessingResult::kReusedCopy:
      ++reused_copies;
      break;
    case ProcessingResult::kExtractionFailed:
      ++extraction_failed;
      break;
    case ProcessingResult::kHashFailed:
      ++hash_failed;
      break;
  }
}

DocumentProcessor::DocumentProcessor(std::shared_ptr<db::Repository>               repository,
                                     std::shared_ptr<storage::ContentHasher>       hasher,
                                     std::shared_ptr<extraction::ContentExtractor> extractor)
    : repository_(std::move(repository)), hasher_(std::move(hasher)), extractor_(std::move(extractor)) {
}

std::optional<std::string> DocumentProcessor::ExtractSafely(const fs::path& path) {
  if (!extractor_) {
    return std::nullopt;
  }
  try {
    return extractor_->Extract(path);
  } catch (const std::exception& e) {
    DOCMAN_LOG_WARN("extraction failed", {StringField("path", path.string()), StringField("error", e.what())});
    return std::nullopt;
  }
}

bool DocumentProcessor::RetryExtraction(db::Transaction& tx, db::model::DocumentRecord& document, const fs::path& path) {
  auto content = ExtractSafely(path);
  if (!content) {
    return false;
  }
  document.content = std::move(content);
  ThrowIfDbError(repository_->UpdateDocument(tx, document), "store extracted content");
  return true;
}

ProcessedFile DocumentProcessor::ProcessDocumentFile(const fs::path& repository_path, const std::string& file_path,
                                                     bool force_rescan) {
  const auto repo_key = repository_path.string();
  const auto rel_path = fs::path(file_path).generic_string();
  const auto abs_path = repository_path / fs::path(file_path);

  auto tx       = repository_->Begin();
  auto existing = repository_->FindCopyByPath(*tx, repo_key, rel_path);

  std::error_code ec;
  const auto      size = fs::file_size(abs_path, ec);
  if (ec) {
    DOCMAN_LOG_WARN("cannot stat file", {StringField("path", abs_path.string()), StringField("error", ec.message())});
    tx->Rollback();
    return {existing, ProcessingResult::kHashFailed};
  }
  const auto write_time = fs::last_write_time(abs_path, ec);
  if (ec) {
    DOCMAN_LOG_WARN("cannot stat file", {StringField("path", abs_path.string()), StringField("error", ec.message())});
    tx->Rollback();
    return {existing, ProcessingResult::kHashFailed};
  }
  const auto mtime_ns = util::FileTimeNanos(write_time);

  std::optional<db::model::DocumentRecord> current;
  if (existing) {
    current = repository_->GetDocument(*tx, existing->document_id);
  }

  // Unchanged since the last scan: no hashing.
  if (existing && current && !force_rescan && IsFresh(*existing, *current, size, mtime_ns)) {
    auto result = ProcessingResult::kReusedCopy;
    if (!current->content && !RetryExtraction(*tx, *current, abs_path)) {
      result = ProcessingResult::kExtractionFailed;
    }
    tx->Commit();
    return {existing, result};
  }

  std::string hash;
  try {
    hash = hasher_->Hash(abs_path);
  } catch (const util::FileOperationError& e) {
    DOCMAN_LOG_WARN("hash failed", {StringField("path", abs_path.string()), StringField("error", e.what())});
    tx->Rollback();
    return {existing, ProcessingResult::kHashFailed};
  }

  // Same content as before: refresh the cache only.
  if (existing && current && hash == current->content_hash) {
    StampMetadata(*existing, hash, size, mtime_ns);
    ThrowIfDbError(repository_->UpdateCopy(*tx, *existing), "refresh copy metadata");

    auto result = ProcessingResult::kReusedCopy;
    if (!current->content && !RetryExtraction(*tx, *current, abs_path)) {
      result = ProcessingResult::kExtractionFailed;
    }
    tx->Commit();
    return {existing, result};
  }

  bool created  = false;
  auto document = repository_->FindDocumentByHash(*tx, hash);
  if (!document) {
    db::model::DocumentRecord record;
    record.content_hash = hash;
    record.content      = ExtractSafely(abs_path);
    ThrowIfDbError(repository_->InsertDocument(*tx, record), "insert document");
    document = std::move(record);
    created  = true;
    DOCMAN_LOG_INFO("new document", {IntField("document_id", document->id), StringField("path", rel_path),
                                     StringField("content_hash", hash)});
  } else if (!document->content) {
    RetryExtraction(*tx, *document, abs_path);
  }

  ProcessingResult              result;
  db::model::DocumentCopyRecord copy;
  if (!existing) {
    copy.document_id     = document->id;
    copy.repository_path = repo_key;
    copy.file_path       = rel_path;
    StampMetadata(copy, hash, size, mtime_ns);
    ThrowIfDbError(repository_->InsertCopy(*tx, copy), "insert copy");
    result = created ? ProcessingResult::kNewDocument : ProcessingResult::kDuplicateDocument;
  } else {
    // Overwritten in place: repoint and drop the suggestion made for the old content.
    copy             = *existing;
    copy.document_id = document->id;
    StampMetadata(copy, hash, size, mtime_ns);
    ThrowIfDbError(repository_->UpdateCopy(*tx, copy), "repoint copy");
    ThrowIfDbError(repository_->DeletePendingOperationsForCopy(*tx, copy.id), "drop stale pending operation");
    result = ProcessingResult::kUpdatedDocument;
    DOCMAN_LOG_INFO("copy repointed", {IntField("copy_id", copy.id), IntField("from_document_id", existing->document_id),
                                       IntField("to_document_id", document->id), StringField("path", rel_path)});
  }

  if (!document->content) {
    result = ProcessingResult::kExtractionFailed;
  }

  tx->Commit();
  return {copy, result};
}

ScanSummary DocumentProcessor::ScanRepository(const fs::path& repository_path, const std::vector<std::string>& files,
                                              bool force_rescan) {
  ScanSummary summary;
  for (const auto& file : files) {
    try {
      summary.Count(ProcessDocumentFile(repository_path, file, force_rescan).result);
    } catch (const std::exception& e) {
      ++summary.errors;
      DOCMAN_LOG_ERROR("processing failed", {StringField("path", file), StringField("error", e.what())});
    }
  }

  DOCMAN_LOG_INFO("scan complete",
                  {StringField("repository", repository_path.string()),
                   IntField("files", static_cast<int64_t>(files.size())),
                   IntField("new", static_cast<int64_t>(summary.new_documents)),
                   IntField("updated", static_cast<int64_t>(summary.updated_documents)),
                   IntField("duplicates", static_cast<int64_t>(summary.duplicate_documents)),
                   IntField("reused", static_cast<int64_t>(summary.reused_copies)),
                   IntField("extraction_failed", static_cast<int64_t>(summary.extraction_failed)),
                   IntField("hash_failed", static_cast<int64_t>(summary.hash_failed)),
                   IntField("errors", static_cast<int64_t>(summary.errors))});
  return summary;
}

} // namespace docman::core
