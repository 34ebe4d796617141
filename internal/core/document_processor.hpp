#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/processing_result.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/extraction/content_extractor.hpp"
#include "internal/storage/content_hasher.hpp"

namespace docman::core {

struct ProcessedFile {
  // Copy as stored after the run; the prior copy (or nullopt) on HASH_FAILED.
  std::optional<db::model::DocumentCopyRecord> copy;
  ProcessingResult                             result = ProcessingResult::kHashFailed;
};

struct ScanSummary {
  std::size_t new_documents       = 0;
  std::size_t updated_documents   = 0;
  std::size_t duplicate_documents = 0;
  std::size_t reused_copies       = 0;
  std::size_t extraction_failed   = 0;
  std::size_t hash_failed         = 0;
  std::size_t errors              = 0; // store or unexpected failures

  void Count(ProcessingResult result);

  std::size_t Total() const {
    return new_documents + updated_documents + duplicate_documents + reused_copies + extraction_failed + hash_failed +
           errors;
  }
};

/*
  DocumentProcessor

  The only writer of Document and DocumentCopy rows from scan activity.

  Each ProcessDocumentFile call runs in one transaction: either every record
  change for that file lands, or none does. Hash failures return before any
  write. Extraction failures are recorded as null content, never thrown.

  repository_path must be absolute and is used verbatim as the copy's
  repository_path; file_path is relative to it.
*/
class DocumentProcessor {
 public:
  DocumentProcessor(std::shared_ptr<db::Repository>              repository,
                    std::shared_ptr<storage::ContentHasher>      hasher,
                    std::shared_ptr<extraction::ContentExtractor> extractor);

  ProcessedFile ProcessDocumentFile(const std::filesystem::path& repository_path,
                                    const std::string&           file_path,
                                    bool                         force_rescan = false);

  // Runs the pipeline over `files` in order. One file's failure never
  // aborts the batch.
  ScanSummary ScanRepository(const std::filesystem::path&    repository_path,
                             const std::vector<std::string>& files,
                             bool                            force_rescan = false);

 private:
  std::optional<std::string> ExtractSafely(const std::filesystem::path& path);
  bool RetryExtraction(db::Transaction& tx, db::model::DocumentRecord& document, const std::filesystem::path& path);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<storage::ContentHasher>       hasher_;
  std::shared_ptr<extraction::ContentExtractor> extractor_;
};

} // namespace docman::core
