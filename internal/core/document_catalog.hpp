#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/status.hpp"

namespace docman::core {

// Output of the external suggestion engine for one copy.
struct Suggestion {
  std::string directory_path;
  std::string filename;
  std::string reason;
  double      confidence = 0.0;
  std::string prompt_hash;
};

struct CopyFilter {
  // '/'-separated, relative to the repository. Empty selects the whole tree.
  std::string path;
  bool        recursive = true;

  std::optional<docman::model::OrganizationStatus> status;
};

using DuplicateGroups = std::map<int64_t, std::vector<db::model::DocumentCopyRecord>>;

struct DuplicateSummary {
  std::size_t groups = 0;
  std::size_t copies = 0;
};

// Target "dir/filename" -> every pending operation aiming at it.
using TargetConflicts = std::map<std::string, std::vector<db::model::PendingOperationRecord>>;

// Per-repository overview.
struct RepositoryStatus {
  std::size_t      copies      = 0;
  std::size_t      unorganized = 0;
  std::size_t      organized   = 0;
  std::size_t      ignored     = 0;
  std::size_t      pending     = 0;
  std::size_t      conflicting = 0; // pending operations sharing a target
  DuplicateSummary duplicates;
};

struct CleanupResult {
  std::size_t deleted = 0;
  std::size_t updated = 0;
};

/*
  DocumentCatalog

  Store maintenance and queries behind the command surface: suggestion
  intake, ignore/unmark, duplicate handling and orphan cleanup.

  Copy deletion here cascades explicitly: a document whose last copy goes
  away is deleted with it.
*/
class DocumentCatalog {
 public:
  explicit DocumentCatalog(std::shared_ptr<db::Repository> repository);

  // Replaces any pending operation already recorded for the copy.
  db::model::PendingOperationRecord RecordSuggestion(int64_t copy_id, const Suggestion& suggestion);

  // Set status and drop pending operations. No filesystem changes.
  std::size_t IgnoreCopies(const std::vector<int64_t>& copy_ids);
  std::size_t UnmarkCopies(const std::vector<int64_t>& copy_ids);

  std::vector<db::model::DocumentCopyRecord> SelectCopies(const std::string& repository_path,
                                                          const CopyFilter&  filter);

  DuplicateGroups FindDuplicateGroups(const std::string& repository_path);
  static DuplicateSummary Summarize(const DuplicateGroups& groups);

  // Deletes every other copy of the document in this repository, file and
  // record. Returns the number of copies removed.
  std::size_t RemoveDuplicateCopies(const std::filesystem::path& repository_path, int64_t document_id,
                                    int64_t keep_copy_id);

  TargetConflicts DetectTargetConflicts(const std::string& repository_path);

  // Drops copies whose files are gone and stamps last_seen_at on the rest.
  CleanupResult CleanupOrphanedCopies(const std::filesystem::path& repository_path);

  RepositoryStatus Status(const std::string& repository_path);

  std::vector<db::model::PendingOperationRecord> ListPendingOperations(const std::string& repository_path);
  std::vector<db::model::OperationRecord>        ListOperations(const std::string& repository_path);

 private:
  std::size_t SetStatus(const std::vector<int64_t>& copy_ids, docman::model::OrganizationStatus status);
  void        DeleteCopyCascading(db::Transaction& tx, const db::model::DocumentCopyRecord& copy);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace docman::core
