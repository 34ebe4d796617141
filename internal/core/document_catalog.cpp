#include "internal/core/document_catalog.hpp"

#include <system_error>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/path_security.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace docman::core {

namespace fs = std::filesystem;

using docman::model::OrganizationStatus;
using docman::observability::IntField;
using docman::observability::StringField;

namespace {

bool MatchesPath(const std::string& file_path, const CopyFilter& filter) {
  if (filter.path.empty()) {
    return filter.recursive || file_path.find('/') == std::string::npos;
  }
  if (file_path == filter.path) {
    return true;
  }

  const auto prefix = filter.path.back() == '/' ? filter.path : filter.path + "/";
  if (file_path.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  return filter.recursive || file_path.find('/', prefix.size()) == std::string::npos;
}

std::string TargetKey(const db::model::PendingOperationRecord& op) {
  if (op.suggested_directory_path.empty()) {
    return op.suggested_filename;
  }
  return op.suggested_directory_path + "/" + op.suggested_filename;
}

} // namespace

DocumentCatalog::DocumentCatalog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::PendingOperationRecord DocumentCatalog::RecordSuggestion(int64_t copy_id, const Suggestion& suggestion) {
  auto tx = repository_->Begin();
  if (!repository_->GetCopy(*tx, copy_id)) {
    throw util::NotFound("document copy " + std::to_string(copy_id) + " not found");
  }

  db::model::PendingOperationRecord pending;
  pending.document_copy_id         = copy_id;
  pending.suggested_directory_path = suggestion.directory_path;
  pending.suggested_filename       = suggestion.filename;
  pending.reason                   = suggestion.reason;
  pending.confidence               = suggestion.confidence;
  pending.prompt_hash              = suggestion.prompt_hash;

  ThrowIfDbError(repository_->UpsertPendingOperation(*tx, pending), "record suggestion");
  tx->Commit();
  return pending;
}

std::size_t DocumentCatalog::SetStatus(const std::vector<int64_t>& copy_ids, OrganizationStatus status) {
  auto        tx      = repository_->Begin();
  std::size_t changed = 0;

  for (auto id : copy_ids) {
    auto copy = repository_->GetCopy(*tx, id);
    if (!copy) {
      throw util::NotFound("document copy " + std::to_string(id) + " not found");
    }
    ThrowIfDbError(repository_->DeletePendingOperationsForCopy(*tx, id), "drop pending operations");
    if (copy->organization_status != status) {
      copy->organization_status = status;
      ThrowIfDbError(repository_->UpdateCopy(*tx, *copy), "update organization status");
      ++changed;
    }
  }

  tx->Commit();
  DOCMAN_LOG_INFO("organization status set", {StringField("status", docman::model::ToString(status)),
                                              IntField("copies", static_cast<int64_t>(copy_ids.size())),
                                              IntField("changed", static_cast<int64_t>(changed))});
  return changed;
}

std::size_t DocumentCatalog::IgnoreCopies(const std::vector<int64_t>& copy_ids) {
  return SetStatus(copy_ids, OrganizationStatus::kIgnored);
}

std::size_t DocumentCatalog::UnmarkCopies(const std::vector<int64_t>& copy_ids) {
  return SetStatus(copy_ids, OrganizationStatus::kUnorganized);
}

std::vector<db::model::DocumentCopyRecord> DocumentCatalog::SelectCopies(const std::string& repository_path,
                                                                         const CopyFilter&  filter) {
  auto tx     = repository_->Begin();
  auto copies = repository_->ListCopies(*tx, repository_path);
  tx->Rollback();

  std::vector<db::model::DocumentCopyRecord> out;
  for (auto& copy : copies) {
    if (filter.status && copy.organization_status != *filter.status) continue;
    if (!MatchesPath(copy.file_path, filter)) continue;
    out.push_back(std::move(copy));
  }
  return out;
}

DuplicateGroups DocumentCatalog::FindDuplicateGroups(const std::string& repository_path) {
  auto tx     = repository_->Begin();
  auto copies = repository_->ListCopies(*tx, repository_path);
  tx->Rollback();

  DuplicateGroups groups;
  for (auto& copy : copies) {
    groups[copy.document_id].push_back(std::move(copy));
  }
  std::erase_if(groups, [](const auto& entry) { return entry.second.size() < 2; });
  return groups;
}

DuplicateSummary DocumentCatalog::Summarize(const DuplicateGroups& groups) {
  DuplicateSummary summary;
  summary.groups = groups.size();
  for (const auto& [document_id, copies] : groups) {
    summary.copies += copies.size();
  }
  return summary;
}

void DocumentCatalog::DeleteCopyCascading(db::Transaction& tx, const db::model::DocumentCopyRecord& copy) {
  ThrowIfDbError(repository_->DeletePendingOperationsForCopy(tx, copy.id), "drop pending operations");
  ThrowIfDbError(repository_->DeleteCopy(tx, copy.id), "delete copy");

  if (repository_->ListCopiesForDocument(tx, copy.document_id).empty()) {
    ThrowIfDbError(repository_->DeleteDocument(tx, copy.document_id), "delete orphaned document");
    DOCMAN_LOG_INFO("document deleted with its last copy", {IntField("document_id", copy.document_id)});
  }
}

std::size_t DocumentCatalog::RemoveDuplicateCopies(const fs::path& repository_path, int64_t document_id,
                                                   int64_t keep_copy_id) {
  const auto repo_key = repository_path.string();

  auto tx   = repository_->Begin();
  auto keep = repository_->GetCopy(*tx, keep_copy_id);
  if (!keep) {
    throw util::NotFound("document copy " + std::to_string(keep_copy_id) + " not found");
  }
  if (keep->document_id != document_id || keep->repository_path != repo_key) {
    throw util::InvalidState("copy " + std::to_string(keep_copy_id) + " is not a copy of document " +
                             std::to_string(document_id) + " in " + repo_key);
  }

  std::vector<fs::path> doomed_files;
  for (const auto& copy : repository_->ListCopiesForDocument(*tx, document_id)) {
    if (copy.id == keep_copy_id || copy.repository_path != repo_key) continue;

    auto file = repository_path / fs::path(copy.file_path);
    storage::ValidateRepositoryPath(file, repository_path);

    ThrowIfDbError(repository_->DeletePendingOperationsForCopy(*tx, copy.id), "drop pending operations");
    ThrowIfDbError(repository_->DeleteCopy(*tx, copy.id), "delete duplicate copy");
    doomed_files.push_back(std::move(file));
  }
  tx->Commit();

  // Records are gone; a file that cannot be removed is picked up again by the next scan.
  for (const auto& file : doomed_files) {
    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
      DOCMAN_LOG_ERROR("failed to delete duplicate file", {StringField("path", file.string()), StringField("error", ec.message())});
    } else {
      DOCMAN_LOG_INFO("deleted duplicate file", {StringField("path", file.string()), IntField("document_id", document_id)});
    }
  }
  return doomed_files.size();
}

TargetConflicts DocumentCatalog::DetectTargetConflicts(const std::string& repository_path) {
  auto tx      = repository_->Begin();
  auto pending = repository_->ListPendingOperations(*tx, repository_path);
  tx->Rollback();

  TargetConflicts conflicts;
  for (auto& op : pending) {
    conflicts[TargetKey(op)].push_back(std::move(op));
  }
  std::erase_if(conflicts, [](const auto& entry) { return entry.second.size() < 2; });
  return conflicts;
}

CleanupResult DocumentCatalog::CleanupOrphanedCopies(const fs::path& repository_path) {
  CleanupResult result;
  const auto    now = util::NowMs();

  auto tx = repository_->Begin();
  for (auto& copy : repository_->ListCopies(*tx, repository_path.string())) {
    std::error_code ec;
    const bool      present = fs::exists(repository_path / fs::path(copy.file_path), ec);
    if (!present && !ec) {
      DeleteCopyCascading(*tx, copy);
      ++result.deleted;
      DOCMAN_LOG_INFO("removed orphaned copy", {IntField("copy_id", copy.id), StringField("path", copy.file_path)});
      continue;
    }
    copy.last_seen_at_ms = now;
    ThrowIfDbError(repository_->UpdateCopy(*tx, copy), "stamp last seen");
    ++result.updated;
  }
  tx->Commit();
  return result;
}

RepositoryStatus DocumentCatalog::Status(const std::string& repository_path) {
  RepositoryStatus status;

  std::vector<db::model::DocumentCopyRecord>     copies;
  std::vector<db::model::PendingOperationRecord> pending;
  {
    auto tx = repository_->Begin();
    copies  = repository_->ListCopies(*tx, repository_path);
    pending = repository_->ListPendingOperations(*tx, repository_path);
    tx->Rollback();
  }

  std::map<int64_t, std::size_t> per_document;
  for (const auto& copy : copies) {
    switch (copy.organization_status) {
      case OrganizationStatus::kUnorganized:
        ++status.unorganized;
        break;
      case OrganizationStatus::kOrganized:
        ++status.organized;
        break;
      case OrganizationStatus::kIgnored:
        ++status.ignored;
        break;
    }
    ++per_document[copy.document_id];
  }
  status.copies = copies.size();

  for (const auto& [document_id, count] : per_document) {
    if (count < 2) continue;
    ++status.duplicates.groups;
    status.duplicates.copies += count;
  }

  std::map<std::string, std::size_t> per_target;
  for (const auto& op : pending) {
    ++per_target[TargetKey(op)];
  }
  for (const auto& [target, count] : per_target) {
    if (count > 1) status.conflicting += count;
  }
  status.pending = pending.size();
  return status;
}

std::vector<db::model::PendingOperationRecord> DocumentCatalog::ListPendingOperations(const std::string& repository_path) {
  auto tx = repository_->Begin();
  return repository_->ListPendingOperations(*tx, repository_path);
}

std::vector<db::model::OperationRecord> DocumentCatalog::ListOperations(const std::string& repository_path) {
  auto tx = repository_->Begin();
  return repository_->ListOperations(*tx, repository_path);
}

} // namespace docman::core
