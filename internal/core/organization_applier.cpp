#include "internal/core/organization_applier.hpp"

#include <system_error>
#include <utility>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/path_security.hpp"
#include "internal/util/errors.hpp"

namespace docman::core {

namespace fs = std::filesystem;

using docman::model::OperationOutcome;
using docman::model::OrganizationStatus;
using docman::observability::BoolField;
using docman::observability::IntField;
using docman::observability::StringField;

namespace {

fs::path Canonical(const fs::path& p) {
  std::error_code ec;
  auto resolved = fs::weakly_canonical(p, ec);
  return ec ? p.lexically_normal() : resolved;
}

db::model::OperationRecord MakeOperation(const db::model::PendingOperationRecord& pending,
                                         const db::model::DocumentCopyRecord&     copy,
                                         OperationOutcome                         outcome) {
  db::model::OperationRecord op;
  op.document_copy_id         = copy.id;
  op.original_file_path       = copy.file_path;
  op.original_repository_path = copy.repository_path;
  op.suggested_directory_path = pending.suggested_directory_path;
  op.suggested_filename       = pending.suggested_filename;
  op.reason                   = pending.reason;
  op.prompt_hash              = pending.prompt_hash;
  op.outcome                  = outcome;
  return op;
}

} // namespace

std::string_view ToString(ApplyStatus status) {
  switch (status) {
    case ApplyStatus::kApplied:
      return "applied";
    case ApplyStatus::kAlreadyInPlace:
      return "already_in_place";
    case ApplyStatus::kConflict:
      return "conflict";
    case ApplyStatus::kSourceMissing:
      return "source_missing";
  }
  return "conflict";
}

OrganizationApplier::OrganizationApplier(std::shared_ptr<db::Repository> repository)
    : repository_(std::move(repository)) {
}

void OrganizationApplier::DropDisplacedCopy(db::Transaction& tx, const db::model::DocumentCopyRecord& mover,
                                            const std::string& file_path) {
  auto displaced = repository_->FindCopyByPath(tx, mover.repository_path, file_path);
  if (!displaced || displaced->id == mover.id) {
    return;
  }

  // OVERWRITE replaced a tracked file; its record no longer describes anything.
  ThrowIfDbError(repository_->DeletePendingOperationsForCopy(tx, displaced->id), "drop displaced pending operation");
  ThrowIfDbError(repository_->DeleteCopy(tx, displaced->id), "delete displaced copy");
  if (repository_->ListCopiesForDocument(tx, displaced->document_id).empty()) {
    ThrowIfDbError(repository_->DeleteDocument(tx, displaced->document_id), "delete orphaned document");
  }
  DOCMAN_LOG_WARN("overwrote tracked file", {IntField("copy_id", displaced->id), StringField("path", file_path)});
}

ApplyResult OrganizationApplier::Apply(int64_t pending_id, storage::ConflictPolicy policy, bool create_dirs) {
  auto tx = repository_->Begin();

  auto pending = repository_->GetPendingOperation(*tx, pending_id);
  if (!pending) {
    throw util::NotFound("pending operation " + std::to_string(pending_id) + " not found");
  }
  if (!pending->document_copy_id) {
    throw util::InvalidState("pending operation " + std::to_string(pending_id) + " has no document copy");
  }
  auto copy = repository_->GetCopy(*tx, *pending->document_copy_id);
  if (!copy) {
    throw util::NotFound("document copy " + std::to_string(*pending->document_copy_id) + " not found");
  }

  const fs::path root(copy->repository_path);
  const auto     target = storage::ValidateTargetPath(root, pending->suggested_directory_path, pending->suggested_filename);
  const auto     source = root / fs::path(copy->file_path);
  storage::ValidateRepositoryPath(source, root);

  auto moved = storage::MoveFile(source, target, policy, create_dirs);

  ApplyResult result;
  result.final_path = moved.final_path;
  result.message    = moved.message;

  switch (moved.outcome) {
    case storage::MoveOutcome::kSourceNotFound:
      result.status = ApplyStatus::kSourceMissing;
      return result;
    case storage::MoveOutcome::kConflict:
      result.status = ApplyStatus::kConflict;
      return result;
    case storage::MoveOutcome::kAlreadyInPlace:
      result.status = ApplyStatus::kAlreadyInPlace;
      break;
    case storage::MoveOutcome::kMoved:
      result.status = ApplyStatus::kApplied;
      break;
  }

  const auto final_rel = moved.final_path.lexically_relative(Canonical(root)).generic_string();

  try {
    auto op            = MakeOperation(*pending, *copy, OperationOutcome::kAccepted);
    op.final_file_path = final_rel;

    DropDisplacedCopy(*tx, *copy, final_rel);

    auto updated                = *copy;
    updated.file_path           = final_rel;
    updated.organization_status = OrganizationStatus::kOrganized;
    ThrowIfDbError(repository_->UpdateCopy(*tx, updated), "update organized copy");
    ThrowIfDbError(repository_->InsertOperation(*tx, op), "record operation");
    ThrowIfDbError(repository_->DeletePendingOperation(*tx, pending_id), "consume pending operation");
    tx->Commit();
    result.operation_id = op.id;
  } catch (const std::exception& e) {
    if (moved.outcome == storage::MoveOutcome::kMoved) {
      if (storage::UndoMove(moved)) {
        DOCMAN_LOG_WARN("restored file after store error",
                        {StringField("path", source.string()), StringField("error", e.what())});
      } else {
        DOCMAN_LOG_ERROR("could not fully restore file after store error",
                         {StringField("path", moved.final_path.string()), StringField("original", source.string()),
                          StringField("error", e.what())});
      }
    }
    throw;
  }

  try {
    storage::FinalizeMove(moved);
  } catch (const util::FileOperationError& e) {
    // the move is recorded; only the replaced file lingers
    DOCMAN_LOG_WARN("replaced file left behind", {StringField("path", moved.displaced_path.string()),
                                                  StringField("error", e.what())});
  }

  DOCMAN_LOG_INFO("applied pending operation", {IntField("pending_id", pending_id), IntField("copy_id", copy->id),
                                                StringField("from", copy->file_path), StringField("to", final_rel),
                                                StringField("status", ToString(result.status))});
  return result;
}

int64_t OrganizationApplier::Reject(int64_t pending_id) {
  auto tx = repository_->Begin();

  auto pending = repository_->GetPendingOperation(*tx, pending_id);
  if (!pending) {
    throw util::NotFound("pending operation " + std::to_string(pending_id) + " not found");
  }

  db::model::OperationRecord op;
  std::optional<db::model::DocumentCopyRecord> copy;
  if (pending->document_copy_id) {
    copy = repository_->GetCopy(*tx, *pending->document_copy_id);
  }
  if (copy) {
    op = MakeOperation(*pending, *copy, OperationOutcome::kRejected);
  } else {
    op.suggested_directory_path = pending->suggested_directory_path;
    op.suggested_filename       = pending->suggested_filename;
    op.reason                   = pending->reason;
    op.prompt_hash              = pending->prompt_hash;
    op.outcome                  = OperationOutcome::kRejected;
  }

  ThrowIfDbError(repository_->InsertOperation(*tx, op), "record rejection");
  ThrowIfDbError(repository_->DeletePendingOperation(*tx, pending_id), "drop pending operation");
  tx->Commit();

  DOCMAN_LOG_INFO("rejected pending operation", {IntField("pending_id", pending_id), IntField("operation_id", op.id)});
  return op.id;
}

std::string_view ToString(BulkOutcome outcome) {
  switch (outcome) {
    case BulkOutcome::kApplied:
      return "applied";
    case BulkOutcome::kAlreadyInPlace:
      return "already_in_place";
    case BulkOutcome::kConflict:
      return "conflict";
    case BulkOutcome::kSourceMissing:
      return "source_missing";
    case BulkOutcome::kRejected:
      return "rejected";
    case BulkOutcome::kFailed:
      return "failed";
  }
  return "failed";
}

std::size_t BulkApplySummary::Count(BulkOutcome outcome) const {
  std::size_t n = 0;
  for (const auto& item : items) {
    if (item.outcome == outcome) ++n;
  }
  return n;
}

BulkApplySummary OrganizationApplier::ApplyAll(const std::string& repository_path, storage::ConflictPolicy policy,
                                               bool dry_run, bool create_dirs) {
  std::vector<db::model::PendingOperationRecord> pending;
  {
    auto tx = repository_->Begin();
    pending = repository_->ListPendingOperations(*tx, repository_path);
    tx->Rollback();
  }

  BulkApplySummary summary;
  summary.dry_run = dry_run;

  const fs::path root(repository_path);
  for (const auto& op : pending) {
    BulkApplyItem item;
    item.pending_id = op.id;

    try {
      (void)storage::ValidateTargetPath(root, op.suggested_directory_path, op.suggested_filename);
    } catch (const util::PathSecurityError& e) {
      item.outcome = BulkOutcome::kRejected;
      item.message = e.what();
      if (!dry_run) {
        (void)Reject(op.id);
      }
      DOCMAN_LOG_WARN("invalid suggestion rejected", {IntField("pending_id", op.id), BoolField("dry_run", dry_run),
                                                      StringField("error", e.what())});
      summary.items.push_back(std::move(item));
      continue;
    }

    if (dry_run) {
      item.outcome = Preview(op, policy);
      summary.items.push_back(std::move(item));
      continue;
    }

    try {
      auto applied = Apply(op.id, policy, create_dirs);
      item.message = applied.message;
      switch (applied.status) {
        case ApplyStatus::kApplied:
          item.outcome = BulkOutcome::kApplied;
          break;
        case ApplyStatus::kAlreadyInPlace:
          item.outcome = BulkOutcome::kAlreadyInPlace;
          break;
        case ApplyStatus::kConflict:
          item.outcome = BulkOutcome::kConflict;
          break;
        case ApplyStatus::kSourceMissing:
          item.outcome = BulkOutcome::kSourceMissing;
          break;
      }
    } catch (const util::FileOperationError& e) {
      item.outcome = BulkOutcome::kFailed;
      item.message = e.what();
      DOCMAN_LOG_ERROR("bulk apply failed for operation", {IntField("pending_id", op.id), StringField("error", e.what())});
    }
    summary.items.push_back(std::move(item));
  }

  DOCMAN_LOG_INFO("bulk apply finished",
                  {StringField("repository", repository_path), BoolField("dry_run", dry_run),
                   IntField("applied", static_cast<int64_t>(summary.Count(BulkOutcome::kApplied))),
                   IntField("rejected", static_cast<int64_t>(summary.Count(BulkOutcome::kRejected))),
                   IntField("failed", static_cast<int64_t>(summary.Count(BulkOutcome::kFailed)))});
  return summary;
}

BulkOutcome OrganizationApplier::Preview(const db::model::PendingOperationRecord& pending,
                                         storage::ConflictPolicy                  policy) {
  std::optional<db::model::DocumentCopyRecord> copy;
  if (pending.document_copy_id) {
    auto tx = repository_->Begin();
    copy    = repository_->GetCopy(*tx, *pending.document_copy_id);
    tx->Rollback();
  }
  if (!copy) {
    return BulkOutcome::kSourceMissing;
  }

  const fs::path root(copy->repository_path);
  const auto     source = root / fs::path(copy->file_path);
  const auto     target = storage::ValidateTargetPath(root, pending.suggested_directory_path, pending.suggested_filename);

  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) {
    return BulkOutcome::kSourceMissing;
  }
  if (Canonical(source) == Canonical(target)) {
    return BulkOutcome::kAlreadyInPlace;
  }
  if (fs::exists(target, ec) && policy == storage::ConflictPolicy::kSkip) {
    return BulkOutcome::kConflict;
  }
  return BulkOutcome::kApplied;
}

} // namespace docman::core
