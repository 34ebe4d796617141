#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/storage/file_mover.hpp"

namespace docman::core {

enum class ApplyStatus {
  kApplied,
  kAlreadyInPlace,
  kConflict,      // SKIP policy hit an existing file; nothing changed
  kSourceMissing, // the copy's file is gone; nothing changed
};

std::string_view ToString(ApplyStatus status);

struct ApplyResult {
  ApplyStatus            status = ApplyStatus::kApplied;
  std::filesystem::path  final_path;
  std::string            message;
  std::optional<int64_t> operation_id;
};

enum class BulkOutcome {
  kApplied, // dry run: would be applied
  kAlreadyInPlace,
  kConflict,
  kSourceMissing,
  kRejected, // suggestion failed path validation
  kFailed,   // move raised a file operation error
};

std::string_view ToString(BulkOutcome outcome);

struct BulkApplyItem {
  int64_t     pending_id = 0;
  BulkOutcome outcome    = BulkOutcome::kApplied;
  std::string message;
};

struct BulkApplySummary {
  bool                       dry_run = false;
  std::vector<BulkApplyItem> items;

  std::size_t Count(BulkOutcome outcome) const;
};

/*
  OrganizationApplier

  Applies one pending suggestion: validate the target, move the file, then
  record the outcome. Records change only after a confirmed move, and a
  move is never attempted without a validated target.

  Path validation failures raise util::PathSecurityError. Move I/O failures
  raise util::FileOperationError / util::PermissionDenied. If the store
  write fails after the move, the move is undone (file moved back, replaced
  target restored, created directories removed) before rethrowing.
*/
class OrganizationApplier {
 public:
  explicit OrganizationApplier(std::shared_ptr<db::Repository> repository);

  ApplyResult Apply(int64_t pending_id, storage::ConflictPolicy policy, bool create_dirs = true);

  // Records a rejected operation and drops the suggestion. Returns the
  // operation id.
  int64_t Reject(int64_t pending_id);

  // Applies every pending operation of the repository, one transaction each.
  // Suggestions that fail path validation are rejected. Per-operation file
  // errors are collected; store errors propagate. A dry run only classifies.
  BulkApplySummary ApplyAll(const std::string& repository_path, storage::ConflictPolicy policy, bool dry_run,
                            bool create_dirs = true);

 private:
  BulkOutcome Preview(const db::model::PendingOperationRecord& pending, storage::ConflictPolicy policy);

  void DropDisplacedCopy(db::Transaction& tx, const db::model::DocumentCopyRecord& mover, const std::string& file_path);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace docman::core
