#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docman::storage {

// How to treat an existing file at the move target.
enum class ConflictPolicy {
  kSkip,      // leave both files untouched and report a conflict
  kOverwrite, // replace the existing target (kept aside until FinalizeMove)
  kRename,    // move to the first free stem_N.ext sibling
};

std::string_view              ToString(ConflictPolicy policy);
std::optional<ConflictPolicy> ParseConflictPolicy(std::string_view value);

enum class MoveOutcome {
  kMoved,
  kAlreadyInPlace,
  kSourceNotFound,
  kConflict,
};

struct MoveResult {
  MoveOutcome           outcome = MoveOutcome::kMoved;
  std::filesystem::path source;
  std::filesystem::path target;     // requested target, resolved
  std::filesystem::path final_path; // where the file ended up; empty on failure
  std::string           message;

  // OVERWRITE: hidden sibling holding the replaced target. Empty otherwise.
  std::filesystem::path displaced_path;
  // Directories this move created, deepest first.
  std::vector<std::filesystem::path> created_dirs;

  bool ok() const {
    return outcome == MoveOutcome::kMoved || outcome == MoveOutcome::kAlreadyInPlace;
  }
};

/*
  Relocates one regular file.

  Expected branches (missing source, SKIP conflict, source already at target)
  come back as a MoveResult. Genuine I/O failures throw util::PermissionDenied
  or util::FileOperationError, after putting back anything the move had
  already touched. Nothing on disk changes unless the outcome is kMoved.

  OVERWRITE refuses a directory target. The replaced file is renamed to
  `displaced_path` rather than deleted; the caller settles the move with
  FinalizeMove (drop it) or UndoMove (put everything back).

  Same-filesystem moves are a single rename; cross-device moves fall back to
  copy then delete.
*/
MoveResult MoveFile(const std::filesystem::path& source,
                    const std::filesystem::path& target,
                    ConflictPolicy               policy      = ConflictPolicy::kSkip,
                    bool                         create_dirs = true);

// file.pdf -> file_1.pdf -> file_2.pdf ... first name that does not exist.
// Returns `path` itself when it is free.
std::filesystem::path UniqueSiblingPath(const std::filesystem::path& path);

// Deletes the displaced target of an OVERWRITE move, if any.
void FinalizeMove(const MoveResult& result);

// Reverses a kMoved result: the file goes back to `source`, the displaced
// target is restored, and created directories are removed while empty.
// Returns false (and logs) when some step could not be undone.
bool UndoMove(const MoveResult& result);

// Converts the expected failure branches into exceptions
// (FileNotFoundError, FileConflictError). Returns the final path.
const std::filesystem::path& ThrowIfFailed(const MoveResult& result);

} // namespace docman::storage
