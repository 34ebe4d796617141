#include "internal/storage/file_mover.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace docman::storage {

namespace fs = std::filesystem;

using docman::observability::StringField;

namespace {

[[noreturn]] void ThrowMoveError(const fs::path& source, const fs::path& target, const std::error_code& ec,
                                 const std::string& what) {
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    throw util::PermissionDenied(source, target, ec.message());
  }
  throw util::FileOperationError(what + ": " + ec.message());
}

fs::path Resolve(const fs::path& p) {
  std::error_code ec;
  auto resolved = fs::weakly_canonical(p, ec);
  return ec ? fs::absolute(p).lexically_normal() : resolved;
}

// rename(2), or copy + unlink when source and target are on different devices.
void Relocate(const fs::path& source, const fs::path& target) {
  std::error_code ec;
  fs::rename(source, target, ec);
  if (!ec) return;

  if (ec != std::errc::cross_device_link) {
    ThrowMoveError(source, target, ec, "Failed to move " + source.string() + " to " + target.string());
  }

  std::error_code copy_err;
  fs::copy_file(source, target, fs::copy_options::overwrite_existing, copy_err);
  if (copy_err) {
    std::error_code cleanup_err;
    fs::remove(target, cleanup_err);
    ThrowMoveError(source, target, copy_err, "Failed to copy " + source.string() + " to " + target.string());
  }

  std::error_code remove_err;
  fs::remove(source, remove_err);
  if (remove_err) {
    ThrowMoveError(source, target, remove_err,
                   "Copied " + source.string() + " to " + target.string() + " but failed to remove the original");
  }

  DOCMAN_LOG_INFO("cross-device move", {StringField("source", source.string()), StringField("target", target.string())});
}

// Parent directories of `dir` that do not exist yet, deepest first.
std::vector<fs::path> MissingDirectories(const fs::path& dir) {
  std::vector<fs::path> missing;
  std::error_code       ec;
  for (auto p = dir; !p.empty() && !fs::exists(p, ec); p = p.parent_path()) {
    missing.push_back(p);
    if (p == p.parent_path()) break;
  }
  return missing;
}

fs::path DisplacedPathFor(const fs::path& target) {
  return UniqueSiblingPath(target.parent_path() / ("." + target.filename().string() + ".docman-displaced"));
}

} // namespace

std::string_view ToString(ConflictPolicy policy) {
  switch (policy) {
    case ConflictPolicy::kSkip:
      return "skip";
    case ConflictPolicy::kOverwrite:
      return "overwrite";
    case ConflictPolicy::kRename:
      return "rename";
  }
  return "skip";
}

std::optional<ConflictPolicy> ParseConflictPolicy(std::string_view value) {
  if (value == "skip") return ConflictPolicy::kSkip;
  if (value == "overwrite") return ConflictPolicy::kOverwrite;
  if (value == "rename") return ConflictPolicy::kRename;
  return std::nullopt;
}

fs::path UniqueSiblingPath(const fs::path& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return path;

  const auto stem      = path.stem().string();
  const auto extension = path.extension().string();
  const auto parent    = path.parent_path();

  for (std::size_t counter = 1;; ++counter) {
    auto candidate = parent / (stem + "_" + std::to_string(counter) + extension);
    if (!fs::exists(candidate, ec)) {
      if (ec) {
        throw util::FileOperationError("Failed to check for existing file " + candidate.string() + ": " + ec.message());
      }
      return candidate;
    }
  }
}

MoveResult MoveFile(const fs::path& source, const fs::path& target, ConflictPolicy policy, bool create_dirs) {
  MoveResult result;
  result.source = source;

  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) {
    result.outcome = MoveOutcome::kSourceNotFound;
    result.message = "Source file not found: " + source.string();
    return result;
  }

  auto resolved_target = Resolve(target);
  result.target        = resolved_target;

  if (Resolve(source) == resolved_target) {
    result.outcome    = MoveOutcome::kAlreadyInPlace;
    result.final_path = resolved_target;
    return result;
  }

  const auto parent = resolved_target.parent_path();
  if (create_dirs) {
    auto missing = MissingDirectories(parent);
    fs::create_directories(parent, ec);
    if (ec) {
      ThrowMoveError(source, resolved_target, ec, "Failed to create directory " + parent.string());
    }
    result.created_dirs = std::move(missing);
  } else if (!fs::is_directory(parent, ec)) {
    throw util::FileOperationError("Target directory does not exist: " + parent.string());
  }

  auto final_target = resolved_target;
  if (fs::exists(resolved_target, ec)) {
    switch (policy) {
      case ConflictPolicy::kSkip:
        result.outcome = MoveOutcome::kConflict;
        result.message = "Target file already exists: " + resolved_target.string();
        DOCMAN_LOG_WARN("move skipped, target exists",
                        {StringField("source", source.string()), StringField("target", resolved_target.string())});
        return result;

      case ConflictPolicy::kOverwrite: {
        if (fs::is_directory(resolved_target, ec)) {
          throw util::FileOperationError("Cannot overwrite directory " + resolved_target.string());
        }
        auto displaced = DisplacedPathFor(resolved_target);
        fs::rename(resolved_target, displaced, ec);
        if (ec) {
          ThrowMoveError(source, resolved_target, ec, "Failed to set aside existing target " + resolved_target.string());
        }
        result.displaced_path = displaced;
        break;
      }

      case ConflictPolicy::kRename:
        final_target = UniqueSiblingPath(resolved_target);
        break;
    }
  }

  try {
    Relocate(source, final_target);
  } catch (const std::exception&) {
    // the file never left `source`; put the rest back
    result.final_path.clear();
    (void)UndoMove(result);
    throw;
  }

  result.outcome    = MoveOutcome::kMoved;
  result.final_path = final_target;
  DOCMAN_LOG_INFO("moved file", {StringField("source", source.string()), StringField("target", final_target.string()),
                                 StringField("policy", ToString(policy))});
  return result;
}

void FinalizeMove(const MoveResult& result) {
  if (result.displaced_path.empty()) return;
  std::error_code ec;
  fs::remove(result.displaced_path, ec);
  if (ec) {
    throw util::FileOperationError("Failed to remove replaced file " + result.displaced_path.string() + ": " +
                                   ec.message());
  }
}

bool UndoMove(const MoveResult& result) {
  bool            clean = true;
  std::error_code ec;

  if (!result.final_path.empty() && result.final_path != result.source) {
    fs::rename(result.final_path, result.source, ec);
    if (ec) {
      DOCMAN_LOG_ERROR("failed to move file back", {StringField("path", result.final_path.string()),
                                                    StringField("source", result.source.string()),
                                                    StringField("error", ec.message())});
      return false;
    }
  }

  if (!result.displaced_path.empty()) {
    fs::rename(result.displaced_path, result.target, ec);
    if (ec) {
      DOCMAN_LOG_ERROR("failed to restore replaced file", {StringField("path", result.displaced_path.string()),
                                                           StringField("target", result.target.string()),
                                                           StringField("error", ec.message())});
      clean = false;
    }
  }

  for (const auto& dir : result.created_dirs) {
    if (!fs::is_empty(dir, ec) || ec) break;
    fs::remove(dir, ec);
    if (ec) {
      DOCMAN_LOG_WARN("failed to remove created directory",
                      {StringField("path", dir.string()), StringField("error", ec.message())});
      clean = false;
      break;
    }
  }
  return clean;
}

const fs::path& ThrowIfFailed(const MoveResult& result) {
  switch (result.outcome) {
    case MoveOutcome::kSourceNotFound:
      throw util::FileNotFoundError(result.source);
    case MoveOutcome::kConflict:
      throw util::FileConflictError(result.source, result.target);
    case MoveOutcome::kMoved:
    case MoveOutcome::kAlreadyInPlace:
      break;
  }
  return result.final_path;
}

} // namespace docman::storage
