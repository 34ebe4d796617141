#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/document_discovery.hpp"
#include "internal/storage/path_security.hpp"
#include "internal/util/errors.hpp"

namespace fs = std::filesystem;

using docman::factory::Runtime;

static void Usage() {
  std::cout << "Usage:\n"
            << "  docmanctl init [directory]\n"
            << "  docmanctl [--config <file>] scan [path] [-r] [--rescan]\n"
            << "  docmanctl [--config <file>] status\n"
            << "  docmanctl [--config <file>] pending\n"
            << "  docmanctl [--config <file>] apply <pending_id> [skip|overwrite|rename]\n"
            << "  docmanctl [--config <file>] apply --all [--dry-run] [skip|overwrite|rename]\n"
            << "  docmanctl [--config <file>] reject <pending_id>\n"
            << "  docmanctl [--config <file>] ignore <path> [-r]\n"
            << "  docmanctl [--config <file>] unmark <path> [-r]\n"
            << "  docmanctl [--config <file>] duplicates\n"
            << "  docmanctl [--config <file>] dedupe <document_id> <keep_copy_id>\n"
            << "  docmanctl [--config <file>] conflicts\n"
            << "  docmanctl [--config <file>] history\n"
            << "  docmanctl [--config <file>] cleanup\n";
}

static bool HasFlag(const std::vector<std::string>& args, const std::string& flag) {
  for (const auto& a : args) {
    if (a == flag) return true;
  }
  return false;
}

static std::optional<std::string> FirstPositional(const std::vector<std::string>& args) {
  for (const auto& a : args) {
    if (!a.empty() && a.front() != '-') return a;
  }
  return std::nullopt;
}

// Absolute user path -> '/'-separated path relative to root ("" for root itself).
static std::string RelativeToRoot(const fs::path& root, const std::string& user_path) {
  auto abs = fs::weakly_canonical(fs::absolute(user_path));
  docman::storage::ValidateRepositoryPath(abs, root);
  auto rel = abs.lexically_relative(root).generic_string();
  return rel == "." ? std::string() : rel;
}

static std::map<int64_t, std::string> CopyPaths(Runtime& rt, const fs::path& root) {
  std::map<int64_t, std::string> out;
  for (const auto& copy : rt.catalog->SelectCopies(root.string(), {})) {
    out[copy.id] = copy.file_path;
  }
  return out;
}

static int Scan(Runtime& rt, const fs::path& root, const std::vector<std::string>& args) {
  const bool recursive = HasFlag(args, "-r") || HasFlag(args, "--recursive");
  const bool rescan    = HasFlag(args, "--rescan");
  const auto path      = FirstPositional(args);

  std::vector<std::string> files;
  if (!path) {
    // -r walks the whole repository; otherwise only the current directory
    const auto cwd   = recursive ? std::string() : RelativeToRoot(root, fs::current_path().string());
    const auto start = cwd.empty() ? root : root / fs::path(cwd);
    files            = docman::storage::DiscoverDocumentFiles(root, start, recursive, rt.discovery);
  } else {
    const auto rel   = RelativeToRoot(root, *path);
    const auto start = rel.empty() ? root : root / fs::path(rel);
    if (fs::is_regular_file(start)) {
      if (!docman::storage::IsSupportedDocument(start, rt.discovery)) {
        std::cerr << "unsupported file type '" << start.extension().string() << "'; supported:";
        for (const auto& ext : rt.discovery.supported_extensions) std::cerr << " " << ext;
        std::cerr << "\n";
        return 1;
      }
      files.push_back(rel);
    } else if (fs::is_directory(start)) {
      files = docman::storage::DiscoverDocumentFiles(root, start, recursive, rt.discovery);
    } else {
      std::cerr << "path not found: " << *path << "\n";
      return 1;
    }
  }

  auto summary = rt.processor->ScanRepository(root, files, rescan);
  auto cleanup = rt.catalog->CleanupOrphanedCopies(root);

  std::cout << "scanned " << files.size() << " file(s)\n"
            << "  new:               " << summary.new_documents << "\n"
            << "  updated:           " << summary.updated_documents << "\n"
            << "  duplicates:        " << summary.duplicate_documents << "\n"
            << "  unchanged:         " << summary.reused_copies << "\n"
            << "  extraction failed: " << summary.extraction_failed << "\n"
            << "  hash failed:       " << summary.hash_failed << "\n"
            << "  errors:            " << summary.errors << "\n"
            << "  orphans removed:   " << cleanup.deleted << "\n";
  return summary.errors == 0 ? 0 : 2;
}

static int Init(const std::vector<std::string>& args) {
  const auto directory = fs::absolute(FirstPositional(args).value_or(".")).lexically_normal();
  if (docman::storage::InitRepository(directory)) {
    std::cout << "Initialized empty docman repository in " << (directory / docman::storage::kRepositoryMarker).string()
              << "/\n";
  } else {
    std::cout << "docman repository already exists in " << (directory / docman::storage::kRepositoryMarker).string()
              << "/\n";
  }
  return 0;
}

static int Status(Runtime& rt, const fs::path& root) {
  auto status = rt.catalog->Status(root.string());
  std::cout << "repository: " << root.string() << "\n"
            << "  copies:       " << status.copies << "\n"
            << "  unorganized:  " << status.unorganized << "\n"
            << "  organized:    " << status.organized << "\n"
            << "  ignored:      " << status.ignored << "\n"
            << "  pending:      " << status.pending << "\n"
            << "  conflicting:  " << status.conflicting << "\n"
            << "  duplicates:   " << status.duplicates.groups << " group(s), " << status.duplicates.copies
            << " copies\n";
  return 0;
}

static int ApplyAll(Runtime& rt, const fs::path& root, const std::vector<std::string>& args,
                    const docman::config::v1::AppConfig& config) {
  const bool dry_run     = HasFlag(args, "--dry-run");
  const auto policy_name = FirstPositional(args).value_or(config.apply().conflict_policy());
  auto       policy      = docman::storage::ParseConflictPolicy(policy_name);
  if (!policy) {
    std::cerr << "unsupported conflict policy: " << policy_name << "\n";
    return 1;
  }

  auto summary = rt.applier->ApplyAll(root.string(), *policy, dry_run, config.apply().create_dirs());
  for (const auto& item : summary.items) {
    std::cout << item.pending_id << "\t" << docman::core::ToString(item.outcome);
    if (!item.message.empty()) std::cout << "\t" << item.message;
    std::cout << "\n";
  }

  using docman::core::BulkOutcome;
  std::cout << (dry_run ? "dry run: " : "") << summary.items.size() << " operation(s)\n"
            << "  applied:          " << summary.Count(BulkOutcome::kApplied) << "\n"
            << "  already in place: " << summary.Count(BulkOutcome::kAlreadyInPlace) << "\n"
            << "  conflicts:        " << summary.Count(BulkOutcome::kConflict) << "\n"
            << "  source missing:   " << summary.Count(BulkOutcome::kSourceMissing) << "\n"
            << "  rejected:         " << summary.Count(BulkOutcome::kRejected) << "\n"
            << "  failed:           " << summary.Count(BulkOutcome::kFailed) << "\n";
  return summary.Count(BulkOutcome::kFailed) == 0 ? 0 : 2;
}

static int Pending(Runtime& rt, const fs::path& root) {
  auto paths = CopyPaths(rt, root);
  for (const auto& op : rt.catalog->ListPendingOperations(root.string())) {
    const auto target = op.suggested_directory_path.empty() ? op.suggested_filename
                                                            : op.suggested_directory_path + "/" + op.suggested_filename;
    std::cout << op.id << "\t" << paths[op.document_copy_id.value_or(0)] << " -> " << target << "\t(" << op.confidence
              << ") " << op.reason << "\n";
  }
  return 0;
}

static int SetStatus(Runtime& rt, const fs::path& root, const std::vector<std::string>& args, bool ignore) {
  const auto path = FirstPositional(args);
  if (!path) {
    Usage();
    return 1;
  }

  docman::core::CopyFilter filter;
  filter.path      = RelativeToRoot(root, *path);
  filter.recursive = HasFlag(args, "-r") || HasFlag(args, "--recursive") || fs::is_regular_file(*path);

  std::vector<int64_t> ids;
  for (const auto& copy : rt.catalog->SelectCopies(root.string(), filter)) {
    ids.push_back(copy.id);
  }

  auto changed = ignore ? rt.catalog->IgnoreCopies(ids) : rt.catalog->UnmarkCopies(ids);
  std::cout << (ignore ? "ignored " : "unmarked ") << changed << " of " << ids.size() << " copy(ies)\n";
  return 0;
}

static int Duplicates(Runtime& rt, const fs::path& root) {
  auto groups  = rt.catalog->FindDuplicateGroups(root.string());
  auto summary = docman::core::DocumentCatalog::Summarize(groups);
  for (const auto& [document_id, copies] : groups) {
    std::cout << "document " << document_id << ":\n";
    for (const auto& copy : copies) {
      std::cout << "  [" << copy.id << "] " << copy.file_path << "\n";
    }
  }
  std::cout << summary.groups << " duplicate group(s), " << summary.copies << " copies\n";
  return 0;
}

static int Conflicts(Runtime& rt, const fs::path& root) {
  auto paths = CopyPaths(rt, root);
  for (const auto& [target, ops] : rt.catalog->DetectTargetConflicts(root.string())) {
    std::cout << target << ":\n";
    for (const auto& op : ops) {
      std::cout << "  pending " << op.id << " from " << paths[op.document_copy_id.value_or(0)] << "\n";
    }
  }
  return 0;
}

static int History(Runtime& rt, const fs::path& root) {
  for (const auto& op : rt.catalog->ListOperations(root.string())) {
    std::cout << op.id << "\t" << docman::model::ToString(op.outcome) << "\t" << op.original_file_path;
    if (!op.final_file_path.empty()) std::cout << " -> " << op.final_file_path;
    std::cout << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string        cmd = args[0];
  std::vector<std::string> rest(args.begin() + 1, args.end());

  try {
    auto config = docman::config::ConfigLoader::Load(config_path);
    docman::observability::InitializeLogging(config);

    if (cmd == "init") {
      int rc = Init(rest);
      docman::observability::ShutdownLogging();
      return rc;
    }

    auto root = docman::storage::GetRepositoryRoot(fs::current_path());
    auto rt   = docman::factory::BuildRuntime(config);

    int rc = 0;
    if (cmd == "scan") {
      rc = Scan(rt, root, rest);
    } else if (cmd == "status") {
      rc = Status(rt, root);
    } else if (cmd == "pending") {
      rc = Pending(rt, root);
    } else if (cmd == "apply" && HasFlag(rest, "--all")) {
      rc = ApplyAll(rt, root, rest, config);
    } else if (cmd == "apply") {
      if (rest.empty()) {
        Usage();
        return 1;
      }
      const auto policy_name = rest.size() >= 2 ? rest[1] : config.apply().conflict_policy();
      auto       policy      = docman::storage::ParseConflictPolicy(policy_name);
      if (!policy) {
        std::cerr << "unsupported conflict policy: " << policy_name << "\n";
        return 1;
      }
      auto result = rt.applier->Apply(std::stoll(rest[0]), *policy, config.apply().create_dirs());
      std::cout << docman::core::ToString(result.status);
      if (!result.final_path.empty()) std::cout << " " << result.final_path.string();
      if (!result.message.empty()) std::cout << " (" << result.message << ")";
      std::cout << "\n";
      rc = result.status == docman::core::ApplyStatus::kApplied ||
                   result.status == docman::core::ApplyStatus::kAlreadyInPlace
               ? 0
               : 2;
    } else if (cmd == "reject") {
      if (rest.empty()) {
        Usage();
        return 1;
      }
      std::cout << "recorded operation " << rt.applier->Reject(std::stoll(rest[0])) << "\n";
    } else if (cmd == "ignore" || cmd == "unmark") {
      rc = SetStatus(rt, root, rest, cmd == "ignore");
    } else if (cmd == "duplicates") {
      rc = Duplicates(rt, root);
    } else if (cmd == "dedupe") {
      if (rest.size() < 2) {
        Usage();
        return 1;
      }
      auto removed = rt.catalog->RemoveDuplicateCopies(root, std::stoll(rest[0]), std::stoll(rest[1]));
      std::cout << "removed " << removed << " duplicate copy(ies)\n";
    } else if (cmd == "conflicts") {
      rc = Conflicts(rt, root);
    } else if (cmd == "history") {
      rc = History(rt, root);
    } else if (cmd == "cleanup") {
      auto result = rt.catalog->CleanupOrphanedCopies(root);
      std::cout << "deleted " << result.deleted << ", updated " << result.updated << "\n";
    } else {
      Usage();
      return 1;
    }

    docman::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    DOCMAN_LOG_ERROR("command failed", {docman::observability::StringField("command", cmd),
                                        docman::observability::StringField("error", e.what())});
    docman::observability::ShutdownLogging();
    return 2;
  }
}
