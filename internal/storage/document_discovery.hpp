#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace docman::config::v1 {
class ScanConfig;
}

namespace docman::storage {

// Marker directory at a repository root.
inline constexpr const char* kRepositoryMarker = ".docman";

struct DiscoveryOptions {
  std::set<std::string> supported_extensions; // lowercase, with leading dot
  std::set<std::string> excluded_dirs;        // directory names

  static DiscoveryOptions FromConfig(const docman::config::v1::ScanConfig& scan);
};

// Walks up from `start` looking for a directory containing .docman/.
std::optional<std::filesystem::path> FindRepositoryRoot(const std::filesystem::path& start);

// Creates .docman/config.yaml (empty) under `directory`. Returns false when a
// marker directory is already there. Throws util::NotFound for a missing
// directory, util::InvalidState for a non-directory and
// util::FileOperationError when the marker cannot be written.
bool InitRepository(const std::filesystem::path& directory);

// .docman/ exists and holds config.yaml.
bool ValidateRepository(const std::filesystem::path& root);

// FindRepositoryRoot, throwing util::NotFound when absent and
// util::InvalidState when the marker directory lacks its config.
std::filesystem::path GetRepositoryRoot(const std::filesystem::path& start);

// Extension check only, case-insensitive.
bool IsSupportedDocument(const std::filesystem::path& path, const DiscoveryOptions& options);

/*
  Document files under `start` (which must lie inside `root`), as sorted
  '/'-separated paths relative to `root`. Non-recursive mode lists only the
  direct children of `start`. Excluded directory names are never entered and
  unreadable directories are skipped.
*/
std::vector<std::string> DiscoverDocumentFiles(const std::filesystem::path& root,
                                               const std::filesystem::path& start,
                                               bool                         recursive,
                                               const DiscoveryOptions&      options);

} // namespace docman::storage
