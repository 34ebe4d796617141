#pragma once

#include <filesystem>
#include <string_view>

namespace docman::storage {

/*
  Validation of untrusted relocation suggestions.

  Two layers:
    1. syntactic checks on the raw strings (ValidatePathComponent)
    2. containment of the filesystem-resolved result (symlinks followed)

  All failures raise util::PathSecurityError and touch nothing on disk.
*/

// Rejects: empty (unless allow_empty), NUL bytes, absolute paths, any ".."
// segment, and the characters < > : " | ? *
void ValidatePathComponent(std::string_view component, bool allow_empty = false);

// base_path must be absolute (std::invalid_argument otherwise). Returns the
// resolved target, guaranteed to be a descendant of the resolved base.
std::filesystem::path ValidateTargetPath(const std::filesystem::path& base_path,
                                         std::string_view              suggested_dir,
                                         std::string_view              suggested_filename);

// Standalone containment check, usable right before a filesystem mutation.
void ValidateRepositoryPath(const std::filesystem::path& path, const std::filesystem::path& repo_root);

// True when resolved `path` equals or lies under resolved `root`. Purely
// lexical; callers resolve first.
bool IsWithin(const std::filesystem::path& path, const std::filesystem::path& root);

} // namespace docman::storage
