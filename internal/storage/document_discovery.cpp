#include "internal/storage/document_discovery.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include "docman/config/v1/config.pb.h"
#include "internal/util/errors.hpp"

namespace docman::storage {

namespace fs = std::filesystem;

namespace {

std::string LowerExtension(const fs::path& p) {
  auto ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

void Walk(const fs::path& root, const fs::path& dir, bool recursive, const DiscoveryOptions& options,
          std::vector<fs::path>& out) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) return; // unreadable

  for (const auto& entry : it) {
    std::error_code entry_ec;
    if (entry.is_directory(entry_ec)) {
      if (recursive && !options.excluded_dirs.contains(entry.path().filename().string())) {
        Walk(root, entry.path(), recursive, options, out);
      }
      continue;
    }
    if (entry.is_regular_file(entry_ec) && options.supported_extensions.contains(LowerExtension(entry.path()))) {
      out.push_back(entry.path().lexically_relative(root));
    }
  }
}

} // namespace

DiscoveryOptions DiscoveryOptions::FromConfig(const docman::config::v1::ScanConfig& scan) {
  DiscoveryOptions options;
  options.supported_extensions.insert(scan.supported_extensions().begin(), scan.supported_extensions().end());
  options.excluded_dirs.insert(scan.excluded_dirs().begin(), scan.excluded_dirs().end());
  return options;
}

std::optional<fs::path> FindRepositoryRoot(const fs::path& start) {
  std::error_code ec;
  fs::path current = fs::weakly_canonical(fs::absolute(start), ec);
  if (ec) current = fs::absolute(start).lexically_normal();

  while (true) {
    if (fs::is_directory(current / kRepositoryMarker, ec)) {
      return current;
    }
    auto parent = current.parent_path();
    if (parent == current || parent.empty()) {
      return std::nullopt;
    }
    current = parent;
  }
}

bool InitRepository(const fs::path& directory) {
  std::error_code ec;
  if (!fs::exists(directory, ec)) {
    throw util::NotFound("Directory does not exist: " + directory.string());
  }
  if (!fs::is_directory(directory, ec)) {
    throw util::InvalidState("Not a directory: " + directory.string());
  }

  const auto marker = directory / kRepositoryMarker;
  if (fs::exists(marker, ec)) {
    return false;
  }

  fs::create_directory(marker, ec);
  if (ec) {
    throw util::FileOperationError("Failed to create " + marker.string() + ": " + ec.message());
  }
  std::ofstream config(marker / "config.yaml");
  if (!config) {
    throw util::FileOperationError("Failed to create " + (marker / "config.yaml").string());
  }
  return true;
}

bool ValidateRepository(const fs::path& root) {
  std::error_code ec;
  const auto marker = root / kRepositoryMarker;
  return fs::is_directory(marker, ec) && fs::exists(marker / "config.yaml", ec);
}

fs::path GetRepositoryRoot(const fs::path& start) {
  auto root = FindRepositoryRoot(start);
  if (!root) {
    throw util::NotFound("Not in a docman repository: " + start.string());
  }
  if (!ValidateRepository(*root)) {
    throw util::InvalidState("Invalid docman repository at " + root->string() + ": missing .docman/config.yaml");
  }
  return *root;
}

bool IsSupportedDocument(const fs::path& path, const DiscoveryOptions& options) {
  return options.supported_extensions.contains(LowerExtension(path));
}

std::vector<std::string> DiscoverDocumentFiles(const fs::path& root, const fs::path& start, bool recursive,
                                               const DiscoveryOptions& options) {
  std::vector<fs::path> found;
  Walk(root, start, recursive, options, found);
  std::sort(found.begin(), found.end());

  std::vector<std::string> out;
  out.reserve(found.size());
  for (const auto& p : found) {
    out.push_back(p.generic_string());
  }
  return out;
}

} // namespace docman::storage
