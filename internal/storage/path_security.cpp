#include "internal/storage/path_security.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace docman::storage {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kInvalidChars = "<>:\"|?*";

fs::path Resolve(const fs::path& p) {
  std::error_code ec;
  auto resolved = fs::weakly_canonical(p, ec);
  if (ec) {
    // unresolvable (e.g. permission on an ancestor); fall back to lexical form
    return p.lexically_normal();
  }
  return resolved;
}

} // namespace

void ValidatePathComponent(std::string_view component, bool allow_empty) {
  if (component.empty()) {
    if (allow_empty) return;
    throw util::PathSecurityError("Path component cannot be empty");
  }

  const std::string value(component);

  if (value.find('\0') != std::string::npos) {
    throw util::PathSecurityError("Path component cannot contain null bytes");
  }

  const fs::path path(value);
  if (path.is_absolute() || value.front() == '/') {
    throw util::PathSecurityError("Path component cannot be absolute: " + value);
  }

  for (const auto& part : path) {
    if (part == "..") {
      throw util::PathSecurityError("Path component cannot contain parent directory traversal (..): " + value);
    }
  }

  for (char c : kInvalidChars) {
    if (value.find(c) != std::string::npos) {
      throw util::PathSecurityError(std::string("Path component contains invalid character '") + c + "': " + value);
    }
  }
}

bool IsWithin(const fs::path& path, const fs::path& root) {
  auto p_it = path.begin();
  for (auto r_it = root.begin(); r_it != root.end(); ++r_it) {
    // a trailing separator shows up as an empty element
    if (r_it->empty() && std::next(r_it) == root.end()) break;
    if (p_it == path.end() || *p_it != *r_it) return false;
    ++p_it;
  }
  return true;
}

fs::path ValidateTargetPath(const fs::path& base_path, std::string_view suggested_dir, std::string_view suggested_filename) {
  if (!base_path.is_absolute()) {
    throw std::invalid_argument("Base path must be absolute: " + base_path.string());
  }

  ValidatePathComponent(suggested_dir, /*allow_empty=*/true);
  ValidatePathComponent(suggested_filename, /*allow_empty=*/false);

  fs::path full_path = base_path;
  if (!suggested_dir.empty()) {
    full_path /= fs::path(std::string(suggested_dir));
  }
  full_path /= fs::path(std::string(suggested_filename));

  const auto resolved_full = Resolve(full_path);
  const auto resolved_base = Resolve(base_path);

  if (!IsWithin(resolved_full, resolved_base)) {
    throw util::PathSecurityError("Suggested path escapes repository. Repository: " + resolved_base.string() +
                                  " Suggested: " + resolved_full.string() + " Directory: '" + std::string(suggested_dir) +
                                  "' Filename: '" + std::string(suggested_filename) + "'");
  }

  return resolved_full;
}

void ValidateRepositoryPath(const fs::path& path, const fs::path& repo_root) {
  const auto resolved_path = Resolve(path);
  const auto resolved_root = Resolve(repo_root);

  if (!IsWithin(resolved_path, resolved_root)) {
    throw util::PathSecurityError("Path is outside repository boundaries. Repository: " + resolved_root.string() +
                                  " Path: " + resolved_path.string());
  }
}

} // namespace docman::storage
