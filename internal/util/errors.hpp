#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace docman::util {

/*
  Central error types.

  Store-level failures arrive as db::Result and are translated into these
  at the service boundary (see ThrowIfDbError).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Suggested location is malformed or resolves outside the repository.
class PathSecurityError : public std::runtime_error {
 public:
  explicit PathSecurityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Base of the move domain.
class FileOperationError : public std::runtime_error {
 public:
  explicit FileOperationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FileNotFoundError : public FileOperationError {
 public:
  explicit FileNotFoundError(std::filesystem::path source)
      : FileOperationError("Source file not found: " + source.string()), source_(std::move(source)) {
  }

  const std::filesystem::path& source() const {
    return source_;
  }

 private:
  std::filesystem::path source_;
};

class FileConflictError : public FileOperationError {
 public:
  FileConflictError(std::filesystem::path source, std::filesystem::path target)
      : FileOperationError("Target file already exists: " + target.string() + " (source: " + source.string() + ")"),
        source_(std::move(source)),
        target_(std::move(target)) {
  }

  const std::filesystem::path& source() const {
    return source_;
  }
  const std::filesystem::path& target() const {
    return target_;
  }

 private:
  std::filesystem::path source_;
  std::filesystem::path target_;
};

class PermissionDenied : public FileOperationError {
 public:
  PermissionDenied(const std::filesystem::path& source, const std::filesystem::path& target, const std::string& detail)
      : FileOperationError("Permission denied moving " + source.string() + " to " + target.string() + ": " + detail) {
  }
};

} // namespace docman::util
