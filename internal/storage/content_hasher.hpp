#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace docman::storage {

/*
  Content identity of a file: lowercase hex digest over its full bytes.

  Implementations throw util::FileOperationError when the file cannot be read.
*/
class ContentHasher {
 public:
  virtual ~ContentHasher() = default;

  virtual std::string Hash(const std::filesystem::path& path) = 0;
};

// SHA-256 via OpenSSL EVP, streamed in fixed-size chunks.
class Sha256ContentHasher final : public ContentHasher {
 public:
  explicit Sha256ContentHasher(std::size_t chunk_bytes = 8192);

  std::string Hash(const std::filesystem::path& path) override;

 private:
  std::size_t chunk_bytes_;
};

} // namespace docman::storage
