#include "internal/storage/content_hasher.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <vector>

#include "internal/util/errors.hpp"

namespace docman::storage {

namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

std::string ToHex(const unsigned char* data, unsigned int size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<std::size_t>(size) * 2);
  for (unsigned int i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

} // namespace

Sha256ContentHasher::Sha256ContentHasher(std::size_t chunk_bytes)
    : chunk_bytes_(chunk_bytes == 0 ? 8192 : chunk_bytes) {}

std::string Sha256ContentHasher::Hash(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::FileOperationError("Failed to open " + path.string() + " for hashing");
  }

  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw util::FileOperationError("EVP_DigestInit_ex failed");
  }

  std::vector<char> buffer(chunk_bytes_);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(n)) != 1) {
      throw util::FileOperationError("EVP_DigestUpdate failed for " + path.string());
    }
  }
  if (in.bad()) {
    throw util::FileOperationError("Read error while hashing " + path.string());
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw util::FileOperationError("EVP_DigestFinal_ex failed for " + path.string());
  }

  return ToHex(digest, digest_len);
}

} // namespace docman::storage
