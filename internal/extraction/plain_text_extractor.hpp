#pragma once

#include "internal/extraction/content_extractor.hpp"

namespace docman::extraction {

// Reads .txt .md .html .htm verbatim. Everything else yields nullopt.
class PlainTextExtractor final : public ContentExtractor {
 public:
  std::optional<std::string> Extract(const std::filesystem::path& path) override;

  static bool Supports(const std::filesystem::path& path);
};

} // namespace docman::extraction
