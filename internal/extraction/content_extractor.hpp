#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace docman::extraction {

/*
  Text extraction collaborator.

  Constructed by the caller and passed into the pipeline. nullopt means the
  extraction failed or the format is unsupported; the pipeline records it as
  null content.
*/
class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  virtual std::optional<std::string> Extract(const std::filesystem::path& path) = 0;
};

} // namespace docman::extraction
