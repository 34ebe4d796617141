#include "internal/extraction/plain_text_extractor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>

#include "internal/observability/logging.hpp"

namespace docman::extraction {

namespace {

constexpr std::array<std::string_view, 4> kTextExtensions = {".txt", ".md", ".html", ".htm"};

} // namespace

bool PlainTextExtractor::Supports(const std::filesystem::path& path) {
  auto ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(kTextExtensions.begin(), kTextExtensions.end(), ext) != kTextExtensions.end();
}

std::optional<std::string> PlainTextExtractor::Extract(const std::filesystem::path& path) {
  if (!Supports(path)) {
    return std::nullopt;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    DOCMAN_LOG_WARN("extraction failed to open file", {observability::StringField("path", path.string())});
    return std::nullopt;
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    DOCMAN_LOG_WARN("extraction read error", {observability::StringField("path", path.string())});
    return std::nullopt;
  }
  return buffer.str();
}

} // namespace docman::extraction
