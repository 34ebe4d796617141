#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/status.hpp"

namespace docman::db::model {

/*
  One physical file location holding a document's content.

  IMPORTANT:
  - (repository_path, file_path) is unique.
  - stored_* fields cache filesystem metadata so unchanged files can skip
    rehashing. They describe the file as of the last successful scan.
*/

struct DocumentCopyRecord {
  int64_t id          = 0;
  int64_t document_id = 0;

  std::string repository_path; // absolute root of the tracked tree
  std::string file_path;       // relative to repository_path, '/' separated

  std::optional<std::string> stored_content_hash;
  std::optional<uint64_t>    stored_size;
  std::optional<int64_t>     stored_mtime_ns;

  docman::model::OrganizationStatus organization_status = docman::model::OrganizationStatus::kUnorganized;

  std::optional<uint64_t> last_seen_at_ms;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace docman::db::model
