#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace docman::db::model {

/*
  Canonical document row, one per distinct content hash.

  content is null until extraction succeeds.
*/

struct DocumentRecord {
  int64_t id = 0; // assigned by the store on insert

  // hex SHA-256 of the full byte content (unique)
  std::string content_hash;

  std::optional<std::string> content;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace docman::db::model
