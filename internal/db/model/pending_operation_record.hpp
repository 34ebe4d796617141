#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace docman::db::model {

/*
  Unapplied relocation suggestion. At most one per copy; writing a new one
  replaces the old. document_copy_id goes null if the copy is deleted.
*/

struct PendingOperationRecord {
  int64_t                id = 0;
  std::optional<int64_t> document_copy_id;

  std::string suggested_directory_path;
  std::string suggested_filename;
  std::string reason;
  double      confidence = 0.0;

  // identifies the suggestion request that produced this row
  std::string prompt_hash;

  uint64_t created_at_ms = 0;
};

} // namespace docman::db::model
