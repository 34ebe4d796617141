#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/status.hpp"

namespace docman::db::model {

/*
  Historical record of an applied or rejected suggestion.

  original_* fields are a snapshot taken at creation time and are never
  recomputed from the live copy; they survive the copy's deletion.
*/

struct OperationRecord {
  int64_t                id = 0;
  std::optional<int64_t> document_copy_id;

  std::string original_file_path;
  std::string original_repository_path;

  std::string suggested_directory_path;
  std::string suggested_filename;
  std::string reason;
  std::string prompt_hash;

  // relative path the file ended up at; empty when rejected
  std::string final_file_path;

  docman::model::OperationOutcome outcome = docman::model::OperationOutcome::kAccepted;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace docman::db::model
