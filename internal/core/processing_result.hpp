#pragma once

#include <string_view>

namespace docman::core {

// Per-file outcome of the processing pipeline.
enum class ProcessingResult {
  kNewDocument,
  kUpdatedDocument,
  kDuplicateDocument,
  kReusedCopy,
  kExtractionFailed,
  kHashFailed,
};

inline std::string_view ToString(ProcessingResult result) {
  switch (result) {
    case ProcessingResult::kNewDocument:
      return "new_document";
    case ProcessingResult::kUpdatedDocument:
      return "updated_document";
    case ProcessingResult::kDuplicateDocument:
      return "duplicate_document";
    case ProcessingResult::kReusedCopy:
      return "reused_copy";
    case ProcessingResult::kExtractionFailed:
      return "extraction_failed";
    case ProcessingResult::kHashFailed:
      return "hash_failed";
  }
  return "hash_failed";
}

} // namespace docman::core
