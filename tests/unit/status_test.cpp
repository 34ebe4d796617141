#include "internal/model/status.hpp"

#include <cassert>
#include <iostream>

#include "internal/core/organization_applier.hpp"
#include "internal/core/processing_result.hpp"

namespace {

using docman::model::OperationOutcome;
using docman::model::OrganizationStatus;

void TestOrganizationStatusStrings() {
  assert(docman::model::ToString(OrganizationStatus::kUnorganized) == "unorganized");
  assert(docman::model::ToString(OrganizationStatus::kOrganized) == "organized");
  assert(docman::model::ToString(OrganizationStatus::kIgnored) == "ignored");

  for (auto status : {OrganizationStatus::kUnorganized, OrganizationStatus::kOrganized, OrganizationStatus::kIgnored}) {
    auto parsed = docman::model::ParseOrganizationStatus(docman::model::ToString(status));
    assert(parsed && *parsed == status);
  }

  assert(!docman::model::ParseOrganizationStatus("Organized"));
  assert(!docman::model::ParseOrganizationStatus("archived"));
  assert(!docman::model::ParseOrganizationStatus(""));
}

void TestOperationOutcomeStrings() {
  assert(docman::model::ToString(OperationOutcome::kAccepted) == "accepted");
  assert(docman::model::ToString(OperationOutcome::kRejected) == "rejected");
  assert(docman::model::ParseOperationOutcome("rejected") == OperationOutcome::kRejected);
  assert(!docman::model::ParseOperationOutcome("pending"));
}

void TestProcessingResultStrings() {
  using docman::core::ProcessingResult;
  assert(docman::core::ToString(ProcessingResult::kNewDocument) == "new_document");
  assert(docman::core::ToString(ProcessingResult::kUpdatedDocument) == "updated_document");
  assert(docman::core::ToString(ProcessingResult::kDuplicateDocument) == "duplicate_document");
  assert(docman::core::ToString(ProcessingResult::kReusedCopy) == "reused_copy");
  assert(docman::core::ToString(ProcessingResult::kExtractionFailed) == "extraction_failed");
  assert(docman::core::ToString(ProcessingResult::kHashFailed) == "hash_failed");
}

void TestApplyStatusStrings() {
  using docman::core::ApplyStatus;
  assert(docman::core::ToString(ApplyStatus::kApplied) == "applied");
  assert(docman::core::ToString(ApplyStatus::kAlreadyInPlace) == "already_in_place");
  assert(docman::core::ToString(ApplyStatus::kConflict) == "conflict");
  assert(docman::core::ToString(ApplyStatus::kSourceMissing) == "source_missing");

  using docman::core::BulkOutcome;
  assert(docman::core::ToString(BulkOutcome::kRejected) == "rejected");
  assert(docman::core::ToString(BulkOutcome::kFailed) == "failed");
}

} // namespace

int main() {
  TestOrganizationStatusStrings();
  TestOperationOutcomeStrings();
  TestProcessingResultStrings();
  TestApplyStatusStrings();

  std::cout << "docman_unit_status: pass\n";
  return 0;
}
