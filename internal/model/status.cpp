#include "status.hpp"

namespace docman::model {

std::string_view ToString(OrganizationStatus status) {
  switch (status) {
    case OrganizationStatus::kUnorganized:
      return "unorganized";
    case OrganizationStatus::kOrganized:
      return "organized";
    case OrganizationStatus::kIgnored:
      return "ignored";
  }
  return "unorganized";
}

std::string_view ToString(OperationOutcome outcome) {
  switch (outcome) {
    case OperationOutcome::kAccepted:
      return "accepted";
    case OperationOutcome::kRejected:
      return "rejected";
  }
  return "accepted";
}

std::optional<OrganizationStatus> ParseOrganizationStatus(std::string_view value) {
  if (value == "unorganized") return OrganizationStatus::kUnorganized;
  if (value == "organized") return OrganizationStatus::kOrganized;
  if (value == "ignored") return OrganizationStatus::kIgnored;
  return std::nullopt;
}

std::optional<OperationOutcome> ParseOperationOutcome(std::string_view value) {
  if (value == "accepted") return OperationOutcome::kAccepted;
  if (value == "rejected") return OperationOutcome::kRejected;
  return std::nullopt;
}

} // namespace docman::model
