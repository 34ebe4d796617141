#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace docman::model {

/*
  Persisted enums. Stored as a fixed lowercase string set; anything else read
  back from the store is rejected.
*/

enum class OrganizationStatus {
  kUnorganized,
  kOrganized,
  kIgnored,
};

enum class OperationOutcome {
  kAccepted,
  kRejected,
};

std::string_view ToString(OrganizationStatus status);
std::string_view ToString(OperationOutcome outcome);

std::optional<OrganizationStatus> ParseOrganizationStatus(std::string_view value);
std::optional<OperationOutcome>   ParseOperationOutcome(std::string_view value);

} // namespace docman::model
