#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace docman::core {

// Translates a failed store result into the service-layer exception.
inline void ThrowIfDbError(const docman::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case docman::db::ErrorCode::NotFound:
      throw docman::util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace docman::core
