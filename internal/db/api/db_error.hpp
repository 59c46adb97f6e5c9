#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace routebroker::db {

// Raises the util:: exception matching a failed repository result.
// Contention surfaces as InvalidState so callers see a retryable failure.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + ": " + ErrorCodeName(result.code);
  if (!result.message.empty()) {
    message += ": " + result.message;
  }

  switch (result.code) {
    case ErrorCode::Duplicate:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::InvalidReference:
      throw util::InvalidArgument(message);
    case ErrorCode::Contention:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace routebroker::db
