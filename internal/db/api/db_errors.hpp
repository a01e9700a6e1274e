#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace ingest::db {

/*
  Converts a failed repository Result into the domain exception
  hierarchy. Busy/IO failures stay plain runtime_errors so the queue
  treats them as transient.
*/
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const std::string message = context + (result.message.empty() ? "" : ": " + result.message);
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace ingest::db
