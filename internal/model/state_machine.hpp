#pragma once

#include "file.hpp"
#include "upload_session.hpp"

namespace ingest::model {

constexpr bool IsTerminal(SessionStatus status) {
  return status != SessionStatus::kActive;
}

constexpr bool CanTransition(SessionStatus from, SessionStatus to) {
  if (from == to) {
    return true;
  }
  return from == SessionStatus::kActive;
}

constexpr bool IsTerminal(FileStatus status) {
  return status == FileStatus::kDeleted;
}

/*
  Failed is not terminal: the accept queue retries a failed upload and
  a later attempt may still reach Ready.
*/
constexpr bool CanTransition(FileStatus from, FileStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == FileStatus::kUploading) {
    return false;
  }
  if (from == FileStatus::kReady) {
    return to == FileStatus::kProcessing || to == FileStatus::kDeleted;
  }
  return true;
}

} // namespace ingest::model
