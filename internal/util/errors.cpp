#include "errors.hpp"

namespace ingest::util {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kInvalidChunkIndex:
      return "InvalidChunkIndex";
    case ErrorCode::kChunkSizeMismatch:
      return "ChunkSizeMismatch";
    case ErrorCode::kSessionNotWritable:
      return "SessionNotWritable";
    case ErrorCode::kNotCompleted:
      return "NotCompleted";
    case ErrorCode::kSizeMismatch:
      return "SizeMismatch";
    case ErrorCode::kRejected:
      return "Rejected";
    case ErrorCode::kSuspiciousContent:
      return "SuspiciousContent";
    case ErrorCode::kUnsupportedType:
      return "UnsupportedType";
    case ErrorCode::kTooLarge:
      return "TooLarge";
    case ErrorCode::kProviderFailure:
      return "ProviderFailure";
    case ErrorCode::kJobExhausted:
      return "JobExhausted";
    case ErrorCode::kInvalidState:
      return "InvalidState";
  }
  return "Unknown";
}

bool IsRetryable(const std::exception& error) {
  if (const auto* domain = dynamic_cast<const Error*>(&error)) {
    return domain->retryable();
  }
  return true;
}

} // namespace ingest::util
