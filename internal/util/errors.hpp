#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ingest::util {

/*
  Central error types.

  Every domain error carries an ErrorCode. Retryability is a property of
  the code, so queue workers never retry permanent failures such as a
  rejected mime type. Exceptions outside this hierarchy (I/O, database
  busy) are treated as transient.
*/

enum class ErrorCode {
  kInvalidArgument,
  kNotFound,
  kInvalidChunkIndex,
  kChunkSizeMismatch,
  kSessionNotWritable,
  kNotCompleted,
  kSizeMismatch,
  kRejected,
  kSuspiciousContent,
  kUnsupportedType,
  kTooLarge,
  kProviderFailure,
  kJobExhausted, // recorded on dead jobs, never thrown
  kInvalidState,
};

std::string_view ErrorCodeName(ErrorCode code);

constexpr bool IsRetryable(ErrorCode code) {
  return code == ErrorCode::kProviderFailure;
}

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const noexcept {
    return code_;
  }

  bool retryable() const noexcept {
    return IsRetryable(code_);
  }

 private:
  ErrorCode code_;
};

class InvalidArgument : public Error {
 public:
  explicit InvalidArgument(const std::string& msg) : Error(ErrorCode::kInvalidArgument, msg) {
  }
};

class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg) : Error(ErrorCode::kNotFound, msg) {
  }
};

class InvalidChunkIndex : public Error {
 public:
  explicit InvalidChunkIndex(const std::string& msg) : Error(ErrorCode::kInvalidChunkIndex, msg) {
  }
};

class ChunkSizeMismatch : public Error {
 public:
  explicit ChunkSizeMismatch(const std::string& msg) : Error(ErrorCode::kChunkSizeMismatch, msg) {
  }
};

class SessionNotWritable : public Error {
 public:
  explicit SessionNotWritable(const std::string& msg) : Error(ErrorCode::kSessionNotWritable, msg) {
  }
};

class NotCompleted : public Error {
 public:
  explicit NotCompleted(const std::string& msg) : Error(ErrorCode::kNotCompleted, msg) {
  }
};

class SizeMismatch : public Error {
 public:
  explicit SizeMismatch(const std::string& msg) : Error(ErrorCode::kSizeMismatch, msg) {
  }
};

class Rejected : public Error {
 public:
  explicit Rejected(const std::string& msg) : Error(ErrorCode::kRejected, msg) {
  }
};

class SuspiciousContent : public Error {
 public:
  explicit SuspiciousContent(const std::string& msg) : Error(ErrorCode::kSuspiciousContent, msg) {
  }
};

class UnsupportedType : public Error {
 public:
  explicit UnsupportedType(const std::string& msg) : Error(ErrorCode::kUnsupportedType, msg) {
  }
};

class TooLarge : public Error {
 public:
  explicit TooLarge(const std::string& msg) : Error(ErrorCode::kTooLarge, msg) {
  }
};

// Wraps any remote storage error. Retried by the queue.
class ProviderFailure : public Error {
 public:
  explicit ProviderFailure(const std::string& msg) : Error(ErrorCode::kProviderFailure, msg) {
  }
};

class InvalidState : public Error {
 public:
  explicit InvalidState(const std::string& msg) : Error(ErrorCode::kInvalidState, msg) {
  }
};

bool IsRetryable(const std::exception& error);

} // namespace ingest::util
