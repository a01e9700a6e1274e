#pragma once

#include <cstdint>

namespace ingest::model {

enum class SessionStatus : std::uint8_t {
  kActive    = 0,
  kCompleted = 1,
  kFailed    = 2,
  kExpired   = 3,
};

constexpr bool IsWritable(SessionStatus status) {
  return status == SessionStatus::kActive;
}

} // namespace ingest::model
