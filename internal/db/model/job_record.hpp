#pragma once

#include <cstdint>
#include <string>

namespace ingest::db::model {

enum class JobState : std::uint8_t {
  kWaiting   = 0,
  kDelayed   = 1,
  kActive    = 2,
  kCompleted = 3,
  kFailed    = 4,
};

/*
  Durable queue entry.

  payload is an opaque serialized message owned by the job kind.
  Lower priority values are dequeued first.
*/

struct JobRecord {
  std::string id;
  std::string queue;
  std::string kind;
  std::string payload;

  int      priority           = 5;
  uint32_t attempts_made      = 0;
  uint32_t max_attempts       = 3;
  uint64_t backoff_initial_ms = 2000;

  JobState state = JobState::kWaiting;

  uint64_t    available_at_ms = 0;
  std::string last_error;
  std::string error_code; // util::ErrorCodeName of the final failure, empty while retrying

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace ingest::db::model
