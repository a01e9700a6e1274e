#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ingest::queue {

inline constexpr const char* kAcceptQueue     = "accept";
inline constexpr const char* kProcessingQueue = "processing";

struct JobOptions {
  int                       priority = 5;
  std::optional<uint32_t>   max_attempts;
  std::optional<uint64_t>   backoff_initial_ms;
  std::chrono::milliseconds delay{0};
};

struct QueueDefaults {
  uint32_t max_attempts       = 3;
  uint64_t backoff_initial_ms = 2000;
};

struct QueueCounts {
  uint64_t waiting   = 0;
  uint64_t delayed   = 0;
  uint64_t active    = 0;
  uint64_t completed = 0;
  uint64_t failed    = 0;
};

enum class NackOutcome {
  kRetryScheduled,
  kFailed,
};

// initial * 2^(attempt-1)
uint64_t BackoffDelayMs(uint64_t initial_ms, uint32_t attempt);

/*
  JobQueue

  Priority queue with delayed retries and a failed list.

  Delivery is at-least-once: a job handed out by Dequeue stays Active
  until Ack or Nack. With a repository attached every transition is
  written to the job table and Recover reloads it after a restart;
  Active jobs found there are redelivered.

  Ordering:
      lower priority value first, then enqueue order
*/
class JobQueue {
 public:
  JobQueue(std::string name, std::shared_ptr<db::Repository> repository, QueueDefaults defaults);

  const std::string& name() const {
    return name_;
  }

  std::string Enqueue(const std::string& kind, std::string payload, const JobOptions& options = {});

  // Blocks until a job is due or the queue is shut down.
  std::optional<db::model::JobRecord> Dequeue();

  // Non-blocking variant; nullopt when nothing is due.
  std::optional<db::model::JobRecord> TryDequeue();

  void Ack(const std::string& job_id);

  // error_code names the final failure; exhausted retries are recorded as JobExhausted.
  NackOutcome Nack(const std::string& job_id, const std::string& error, bool retryable, std::string_view error_code = {});

  QueueCounts Counts() const;

  std::vector<db::model::JobRecord> FailedJobs() const;

  // Moves a failed job back to Waiting with a fresh attempt budget.
  bool RetryFailed(const std::string& job_id);

  // Reloads persisted jobs; returns how many were restored.
  std::size_t Recover();

  // Time until the earliest delayed job is due; nullopt when none is delayed.
  std::optional<std::chrono::milliseconds> NextDelayedIn() const;

  bool Idle() const;

  void Shutdown();

 private:
  using ReadyKey = std::tuple<int, uint64_t, std::string>;

  void MakeReady(db::model::JobRecord job);
  void PromoteDueLocked(uint64_t now_ms);
  std::optional<db::model::JobRecord> PopReadyLocked();
  void Persist(const db::model::JobRecord& job);
  void Forget(const std::string& job_id);
  void PublishDepthLocked() const;

  std::string                     name_;
  std::shared_ptr<db::Repository> repository_;
  QueueDefaults                   defaults_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    shutdown_ = false;
  uint64_t                sequence_ = 0;

  std::unordered_map<std::string, db::model::JobRecord> jobs_; // every job not completed
  std::set<ReadyKey>                                     ready_;
  std::multimap<uint64_t, std::string>                   delayed_; // available_at_ms -> id
  std::set<std::string>                                  active_;
  std::set<std::string>                                  failed_;
  uint64_t                                               completed_ = 0;
};

} // namespace ingest::queue
