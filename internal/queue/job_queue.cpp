#include "job_queue.hpp"

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ingest::queue {

using db::model::JobRecord;
using db::model::JobState;
using observability::IntField;
using observability::StringField;

uint64_t BackoffDelayMs(uint64_t initial_ms, uint32_t attempt) {
  if (attempt <= 1) return initial_ms;
  const uint32_t shift = attempt - 1 > 32 ? 32 : attempt - 1;
  return initial_ms << shift;
}

JobQueue::JobQueue(std::string name, std::shared_ptr<db::Repository> repository, QueueDefaults defaults)
    : name_(std::move(name)), repository_(std::move(repository)), defaults_(defaults) {
}

void JobQueue::Persist(const JobRecord& job) {
  if (!repository_) return;
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertJob(*tx, job), "persist job " + job.id);
  tx->Commit();
}

void JobQueue::Forget(const std::string& job_id) {
  if (!repository_) return;
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteJob(*tx, job_id), "delete job " + job_id);
  tx->Commit();
}

void JobQueue::PublishDepthLocked() const {
  observability::Metrics::Instance().SetQueueDepth(name_, ready_.size() + delayed_.size());
}

void JobQueue::MakeReady(JobRecord job) {
  ready_.emplace(job.priority, sequence_++, job.id);
  jobs_[job.id] = std::move(job);
}

std::string JobQueue::Enqueue(const std::string& kind, std::string payload, const JobOptions& options) {
  const auto now = util::NowMillis();

  JobRecord job;
  job.id                 = util::NewId();
  job.queue              = name_;
  job.kind               = kind;
  job.payload            = std::move(payload);
  job.priority           = options.priority;
  job.max_attempts       = options.max_attempts.value_or(defaults_.max_attempts);
  job.backoff_initial_ms = options.backoff_initial_ms.value_or(defaults_.backoff_initial_ms);
  job.created_at_ms      = now;
  job.updated_at_ms      = now;

  if (options.delay.count() > 0) {
    job.state           = JobState::kDelayed;
    job.available_at_ms = now + static_cast<uint64_t>(options.delay.count());
  } else {
    job.state           = JobState::kWaiting;
    job.available_at_ms = now;
  }

  std::lock_guard lock(mutex_);
  if (shutdown_) throw std::runtime_error("queue " + name_ + " is shut down");

  Persist(job);
  const auto id = job.id;
  if (job.state == JobState::kDelayed) {
    delayed_.emplace(job.available_at_ms, id);
    jobs_[id] = std::move(job);
  } else {
    MakeReady(std::move(job));
  }
  PublishDepthLocked();

  INGEST_LOG_DEBUG("job enqueued", {StringField("queue", name_), StringField("kind", kind), StringField("job_id", id)});
  cv_.notify_one();
  return id;
}

void JobQueue::PromoteDueLocked(uint64_t now_ms) {
  while (!delayed_.empty() && delayed_.begin()->first <= now_ms) {
    auto id = delayed_.begin()->second;
    delayed_.erase(delayed_.begin());

    auto it = jobs_.find(id);
    if (it == jobs_.end()) continue;
    it->second.state = JobState::kWaiting;
    ready_.emplace(it->second.priority, sequence_++, id);
  }
}

std::optional<JobRecord> JobQueue::PopReadyLocked() {
  if (ready_.empty()) return std::nullopt;

  auto job          = jobs_.at(std::get<2>(*ready_.begin()));
  job.state         = JobState::kActive;
  job.updated_at_ms = util::NowMillis();
  // The job stays Waiting in memory until its Active state is durable.
  Persist(job);

  ready_.erase(ready_.begin());
  active_.insert(job.id);
  jobs_[job.id] = job;
  PublishDepthLocked();
  return job;
}

std::optional<JobRecord> JobQueue::Dequeue() {
  std::unique_lock lock(mutex_);
  for (;;) {
    if (shutdown_) return std::nullopt;

    PromoteDueLocked(util::NowMillis());
    if (auto job = PopReadyLocked()) return job;

    if (delayed_.empty()) {
      cv_.wait(lock);
    } else {
      cv_.wait_until(lock, util::FromUnixMillis(delayed_.begin()->first));
    }
  }
}

std::optional<JobRecord> JobQueue::TryDequeue() {
  std::lock_guard lock(mutex_);
  if (shutdown_) return std::nullopt;
  PromoteDueLocked(util::NowMillis());
  return PopReadyLocked();
}

void JobQueue::Ack(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  if (!active_.erase(job_id)) return;
  jobs_.erase(job_id);
  ++completed_;
  Forget(job_id);
}

NackOutcome JobQueue::Nack(const std::string& job_id, const std::string& error, bool retryable, std::string_view error_code) {
  std::lock_guard lock(mutex_);
  auto            it = jobs_.find(job_id);
  if (it == jobs_.end() || !active_.erase(job_id)) {
    throw std::runtime_error("job " + job_id + " is not active in queue " + name_);
  }

  auto& job = it->second;
  job.attempts_made += 1;
  job.updated_at_ms = util::NowMillis();
  job.last_error    = error;
  job.error_code.clear();

  NackOutcome outcome;
  if (retryable && job.attempts_made < job.max_attempts) {
    job.state           = JobState::kDelayed;
    job.available_at_ms = job.updated_at_ms + BackoffDelayMs(job.backoff_initial_ms, job.attempts_made);
    delayed_.emplace(job.available_at_ms, job_id);
    outcome = NackOutcome::kRetryScheduled;
  } else {
    if (retryable) {
      job.last_error = "exhausted after " + std::to_string(job.attempts_made) + " attempts: " + error;
      job.error_code = util::ErrorCodeName(util::ErrorCode::kJobExhausted);
    } else {
      job.error_code = error_code;
    }
    job.state = JobState::kFailed;
    failed_.insert(job_id);
    outcome = NackOutcome::kFailed;
  }

  Persist(job);
  PublishDepthLocked();
  cv_.notify_one();
  return outcome;
}

QueueCounts JobQueue::Counts() const {
  std::lock_guard lock(mutex_);
  QueueCounts     counts;
  counts.waiting   = ready_.size();
  counts.delayed   = delayed_.size();
  counts.active    = active_.size();
  counts.completed = completed_;
  counts.failed    = failed_.size();
  return counts;
}

std::vector<JobRecord> JobQueue::FailedJobs() const {
  std::lock_guard        lock(mutex_);
  std::vector<JobRecord> out;
  out.reserve(failed_.size());
  for (const auto& id : failed_) out.push_back(jobs_.at(id));
  return out;
}

bool JobQueue::RetryFailed(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  if (!failed_.contains(job_id)) return false;

  auto job          = jobs_.at(job_id);
  job.attempts_made = 0;
  job.last_error.clear();
  job.error_code.clear();
  job.state           = JobState::kWaiting;
  job.available_at_ms = util::NowMillis();
  job.updated_at_ms   = job.available_at_ms;
  Persist(job);
  failed_.erase(job_id);
  MakeReady(std::move(job));
  PublishDepthLocked();

  INGEST_LOG_INFO("failed job requeued", {StringField("queue", name_), StringField("job_id", job_id)});
  cv_.notify_one();
  return true;
}

std::size_t JobQueue::Recover() {
  if (!repository_) return 0;

  std::vector<JobRecord> persisted;
  {
    auto tx   = repository_->Begin();
    persisted = repository_->ListJobs(*tx, name_);
  }

  std::lock_guard lock(mutex_);
  std::size_t     restored = 0;
  for (auto& job : persisted) {
    if (jobs_.contains(job.id)) continue;

    switch (job.state) {
      case JobState::kCompleted:
        Forget(job.id);
        continue;
      case JobState::kFailed:
        failed_.insert(job.id);
        jobs_[job.id] = std::move(job);
        break;
      case JobState::kDelayed:
        delayed_.emplace(job.available_at_ms, job.id);
        jobs_[job.id] = std::move(job);
        break;
      case JobState::kActive:
      case JobState::kWaiting:
        job.state = JobState::kWaiting;
        MakeReady(std::move(job));
        break;
    }
    ++restored;
  }
  PublishDepthLocked();

  if (restored != 0) {
    INGEST_LOG_INFO("jobs recovered", {StringField("queue", name_), IntField("count", static_cast<int64_t>(restored))});
  }
  cv_.notify_all();
  return restored;
}

std::optional<std::chrono::milliseconds> JobQueue::NextDelayedIn() const {
  std::lock_guard lock(mutex_);
  if (delayed_.empty()) return std::nullopt;
  const auto now = util::NowMillis();
  const auto at  = delayed_.begin()->first;
  return std::chrono::milliseconds(at > now ? at - now : 0);
}

bool JobQueue::Idle() const {
  std::lock_guard lock(mutex_);
  return ready_.empty() && delayed_.empty() && active_.empty();
}

void JobQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace ingest::queue
