#include "job_worker.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace ingest::queue {

using observability::IntField;
using observability::StringField;

namespace {

// Pause between dequeue attempts while the repository is failing.
constexpr std::chrono::milliseconds kDequeueRetryDelay{250};

std::string_view ErrorCodeOf(const std::exception& e) {
  if (const auto* error = dynamic_cast<const util::Error*>(&e)) return util::ErrorCodeName(error->code());
  return {};
}

} // namespace

JobWorkerPool::JobWorkerPool(std::shared_ptr<JobQueue> queue, uint32_t threads)
    : queue_(std::move(queue)), thread_count_(threads == 0 ? 1 : threads) {
}

JobWorkerPool::~JobWorkerPool() {
  Stop();
}

void JobWorkerPool::Register(const std::string& kind, JobHandler handler) {
  handlers_[kind] = std::move(handler);
}

void JobWorkerPool::Start() {
  if (!threads_.empty()) return;
  for (uint32_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&JobWorkerPool::Run, this);
  }
  INGEST_LOG_INFO("worker pool started", {StringField("queue", queue_->name()), IntField("threads", thread_count_)});
}

void JobWorkerPool::Stop() {
  if (threads_.empty()) return;
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void JobWorkerPool::Run() {
  for (;;) {
    std::optional<db::model::JobRecord> job;
    try {
      job = queue_->Dequeue();
    } catch (const std::exception& e) {
      INGEST_LOG_ERROR("dequeue failed", {StringField("queue", queue_->name()), StringField("error", e.what())});
      std::this_thread::sleep_for(kDequeueRetryDelay);
      continue;
    }
    if (!job) return;

    try {
      Execute(*job);
    } catch (const std::exception& e) {
      INGEST_LOG_ERROR("job bookkeeping failed", {StringField("queue", job->queue), StringField("job_id", job->id),
                                                  StringField("error", e.what())});
    }
  }
}

bool JobWorkerPool::RunOnce() {
  auto job = queue_->TryDequeue();
  if (!job) return false;
  Execute(*job);
  return true;
}

void JobWorkerPool::Execute(const db::model::JobRecord& job) {
  observability::SpanScope span("job." + job.kind);
  span.SetAttribute("job.id", job.id);
  span.SetAttribute("job.queue", job.queue);
  span.SetAttribute("job.attempt", static_cast<int64_t>(job.attempts_made + 1));

  auto it = handlers_.find(job.kind);
  if (it == handlers_.end()) {
    INGEST_LOG_ERROR("no handler for job kind", {StringField("queue", job.queue), StringField("kind", job.kind)});
    queue_->Nack(job.id, "no handler for job kind " + job.kind, false, util::ErrorCodeName(util::ErrorCode::kInvalidState));
    observability::Metrics::Instance().RecordJob(job.queue, job.kind, "failed");
    return;
  }

  try {
    it->second(job);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    const bool retryable = util::IsRetryable(e);
    const auto outcome   = queue_->Nack(job.id, e.what(), retryable, ErrorCodeOf(e));
    const bool failed    = outcome == NackOutcome::kFailed;

    observability::Metrics::Instance().RecordJob(job.queue, job.kind, failed ? "failed" : "retried");
    if (failed) {
      INGEST_LOG_ERROR("job failed", {StringField("queue", job.queue), StringField("kind", job.kind), StringField("job_id", job.id),
                                      IntField("attempts", job.attempts_made + 1), StringField("error", e.what())});
    } else {
      INGEST_LOG_WARN("job will be retried", {StringField("queue", job.queue), StringField("kind", job.kind),
                                              StringField("job_id", job.id), StringField("error", e.what())});
    }
    return;
  }

  queue_->Ack(job.id);
  observability::Metrics::Instance().RecordJob(job.queue, job.kind, "completed");
}

} // namespace ingest::queue
