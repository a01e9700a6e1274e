#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/queue/job_worker.hpp"
#include "internal/util/errors.hpp"

namespace {

using ingest::db::model::JobRecord;
using ingest::db::model::JobState;
using ingest::queue::BackoffDelayMs;
using ingest::queue::JobOptions;
using ingest::queue::JobQueue;
using ingest::queue::JobWorkerPool;
using ingest::queue::NackOutcome;
using ingest::queue::QueueDefaults;

/*
  Memory repository whose next N writes of an Active job fail, the way a
  busy or full disk would.
*/
class FlakyJobRepository final : public ingest::db::Repository {
 public:
  using Result      = ingest::db::Result;
  using Transaction = ingest::db::Transaction;

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result InsertSession(Transaction& tx, const ingest::db::model::SessionRecord& r) override {
    return inner_.InsertSession(tx, r);
  }
  std::optional<ingest::db::model::SessionRecord> GetSession(Transaction& tx, const std::string& id) override {
    return inner_.GetSession(tx, id);
  }
  Result UpdateSession(Transaction& tx, const ingest::db::model::SessionRecord& r) override {
    return inner_.UpdateSession(tx, r);
  }
  Result DeleteSession(Transaction& tx, const std::string& id) override {
    return inner_.DeleteSession(tx, id);
  }
  std::vector<ingest::db::model::SessionRecord> ListExpiredSessions(Transaction& tx, uint64_t now_ms) override {
    return inner_.ListExpiredSessions(tx, now_ms);
  }
  std::vector<ingest::db::model::SessionRecord> ListStaleSessions(Transaction& tx, uint64_t cutoff_ms) override {
    return inner_.ListStaleSessions(tx, cutoff_ms);
  }

  Result InsertFile(Transaction& tx, const ingest::db::model::FileRecord& r) override {
    return inner_.InsertFile(tx, r);
  }
  std::optional<ingest::db::model::FileRecord> GetFile(Transaction& tx, const std::string& id) override {
    return inner_.GetFile(tx, id);
  }
  Result UpdateFile(Transaction& tx, const ingest::db::model::FileRecord& r) override {
    return inner_.UpdateFile(tx, r);
  }
  std::vector<ingest::db::model::FileRecord> FindFilesByHash(Transaction& tx, const std::string& owner_id, const std::string& hash) override {
    return inner_.FindFilesByHash(tx, owner_id, hash);
  }
  std::vector<ingest::db::model::FileRecord> ListFiles(Transaction& tx, const ingest::db::FileFilter& filter, const ingest::db::Page& page) override {
    return inner_.ListFiles(tx, filter, page);
  }

  Result UpsertVariant(Transaction& tx, const ingest::db::model::VariantRecord& r) override {
    return inner_.UpsertVariant(tx, r);
  }
  std::vector<ingest::db::model::VariantRecord> ListVariants(Transaction& tx, const std::string& file_id) override {
    return inner_.ListVariants(tx, file_id);
  }
  Result DeleteVariants(Transaction& tx, const std::string& file_id) override {
    return inner_.DeleteVariants(tx, file_id);
  }

  Result UpsertJob(Transaction& tx, const JobRecord& r) override {
    if (r.state == JobState::kActive && fail_active_writes.load() > 0) {
      fail_active_writes.fetch_sub(1);
      return Result::Err(ingest::db::ErrorCode::IOError, "disk I/O error");
    }
    return inner_.UpsertJob(tx, r);
  }
  std::optional<JobRecord> GetJob(Transaction& tx, const std::string& id) override {
    return inner_.GetJob(tx, id);
  }
  std::vector<JobRecord> ListJobs(Transaction& tx, const std::string& queue) override {
    return inner_.ListJobs(tx, queue);
  }
  Result DeleteJob(Transaction& tx, const std::string& id) override {
    return inner_.DeleteJob(tx, id);
  }

  std::atomic<int> fail_active_writes{0};

 private:
  ingest::db::memory::MemoryRepository inner_;
};

QueueDefaults FastDefaults() {
  QueueDefaults defaults;
  defaults.max_attempts       = 3;
  defaults.backoff_initial_ms = 1;
  return defaults;
}

JobOptions Priority(int priority) {
  JobOptions options;
  options.priority = priority;
  return options;
}

void TestBackoff() {
  assert(BackoffDelayMs(2000, 1) == 2000);
  assert(BackoffDelayMs(2000, 2) == 4000);
  assert(BackoffDelayMs(2000, 3) == 8000);
  assert(BackoffDelayMs(100, 0) == 100);
}

void TestPriorityThenFifo() {
  JobQueue queue("accept", nullptr, FastDefaults());
  const auto doc   = queue.Enqueue("k", "doc", Priority(3));
  const auto img1  = queue.Enqueue("k", "img1", Priority(1));
  const auto video = queue.Enqueue("k", "video", Priority(2));
  const auto img2  = queue.Enqueue("k", "img2", Priority(1));

  assert(queue.TryDequeue()->id == img1);
  assert(queue.TryDequeue()->id == img2);
  assert(queue.TryDequeue()->id == video);
  assert(queue.TryDequeue()->id == doc);
  assert(!queue.TryDequeue().has_value());

  auto counts = queue.Counts();
  assert(counts.active == 4);
  assert(!queue.Idle());

  for (const auto& id : {doc, img1, video, img2}) queue.Ack(id);
  counts = queue.Counts();
  assert(counts.active == 0);
  assert(counts.completed == 4);
  assert(queue.Idle());
}

void TestDelayedJobsWait() {
  JobQueue   queue("processing", nullptr, FastDefaults());
  JobOptions options;
  options.delay = std::chrono::milliseconds(60000);
  queue.Enqueue("k", "later", options);

  assert(!queue.TryDequeue().has_value());
  assert(queue.Counts().delayed == 1);
  auto next = queue.NextDelayedIn();
  assert(next.has_value());
  assert(next->count() > 0 && next->count() <= 60000);
  assert(!queue.Idle());
}

void TestRetryThenExhaust() {
  JobQueue queue("accept", nullptr, FastDefaults());
  const auto id = queue.Enqueue("k", "payload");

  for (uint32_t attempt = 1; attempt <= 3; ++attempt) {
    std::optional<JobRecord> job;
    while (!(job = queue.TryDequeue())) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    assert(job->id == id);
    assert(job->attempts_made == attempt - 1);

    auto outcome = queue.Nack(id, "provider down", true);
    if (attempt < 3) {
      assert(outcome == NackOutcome::kRetryScheduled);
      assert(queue.Counts().delayed == 1);
    } else {
      assert(outcome == NackOutcome::kFailed);
    }
  }

  auto failed = queue.FailedJobs();
  assert(failed.size() == 1);
  assert(failed[0].state == JobState::kFailed);
  assert(failed[0].attempts_made == 3);
  assert(failed[0].last_error == "exhausted after 3 attempts: provider down");
  assert(failed[0].error_code == "JobExhausted");
  assert(queue.Counts().failed == 1);
  assert(queue.Idle());

  assert(queue.RetryFailed(id));
  assert(!queue.RetryFailed(id));
  auto again = queue.TryDequeue();
  assert(again && again->id == id && again->attempts_made == 0 && again->last_error.empty());
  assert(again->error_code.empty());
}

void TestPermanentFailureSkipsRetries() {
  JobQueue queue("accept", nullptr, FastDefaults());
  const auto id = queue.Enqueue("k", "payload");
  (void)queue.TryDequeue();
  assert(queue.Nack(id, "bad payload", false, "Rejected") == NackOutcome::kFailed);
  assert(queue.FailedJobs()[0].last_error == "bad payload");
  assert(queue.FailedJobs()[0].error_code == "Rejected");

  bool threw = false;
  try {
    queue.Nack(id, "again", true);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestPersistenceAndRecovery() {
  auto repository = std::make_shared<ingest::db::memory::MemoryRepository>();

  std::string waiting;
  std::string active;
  std::string failed;
  std::string done;
  {
    JobQueue queue("accept", repository, FastDefaults());
    done    = queue.Enqueue("k", std::string("\0binary\xff", 8));
    waiting = queue.Enqueue("k", "waiting", Priority(4));
    active  = queue.Enqueue("k", "active", Priority(1));
    failed  = queue.Enqueue("k", "failed", Priority(2));

    assert(queue.TryDequeue()->id == active);
    assert(queue.TryDequeue()->id == failed);
    queue.Nack(failed, "boom", false);
    assert(queue.TryDequeue()->id == waiting);
    // Simulate a crash with `waiting` in flight: it must come back.
    auto completed = queue.TryDequeue();
    assert(completed->id == done);
    assert(completed->payload == std::string("\0binary\xff", 8));
    queue.Ack(done);
  }

  JobQueue recovered("accept", repository, FastDefaults());
  assert(recovered.Recover() == 3);
  assert(recovered.Recover() == 0);

  auto counts = recovered.Counts();
  assert(counts.waiting == 2);
  assert(counts.failed == 1);
  assert(recovered.FailedJobs()[0].id == failed);
  assert(recovered.TryDequeue()->id == active);
  assert(recovered.TryDequeue()->id == waiting);

  // Other queues do not see these jobs.
  JobQueue other("processing", repository, FastDefaults());
  assert(other.Recover() == 0);
}

void TestWorkerPoolDispatch() {
  QueueDefaults slow;
  slow.backoff_initial_ms = 60000;
  auto          queue = std::make_shared<JobQueue>("processing", nullptr, slow);
  JobWorkerPool pool(queue, 1);

  std::vector<std::string> seen;
  pool.Register("ok", [&](const JobRecord& job) { seen.push_back(job.payload); });
  pool.Register("transient", [](const JobRecord&) { throw ingest::util::ProviderFailure("timeout"); });
  pool.Register("permanent", [](const JobRecord&) { throw ingest::util::InvalidState("file gone"); });

  queue->Enqueue("ok", "a");
  const auto transient = queue->Enqueue("transient", "b");
  const auto permanent = queue->Enqueue("permanent", "c");
  const auto unknown   = queue->Enqueue("mystery", "d");

  while (pool.RunOnce()) {
  }
  assert(seen == std::vector<std::string>{"a"});

  auto counts = queue->Counts();
  assert(counts.completed == 1);
  assert(counts.delayed == 1);
  assert(counts.failed == 2);

  std::vector<std::string> failed_ids;
  for (const auto& job : queue->FailedJobs()) {
    failed_ids.push_back(job.id);
    assert(job.error_code == "InvalidState");
  }
  assert(std::find(failed_ids.begin(), failed_ids.end(), permanent) != failed_ids.end());
  assert(std::find(failed_ids.begin(), failed_ids.end(), unknown) != failed_ids.end());
  assert(std::find(failed_ids.begin(), failed_ids.end(), transient) == failed_ids.end());
}

void TestDequeueKeepsJobWhenPersistFails() {
  auto     repository = std::make_shared<FlakyJobRepository>();
  JobQueue queue("accept", repository, FastDefaults());
  const auto id = queue.Enqueue("k", "payload");

  repository->fail_active_writes = 1;
  bool threw = false;
  try {
    (void)queue.TryDequeue();
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);

  auto counts = queue.Counts();
  assert(counts.waiting == 1);
  assert(counts.active == 0);

  auto job = queue.TryDequeue();
  assert(job && job->id == id);
  assert(job->state == JobState::kActive);
  {
    auto tx        = repository->Begin();
    auto persisted = repository->GetJob(*tx, id);
    assert(persisted && persisted->state == JobState::kActive);
  }
  queue.Ack(id);
  assert(queue.Idle());
}

void TestWorkerSurvivesPersistFailure() {
  auto          repository = std::make_shared<FlakyJobRepository>();
  auto          queue      = std::make_shared<JobQueue>("accept", repository, FastDefaults());
  JobWorkerPool pool(queue, 1);

  std::atomic<int> handled{0};
  pool.Register("count", [&](const JobRecord&) { handled.fetch_add(1); });
  queue->Enqueue("count", "x");
  repository->fail_active_writes = 2;

  pool.Start();
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (handled.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  pool.Stop();

  assert(handled.load() == 1);
  assert(repository->fail_active_writes.load() == 0);
  assert(queue->Counts().completed == 1);
}

void TestWorkerThreadsDrainQueue() {
  auto          queue = std::make_shared<JobQueue>("accept", nullptr, FastDefaults());
  JobWorkerPool pool(queue, 4);

  std::atomic<int> handled{0};
  pool.Register("count", [&](const JobRecord&) { handled.fetch_add(1); });
  for (int i = 0; i < 64; ++i) queue->Enqueue("count", std::to_string(i));

  pool.Start();
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (!queue->Idle() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  pool.Stop();

  assert(handled.load() == 64);
  assert(queue->Counts().completed == 64);

  bool threw = false;
  try {
    queue->Enqueue("count", "late");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBackoff();
  TestPriorityThenFifo();
  TestDelayedJobsWait();
  TestRetryThenExhaust();
  TestPermanentFailureSkipsRetries();
  TestPersistenceAndRecovery();
  TestWorkerPoolDispatch();
  TestDequeueKeepsJobWhenPersistFails();
  TestWorkerSurvivesPersistFailure();
  TestWorkerThreadsDrainQueue();

  std::cout << "ingest_manager_unit_job_queue: pass\n";
  return 0;
}
