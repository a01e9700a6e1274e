#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/queue/job_queue.hpp"
#include "internal/runtime/background_worker.hpp"

namespace ingest::queue {

using JobHandler = std::function<void(const db::model::JobRecord&)>;

/*
  Worker pool consuming one queue on N threads.

  Handlers are looked up by job kind. A handler that returns acks the
  job; a thrown exception nacks it, with retryability taken from the
  error taxonomy (util::IsRetryable). Unknown kinds fail permanently.
*/
class JobWorkerPool final : public runtime::BackgroundWorker {
 public:
  JobWorkerPool(std::shared_ptr<JobQueue> queue, uint32_t threads);
  ~JobWorkerPool() override;

  // Register before Start.
  void Register(const std::string& kind, JobHandler handler);

  void Start() override;
  void Stop() override;

  // Runs one due job on the calling thread; false when nothing was due.
  bool RunOnce();

  const std::shared_ptr<JobQueue>& queue() const {
    return queue_;
  }

 private:
  void Run();
  void Execute(const db::model::JobRecord& job);

  std::shared_ptr<JobQueue>                   queue_;
  uint32_t                                    thread_count_;
  std::unordered_map<std::string, JobHandler> handlers_;
  std::vector<std::thread>                    threads_;
};

} // namespace ingest::queue
