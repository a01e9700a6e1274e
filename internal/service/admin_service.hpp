#pragma once

#include <string>
#include <vector>

#include "internal/db/model/job_record.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/upload/resumable_upload_manager.hpp"
#include "service_context.hpp"

namespace ingest::service {

struct QueueStats {
  std::string        queue;
  queue::QueueCounts counts;
};

struct HealthReport {
  bool                    repository_ok = false;
  std::string             repository_error;
  bool                    media_configured = false;
  bool                    backup_enabled   = false;
  std::vector<QueueStats> queues;

  bool Healthy() const {
    return repository_ok;
  }
};

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  std::vector<QueueStats> Stats();

  std::vector<db::model::JobRecord> FailedJobs(const std::string& queue_name);

  // Throws NotFound when the job is not on the failed list.
  void RetryJob(const std::string& queue_name, const std::string& job_id);

  upload::SweepStats SweepSessions();

  HealthReport Health();

 private:
  std::shared_ptr<queue::JobQueue> QueueNamed(const std::string& queue_name) const;

  ServiceContext ctx_;
};

} // namespace ingest::service
