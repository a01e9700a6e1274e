#include "admin_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/storage/provider_router.hpp"
#include "internal/util/time.hpp"
#include "observe_call.hpp"

namespace ingest::service {

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::shared_ptr<queue::JobQueue> AdminService::QueueNamed(const std::string& queue_name) const {
  if (queue_name == ctx_.accept_queue->name()) return ctx_.accept_queue;
  if (queue_name == ctx_.processing_queue->name()) return ctx_.processing_queue;
  throw util::InvalidArgument("unknown queue: " + queue_name);
}

std::vector<QueueStats> AdminService::Stats() {
  return ObserveCall("AdminService.Stats", [&] {
    return std::vector<QueueStats>{{ctx_.accept_queue->name(), ctx_.accept_queue->Counts()},
                                   {ctx_.processing_queue->name(), ctx_.processing_queue->Counts()}};
  });
}

std::vector<db::model::JobRecord> AdminService::FailedJobs(const std::string& queue_name) {
  return ObserveCall("AdminService.FailedJobs", [&] { return QueueNamed(queue_name)->FailedJobs(); });
}

void AdminService::RetryJob(const std::string& queue_name, const std::string& job_id) {
  ObserveCall("AdminService.RetryJob", [&] {
    if (!QueueNamed(queue_name)->RetryFailed(job_id)) {
      throw util::NotFound("no failed job " + job_id + " in queue " + queue_name);
    }
  });
}

upload::SweepStats AdminService::SweepSessions() {
  return ObserveCall("AdminService.SweepSessions", [&] { return ctx_.uploads->SweepExpired(util::Now()); });
}

HealthReport AdminService::Health() {
  observability::SpanScope span("AdminService.Health");

  HealthReport report;
  try {
    auto tx = ctx_.repository->Begin();
    ctx_.repository->ListJobs(*tx, ctx_.accept_queue->name());
    report.repository_ok = true;
  } catch (const std::exception& e) {
    report.repository_error = e.what();
    span.RecordException(e.what());
    INGEST_LOG_ERROR("repository health check failed", {observability::StringField("error", e.what())});
  }

  report.media_configured = ctx_.router->HasMedia();
  report.backup_enabled   = ctx_.router->BackupEnabled();
  report.queues           = Stats();
  return report;
}

} // namespace ingest::service
