#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/upload_orchestrator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/http/http_client.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/queue/job_worker.hpp"
#include "internal/runtime/background_worker.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/file_service.hpp"
#include "internal/service/upload_service.hpp"
#include "internal/storage/provider_router.hpp"
#include "internal/upload/resumable_upload_manager.hpp"

namespace ingest::factory {

/*
  Application

  Owns the full dependency graph. Everything here lives as long as the
  process (daemon) or the command (ingestctl).

  Workers are built but not started; Start() launches the pools and the
  session sweeper, DrainQueues() runs queued jobs on the calling thread
  instead.
*/
struct Application {
  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<storage::ProviderRouter>        router;
  std::shared_ptr<queue::JobQueue>                accept_queue;
  std::shared_ptr<queue::JobQueue>                processing_queue;
  std::shared_ptr<upload::ResumableUploadManager> uploads;
  std::shared_ptr<core::UploadOrchestrator>       orchestrator;

  std::shared_ptr<queue::JobWorkerPool> accept_workers;
  std::shared_ptr<queue::JobWorkerPool> processing_workers;

  std::shared_ptr<service::UploadService> upload_service;
  std::shared_ptr<service::FileService>   file_service;
  std::shared_ptr<service::AdminService>  admin_service;

  std::vector<runtime::BackgroundWorkerPtr> background_workers;

  void Start();
  void Stop();

  // Runs jobs inline until both queues are idle, sleeping through retry backoff.
  void DrainQueues();
};

/*
  Composition root. The only place that knows concrete DB and provider
  types. A non-null http client replaces the socket client (tests).
*/
Application Build(const ingest::runtime::config::RuntimeConfig& config, std::shared_ptr<http::HttpClient> http = nullptr);

std::shared_ptr<db::Repository> BuildRepository(const ingest::runtime::config::DatabaseConfig& database);

} // namespace ingest::factory
