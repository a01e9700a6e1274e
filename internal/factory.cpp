#include "factory.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/security/virus_scanner.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/upload/session_sweeper.hpp"
#include "internal/upload/temp_file_store.hpp"
#if INGEST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if INGEST_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace ingest::factory {

using ingest::runtime::config::RuntimeConfig;

std::shared_ptr<db::Repository> BuildRepository(const ingest::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if INGEST_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    INGEST_LOG_INFO("sqlite repository ready", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if INGEST_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::BootstrapSchema(*pool);
    INGEST_LOG_INFO("postgres repository ready", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  INGEST_LOG_WARN("using in-memory repository; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

namespace {

security::VirusScannerPtr BuildScanner(const ingest::runtime::config::VirusScanConfig& config) {
  if (!config.enabled()) return nullptr;

  security::ClamdOptions options;
  options.socket_path = config.socket_path();
  if (!config.host().empty()) options.host = config.host();
  if (config.port() != 0) options.port = static_cast<uint16_t>(config.port());
  if (config.timeout_ms() != 0) options.timeout = std::chrono::milliseconds(config.timeout_ms());

  INGEST_LOG_INFO("virus scanning enabled", {observability::StringField("socket", options.socket_path), observability::StringField("host", options.host),
                                             observability::IntField("port", options.port), observability::BoolField("strict", config.strict())});
  return std::make_shared<security::ClamdScanner>(std::move(options));
}

core::UploadPolicy BuildPolicy(const ingest::runtime::config::UploadPolicyConfig& config) {
  core::UploadPolicy policy;
  if (config.max_file_size_bytes() != 0) policy.max_file_size = config.max_file_size_bytes();
  if (!config.allowed_mime_types().empty()) {
    policy.allowed_mime_types.assign(config.allowed_mime_types().begin(), config.allowed_mime_types().end());
  }
  policy.strict_content_type = config.strict_content_type();
  return policy;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, std::shared_ptr<http::HttpClient> http) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence and providers
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config.database());
  app.router     = storage::StorageFactory::Build(config.providers(), std::move(http));

  // ------------------------------------------------------------------
  // Queues
  // ------------------------------------------------------------------
  const auto&          queue_config = config.queue();
  queue::QueueDefaults defaults;
  if (queue_config.max_attempts() != 0) defaults.max_attempts = queue_config.max_attempts();
  if (queue_config.backoff_initial_ms() != 0) defaults.backoff_initial_ms = queue_config.backoff_initial_ms();

  auto job_store        = queue_config.persist_jobs() ? app.repository : nullptr;
  app.accept_queue     = std::make_shared<queue::JobQueue>(queue::kAcceptQueue, job_store, defaults);
  app.processing_queue = std::make_shared<queue::JobQueue>(queue::kProcessingQueue, job_store, defaults);

  if (job_store) {
    const auto accepted  = app.accept_queue->Recover();
    const auto processed = app.processing_queue->Recover();
    INGEST_LOG_INFO("recovered persisted jobs", {observability::IntField("accept", static_cast<int64_t>(accepted)),
                                                 observability::IntField("processing", static_cast<int64_t>(processed))});
  }

  // ------------------------------------------------------------------
  // Resumable uploads
  // ------------------------------------------------------------------
  const auto&              resumable_config = config.resumable();
  upload::ResumableOptions resumable;
  if (resumable_config.session_ttl_seconds() != 0) resumable.session_ttl = std::chrono::seconds(resumable_config.session_ttl_seconds());
  resumable.max_total_size = config.policy().max_file_size_bytes();

  std::string temp_dir = resumable_config.temp_directory();
  if (temp_dir.empty()) temp_dir = (std::filesystem::temp_directory_path() / "ingest-uploads").string();
  auto temp_files = std::make_shared<upload::TempFileStore>(temp_dir);
  app.uploads     = std::make_shared<upload::ResumableUploadManager>(app.repository, temp_files, resumable);

  // ------------------------------------------------------------------
  // Orchestrator and workers
  // ------------------------------------------------------------------
  core::OrchestratorOptions orchestrator_options;
  orchestrator_options.policy            = BuildPolicy(config.policy());
  orchestrator_options.virus_scan_strict = config.virus_scan().strict();

  app.orchestrator = std::make_shared<core::UploadOrchestrator>(app.repository, app.router, app.accept_queue, app.processing_queue,
                                                                BuildScanner(config.virus_scan()), orchestrator_options);

  const uint32_t accept_threads     = queue_config.accept_workers() == 0 ? 2 : queue_config.accept_workers();
  const uint32_t processing_threads = queue_config.processing_workers() == 0 ? 2 : queue_config.processing_workers();
  app.accept_workers                = std::make_shared<queue::JobWorkerPool>(app.accept_queue, accept_threads);
  app.processing_workers            = std::make_shared<queue::JobWorkerPool>(app.processing_queue, processing_threads);
  app.orchestrator->RegisterHandlers(*app.accept_workers, *app.processing_workers);

  const auto sweep_interval = std::chrono::seconds(resumable_config.sweep_interval_seconds() == 0 ? 3600 : resumable_config.sweep_interval_seconds());
  auto       sweeper        = std::make_shared<upload::SessionSweeper>(app.uploads, sweep_interval);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository       = app.repository;
  ctx.uploads          = app.uploads;
  ctx.orchestrator     = app.orchestrator;
  ctx.router           = app.router;
  ctx.accept_queue     = app.accept_queue;
  ctx.processing_queue = app.processing_queue;
  if (config.providers().signed_url_ttl_seconds() != 0) ctx.signed_url_ttl = std::chrono::seconds(config.providers().signed_url_ttl_seconds());

  app.upload_service = std::make_shared<service::UploadService>(ctx);
  app.file_service   = std::make_shared<service::FileService>(ctx);
  app.admin_service  = std::make_shared<service::AdminService>(ctx);

  // Keep ownership of workers so they live for process lifetime
  app.background_workers.push_back(app.accept_workers);
  app.background_workers.push_back(app.processing_workers);
  app.background_workers.push_back(sweeper);

  return app;
}

void Application::Start() {
  for (const auto& worker : background_workers) {
    worker->Start();
  }
}

void Application::Stop() {
  for (auto it = background_workers.rbegin(); it != background_workers.rend(); ++it) {
    (*it)->Stop();
  }
}

void Application::DrainQueues() {
  constexpr auto kMaxWait = std::chrono::milliseconds(60000);

  for (;;) {
    bool progressed = false;
    while (accept_workers->RunOnce()) progressed = true;
    while (processing_workers->RunOnce()) progressed = true;
    if (progressed) continue;

    if (accept_queue->Idle() && processing_queue->Idle()) return;

    // Only delayed retries remain; sleep until the earliest is due.
    auto wait = kMaxWait;
    for (const auto& pending : {accept_queue, processing_queue}) {
      if (auto next = pending->NextDelayedIn(); next && *next < wait) wait = *next;
    }
    std::this_thread::sleep_for(std::max(wait, std::chrono::milliseconds(1)));
  }
}

} // namespace ingest::factory
