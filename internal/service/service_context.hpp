#pragma once

#include <chrono>
#include <memory>

namespace ingest::core {
class UploadOrchestrator;
}
namespace ingest::db {
class Repository;
}
namespace ingest::queue {
class JobQueue;
}
namespace ingest::storage {
class ProviderRouter;
}
namespace ingest::upload {
class ResumableUploadManager;
}

namespace ingest::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<ingest::db::Repository>                 repository;
  std::shared_ptr<ingest::upload::ResumableUploadManager> uploads;
  std::shared_ptr<ingest::core::UploadOrchestrator>       orchestrator;
  std::shared_ptr<ingest::storage::ProviderRouter>        router;
  std::shared_ptr<ingest::queue::JobQueue>                accept_queue;
  std::shared_ptr<ingest::queue::JobQueue>                processing_queue;

  std::chrono::seconds signed_url_ttl{3600};
};

} // namespace ingest::service
