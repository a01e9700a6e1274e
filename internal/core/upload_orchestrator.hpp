#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/upload_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/queue/job_worker.hpp"
#include "internal/security/virus_scanner.hpp"
#include "internal/storage/provider_router.hpp"

namespace ingest::core {

inline constexpr const char* kProcessUploadJob    = "process-upload";
inline constexpr const char* kGenerateVariantsJob = "generate-variants";
inline constexpr const char* kReplicateBackupJob  = "replicate-backup";
inline constexpr const char* kCleanupRemoteJob    = "cleanup-remote";

struct SubmitRequest {
  std::shared_ptr<arrow::Buffer>          data;
  std::string                             original_name;
  std::string                             mime_type;
  std::string                             owner_id;
  model::FileCategory                     category = model::FileCategory::kContent;
  model::Privacy                          privacy  = model::Privacy::kPrivate;
  std::vector<model::VariantKind>         variants;
  model::Metadata                         metadata;
};

struct OrchestratorOptions {
  UploadPolicy policy;
  bool         virus_scan_strict = false;
};

/*
  UploadOrchestrator

  Accepts complete files and drives them through the job pipeline:

      SubmitUpload            -> File(Uploading) + accept job
      accept/process-upload   -> primary upload, File(Ready)
      processing/*            -> variants, backup copy, remote cleanup

  Submission is synchronous up to persistence; everything that talks to
  a provider runs on the worker pools.

  Dedup:
    (owner, content hash) lookup and insert run under submit_mutex_ so
    two identical concurrent submissions resolve to one File.
*/
class UploadOrchestrator {
 public:
  UploadOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<storage::ProviderRouter> router,
                     std::shared_ptr<queue::JobQueue> accept_queue, std::shared_ptr<queue::JobQueue> processing_queue,
                     security::VirusScannerPtr scanner, OrchestratorOptions options);

  db::model::FileRecord SubmitUpload(const SubmitRequest& request);

  void ExecuteAcceptJob(const db::model::JobRecord& job);
  void ExecuteGenerateVariants(const db::model::JobRecord& job);
  void ExecuteReplicateBackup(const db::model::JobRecord& job);
  void ExecuteCleanupRemote(const db::model::JobRecord& job);

  std::string EnqueueVariants(const std::string& file_id, const std::vector<model::VariantKind>& variants);
  std::string EnqueueCleanup(const std::string& file_id);

  void RegisterHandlers(queue::JobWorkerPool& accept, queue::JobWorkerPool& processing);

  const OrchestratorOptions& options() const {
    return options_;
  }

 private:
  void ScanContent(const SubmitRequest& request, model::Metadata& metadata);
  void InspectContent(const SubmitRequest& request);

  db::model::FileRecord                LoadFile(const std::string& file_id);
  void                                 SaveFile(const db::model::FileRecord& file);
  std::optional<db::model::FileRecord> ClaimForUpload(const std::string& file_id);
  void                                 MarkFailed(const std::string& file_id, const std::string& error);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<storage::ProviderRouter> router_;
  std::shared_ptr<queue::JobQueue>         accept_queue_;
  std::shared_ptr<queue::JobQueue>         processing_queue_;
  security::VirusScannerPtr                scanner_;
  OrchestratorOptions                      options_;

  std::mutex submit_mutex_;
};

} // namespace ingest::core
