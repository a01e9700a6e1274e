#include "upload_orchestrator.hpp"

#include "ingest/v1/jobs.pb.h"
#include "internal/core/content_sniffer.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/model/names.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/filename.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ingest::core {

using db::model::FileRecord;
using db::model::JobRecord;
using ingest::model::FileStatus;
using ingest::model::ProviderKind;
using observability::IntField;
using observability::StringField;

namespace {

std::string_view View(const arrow::Buffer& buffer) {
  return {reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(buffer.size())};
}

// Ready rows win over in-flight ones; failed rows never dedup.
std::optional<FileRecord> PickDuplicate(const std::vector<FileRecord>& rows) {
  for (const auto& row : rows) {
    if (row.status == FileStatus::kReady) return row;
  }
  for (const auto& row : rows) {
    if (row.status == FileStatus::kUploading || row.status == FileStatus::kProcessing) return row;
  }
  return std::nullopt;
}

template <typename Message>
Message ParsePayload(const JobRecord& job) {
  Message message;
  if (!message.ParseFromString(job.payload)) {
    throw util::InvalidArgument("malformed " + job.kind + " payload in job " + job.id);
  }
  return message;
}

} // namespace

UploadOrchestrator::UploadOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<storage::ProviderRouter> router,
                                       std::shared_ptr<queue::JobQueue> accept_queue, std::shared_ptr<queue::JobQueue> processing_queue,
                                       security::VirusScannerPtr scanner, OrchestratorOptions options)
    : repository_(std::move(repository)),
      router_(std::move(router)),
      accept_queue_(std::move(accept_queue)),
      processing_queue_(std::move(processing_queue)),
      scanner_(std::move(scanner)),
      options_(std::move(options)) {
}

// ---------------------------------------------------------------------
// Submission
// ---------------------------------------------------------------------

void UploadOrchestrator::ScanContent(const SubmitRequest& request, model::Metadata& metadata) {
  if (!scanner_) {
    metadata["virus_scanned"] = "false";
    return;
  }

  security::ScanResult result;
  try {
    result = scanner_->Scan(View(*request.data), request.original_name);
  } catch (const std::exception& e) {
    if (options_.virus_scan_strict) {
      throw util::Rejected(std::string("virus scan failed: ") + e.what());
    }
    INGEST_LOG_WARN("virus scan failed; accepting upload", {StringField("name", request.original_name), StringField("error", e.what())});
    metadata["virus_scanned"] = "false";
    return;
  }

  if (result.infected) {
    std::string names;
    for (const auto& virus : result.viruses) {
      if (!names.empty()) names += ", ";
      names += virus;
    }
    throw util::Rejected("file rejected: virus detected (" + names + ")");
  }
  metadata["virus_scanned"]   = "true";
  metadata["virus_scan_date"] = util::ToIso8601(util::Now());
}

void UploadOrchestrator::InspectContent(const SubmitRequest& request) {
  const auto content = View(*request.data);

  if (auto sniffed = SniffMimeType(content); sniffed && !MimeCompatible(request.mime_type, *sniffed)) {
    if (options_.policy.strict_content_type) {
      throw util::Rejected("declared type " + request.mime_type + " does not match content (" + *sniffed + ")");
    }
    INGEST_LOG_WARN("declared type does not match content", {StringField("name", request.original_name),
                                                             StringField("declared", request.mime_type), StringField("sniffed", *sniffed)});
  }

  if (auto pattern = FindSuspiciousPattern(content)) {
    throw util::SuspiciousContent("file contains potentially malicious content (" + *pattern + ")");
  }
}

FileRecord UploadOrchestrator::SubmitUpload(const SubmitRequest& request) {
  observability::SpanScope span("upload.submit");

  if (!request.data) throw util::InvalidArgument("file content is required");
  if (request.original_name.empty()) throw util::InvalidArgument("file name is required");
  if (request.owner_id.empty()) throw util::InvalidArgument("owner is required");

  const auto size = static_cast<uint64_t>(request.data->size());
  span.SetAttribute("upload.size", static_cast<int64_t>(size));

  model::Metadata metadata = request.metadata;
  try {
    CheckUploadPolicy(options_.policy, size, request.mime_type);
    ScanContent(request, metadata);
    InspectContent(request);
  } catch (const util::Error& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordUpload("rejected");
    INGEST_LOG_WARN("upload rejected", {StringField("owner_id", request.owner_id), StringField("name", request.original_name),
                                        StringField("error", e.what())});
    throw;
  }

  const auto hash = util::Sha256Hex(request.data->data(), request.data->size());
  const auto now  = util::NowMillis();
  metadata["uploaded_at"] = util::ToIso8601(util::FromUnixMillis(now));

  FileRecord file;
  {
    std::lock_guard lock(submit_mutex_);
    auto            tx = repository_->Begin();

    if (auto existing = PickDuplicate(repository_->FindFilesByHash(*tx, request.owner_id, hash))) {
      observability::Metrics::Instance().RecordUpload("deduplicated");
      INGEST_LOG_INFO("duplicate upload", {StringField("file_id", existing->id), StringField("owner_id", request.owner_id),
                                           StringField("status", model::ToString(existing->status))});
      return *existing;
    }

    file.id                 = util::NewId();
    file.owner_id           = request.owner_id;
    file.original_name      = request.original_name;
    file.generated_filename = util::GenerateStoredFilename(request.original_name, now);
    file.mime_type          = request.mime_type;
    file.type_category      = model::CategoryFromMime(request.mime_type);
    file.size_bytes         = size;
    file.content_hash       = hash;
    file.category           = request.category;
    file.privacy            = request.privacy;
    file.status             = FileStatus::kUploading;
    file.metadata           = std::move(metadata);
    file.created_at_ms      = now;
    file.updated_at_ms      = now;

    db::ThrowIfDbError(repository_->InsertFile(*tx, file), "insert file " + file.id);
    tx->Commit();
  }

  ingest::v1::AcceptJob payload;
  payload.set_file_id(file.id);
  payload.set_content(std::string(View(*request.data)));
  for (auto kind : request.variants) payload.add_variants(std::string(model::ToString(kind)));

  queue::JobOptions job_options;
  job_options.priority = model::UploadPriority(file.type_category);
  try {
    accept_queue_->Enqueue(kProcessUploadJob, payload.SerializeAsString(), job_options);
  } catch (const std::exception& e) {
    MarkFailed(file.id, e.what());
    throw;
  }

  observability::Metrics::Instance().RecordUpload("accepted");
  INGEST_LOG_INFO("upload accepted", {StringField("file_id", file.id), StringField("owner_id", file.owner_id),
                                      StringField("type", model::ToString(file.type_category)), IntField("bytes", static_cast<int64_t>(size))});
  return file;
}

// ---------------------------------------------------------------------
// Persistence helpers
// ---------------------------------------------------------------------

FileRecord UploadOrchestrator::LoadFile(const std::string& file_id) {
  auto tx   = repository_->Begin();
  auto file = repository_->GetFile(*tx, file_id);
  if (!file) throw util::NotFound("file not found: " + file_id);
  return *file;
}

void UploadOrchestrator::SaveFile(const FileRecord& file) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpdateFile(*tx, file), "update file " + file.id);
  tx->Commit();
}

// Moves the current row to Processing; nothing when a delete got there first.
std::optional<FileRecord> UploadOrchestrator::ClaimForUpload(const std::string& file_id) {
  auto tx   = repository_->Begin();
  auto file = repository_->GetFile(*tx, file_id);
  if (!file) throw util::NotFound("file not found: " + file_id);
  if (file->status == FileStatus::kDeleted) return std::nullopt;

  file->status        = FileStatus::kProcessing;
  file->updated_at_ms = util::NowMillis();
  db::ThrowIfDbError(repository_->UpdateFile(*tx, *file), "claim file " + file_id);
  tx->Commit();
  return file;
}

void UploadOrchestrator::MarkFailed(const std::string& file_id, const std::string& error) {
  try {
    auto tx   = repository_->Begin();
    auto file = repository_->GetFile(*tx, file_id);
    if (!file || !model::CanTransition(file->status, FileStatus::kFailed)) return;

    file->status               = FileStatus::kFailed;
    file->metadata["error"]     = error;
    file->metadata["failed_at"] = util::ToIso8601(util::Now());
    file->updated_at_ms         = util::NowMillis();
    db::ThrowIfDbError(repository_->UpdateFile(*tx, *file), "fail file " + file_id);
    tx->Commit();
  } catch (const std::exception& e) {
    INGEST_LOG_ERROR("could not mark file failed", {StringField("file_id", file_id), StringField("error", e.what())});
  }
}

// ---------------------------------------------------------------------
// Accept queue
// ---------------------------------------------------------------------

/*
  A redelivered job for a Ready file skips the upload; the follow-up
  jobs are idempotent (variant upsert, backup guarded by backup_object_id).
*/
void UploadOrchestrator::ExecuteAcceptJob(const JobRecord& job) {
  const auto payload = ParsePayload<ingest::v1::AcceptJob>(job);
  auto       file    = LoadFile(payload.file_id());

  if (file.status == FileStatus::kDeleted) {
    INGEST_LOG_INFO("file deleted before upload; dropping job", {StringField("file_id", file.id)});
    return;
  }

  if (file.status != FileStatus::kReady) {
    try {
      auto provider = router_->Choose(file.type_category);
      provider->CheckUploadable(file.type_category, file.size_bytes);

      auto claimed = ClaimForUpload(file.id);
      if (!claimed) {
        INGEST_LOG_INFO("file deleted before upload; dropping job", {StringField("file_id", file.id)});
        return;
      }
      file = std::move(*claimed);

      storage::UploadRequest upload;
      upload.data      = storage::common::ToBuffer(payload.content());
      upload.filename  = file.generated_filename;
      upload.mime_type = file.mime_type;
      upload.is_public = model::IsPubliclyReadable(file.privacy);
      upload.metadata  = {{"file_id", file.id}, {"owner_id", file.owner_id}, {"original_name", file.original_name}};

      auto result = provider->Upload(upload);

      auto current = LoadFile(file.id);
      if (current.status == FileStatus::kDeleted) {
        provider->Delete(result.object_id, true);
        INGEST_LOG_INFO("file deleted during upload; remote copy removed", {StringField("file_id", file.id)});
        return;
      }

      current.primary_provider  = provider->Kind();
      current.primary_url       = result.url;
      current.primary_object_id = result.object_id;
      current.status            = FileStatus::kReady;
      model::Merge(current.metadata, result.metadata);
      current.metadata.erase("error");
      current.metadata.erase("failed_at");
      current.metadata["processed_at"] = util::ToIso8601(util::Now());
      current.updated_at_ms            = util::NowMillis();
      SaveFile(current);
      file = std::move(current);

      INGEST_LOG_INFO("file stored", {StringField("file_id", file.id), StringField("provider", model::ToString(file.primary_provider)),
                                      StringField("object_id", file.primary_object_id)});
    } catch (const std::exception& e) {
      MarkFailed(file.id, e.what());
      throw;
    }
  } else {
    INGEST_LOG_DEBUG("file already stored; scheduling follow-ups", {StringField("file_id", file.id)});
  }

  if (payload.variants_size() > 0) {
    ingest::v1::ProcessingJob variants;
    variants.set_file_id(file.id);
    *variants.mutable_variants() = payload.variants();
    processing_queue_->Enqueue(kGenerateVariantsJob, variants.SerializeAsString());
  }

  if (router_->BackupEnabled() && file.primary_provider != ProviderKind::kObjectStore && file.backup_object_id.empty()) {
    ingest::v1::ProcessingJob backup;
    backup.set_file_id(file.id);
    backup.set_content(payload.content());
    processing_queue_->Enqueue(kReplicateBackupJob, backup.SerializeAsString());
  }
}

// ---------------------------------------------------------------------
// Processing queue
// ---------------------------------------------------------------------

void UploadOrchestrator::ExecuteGenerateVariants(const JobRecord& job) {
  const auto payload = ParsePayload<ingest::v1::ProcessingJob>(job);
  const auto file    = LoadFile(payload.file_id());

  if (file.status == FileStatus::kDeleted) return;
  if (file.status != FileStatus::kReady) {
    throw util::InvalidState("file " + file.id + " is " + std::string(model::ToString(file.status)) + "; variants need a ready file");
  }

  auto     provider  = router_->ForKind(file.primary_provider);
  uint32_t generated = 0;

  for (const auto& name : payload.variants()) {
    auto kind = model::ParseVariantKind(name);
    if (!kind) {
      INGEST_LOG_WARN("unknown variant kind", {StringField("file_id", file.id), StringField("variant", name)});
      continue;
    }

    try {
      auto result = provider->Process(file.primary_url, model::VariantPreset(*kind));
      if (result.processed_by == storage::kNotProcessed) {
        INGEST_LOG_DEBUG("provider returned original; variant skipped", {StringField("file_id", file.id), StringField("variant", name)});
        continue;
      }

      db::model::VariantRecord variant;
      variant.id                       = util::NewId();
      variant.file_id                  = file.id;
      variant.kind                     = *kind;
      variant.url                      = result.url;
      variant.width                    = result.width;
      variant.height                   = result.height;
      variant.size_bytes               = result.size_bytes;
      variant.format                   = result.format;
      variant.metadata                 = result.metadata;
      variant.metadata["processed_by"] = result.processed_by;
      variant.created_at_ms            = util::NowMillis();

      auto tx = repository_->Begin();
      db::ThrowIfDbError(repository_->UpsertVariant(*tx, variant), "upsert variant " + name + " of " + file.id);
      tx->Commit();
      ++generated;
    } catch (const std::exception& e) {
      INGEST_LOG_WARN("variant generation failed", {StringField("file_id", file.id), StringField("variant", name), StringField("error", e.what())});
    }
  }

  INGEST_LOG_INFO("variants generated", {StringField("file_id", file.id), IntField("generated", generated),
                                         IntField("requested", payload.variants_size())});
}

void UploadOrchestrator::ExecuteReplicateBackup(const JobRecord& job) {
  const auto payload = ParsePayload<ingest::v1::ProcessingJob>(job);
  const auto file    = LoadFile(payload.file_id());

  if (file.status != FileStatus::kReady || !file.backup_object_id.empty()) return;

  auto result = router_->Replicate(file, storage::common::ToBuffer(payload.content()));
  if (!result) return;

  auto current = LoadFile(file.id);
  if (current.status == FileStatus::kDeleted) {
    router_->ForKind(ProviderKind::kObjectStore)->Delete(result->object_id, true);
    return;
  }
  current.backup_provider  = ProviderKind::kObjectStore;
  current.backup_url       = result->url;
  current.backup_object_id = result->object_id;
  current.updated_at_ms    = util::NowMillis();
  SaveFile(current);
}

// Provider errors propagate as ProviderFailure so the queue retries with backoff.
void UploadOrchestrator::ExecuteCleanupRemote(const JobRecord& job) {
  const auto payload = ParsePayload<ingest::v1::ProcessingJob>(job);
  const auto file    = LoadFile(payload.file_id());

  if (file.status != FileStatus::kDeleted) {
    throw util::InvalidState("refusing to clean up live file " + file.id);
  }

  if (!file.primary_object_id.empty()) {
    const bool removed = router_->ForKind(file.primary_provider)->Delete(file.primary_object_id, false);
    INGEST_LOG_INFO("primary object removed",
                    {StringField("file_id", file.id), StringField("object_id", file.primary_object_id), observability::BoolField("existed", removed)});
  }
  if (!file.backup_object_id.empty()) {
    const bool removed = router_->ForKind(file.backup_provider)->Delete(file.backup_object_id, false);
    INGEST_LOG_INFO("backup object removed",
                    {StringField("file_id", file.id), StringField("object_id", file.backup_object_id), observability::BoolField("existed", removed)});
  }
}

std::string UploadOrchestrator::EnqueueVariants(const std::string& file_id, const std::vector<model::VariantKind>& variants) {
  ingest::v1::ProcessingJob payload;
  payload.set_file_id(file_id);
  for (auto kind : variants) payload.add_variants(std::string(model::ToString(kind)));
  return processing_queue_->Enqueue(kGenerateVariantsJob, payload.SerializeAsString());
}

std::string UploadOrchestrator::EnqueueCleanup(const std::string& file_id) {
  ingest::v1::ProcessingJob payload;
  payload.set_file_id(file_id);
  return processing_queue_->Enqueue(kCleanupRemoteJob, payload.SerializeAsString());
}

void UploadOrchestrator::RegisterHandlers(queue::JobWorkerPool& accept, queue::JobWorkerPool& processing) {
  accept.Register(kProcessUploadJob, [this](const JobRecord& job) { ExecuteAcceptJob(job); });
  processing.Register(kGenerateVariantsJob, [this](const JobRecord& job) { ExecuteGenerateVariants(job); });
  processing.Register(kReplicateBackupJob, [this](const JobRecord& job) { ExecuteReplicateBackup(job); });
  processing.Register(kCleanupRemoteJob, [this](const JobRecord& job) { ExecuteCleanupRemote(job); });
}

} // namespace ingest::core
