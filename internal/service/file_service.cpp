#include "file_service.hpp"

#include "internal/core/upload_orchestrator.hpp"
#include "internal/db/api/db_errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/names.hpp"
#include "internal/storage/provider_router.hpp"
#include "internal/util/time.hpp"
#include "observe_call.hpp"

namespace ingest::service {

using db::model::FileRecord;
using ingest::model::FileStatus;

namespace {

FileRecord LoadOwned(db::Repository& repository, db::Transaction& tx, const std::string& file_id, const std::string& owner_id) {
  auto file = repository.GetFile(tx, file_id);
  if (!file || file->owner_id != owner_id || file->status == FileStatus::kDeleted) {
    throw util::NotFound("file not found: " + file_id);
  }
  return *file;
}

} // namespace

FileService::FileService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::vector<FileRecord> FileService::ListFiles(const db::FileFilter& filter, const db::Page& page) {
  return ObserveCall("FileService.ListFiles", [&] {
    if (filter.owner_id.empty()) throw util::InvalidArgument("owner is required");
    auto tx = ctx_.repository->Begin();
    return ctx_.repository->ListFiles(*tx, filter, page);
  });
}

FileRecord FileService::GetFile(const std::string& file_id, const std::string& owner_id) {
  return ObserveCall("FileService.GetFile", [&] {
    auto tx = ctx_.repository->Begin();
    return LoadOwned(*ctx_.repository, *tx, file_id, owner_id);
  });
}

void FileService::DeleteFile(const std::string& file_id, const std::string& owner_id) {
  ObserveCall("FileService.DeleteFile", [&] {
    FileRecord file;
    {
      auto tx = ctx_.repository->Begin();
      file    = LoadOwned(*ctx_.repository, *tx, file_id, owner_id);

      const auto now     = util::NowMillis();
      file.status        = FileStatus::kDeleted;
      file.deleted_at_ms = now;
      file.updated_at_ms = now;
      db::ThrowIfDbError(ctx_.repository->UpdateFile(*tx, file), "delete file " + file_id);
      db::ThrowIfDbError(ctx_.repository->DeleteVariants(*tx, file_id), "delete variants of " + file_id);
      tx->Commit();
    }

    if (!file.primary_object_id.empty() || !file.backup_object_id.empty()) {
      ctx_.orchestrator->EnqueueCleanup(file_id);
    }
    INGEST_LOG_INFO("file deleted", {observability::StringField("file_id", file_id), observability::StringField("owner_id", owner_id)});
  });
}

std::string FileService::DownloadUrl(const std::string& file_id, const std::string& owner_id, std::optional<std::chrono::seconds> ttl) {
  return ObserveCall("FileService.DownloadUrl", [&] {
    FileRecord file;
    {
      auto tx = ctx_.repository->Begin();
      file    = LoadOwned(*ctx_.repository, *tx, file_id, owner_id);
    }
    if (file.status != FileStatus::kReady) {
      throw util::InvalidState("file " + file_id + " is " + std::string(model::ToString(file.status)));
    }
    if (model::IsPubliclyReadable(file.privacy)) {
      return file.primary_url;
    }
    return ctx_.router->ForKind(file.primary_provider)->GenerateSignedUrl(file.primary_object_id, ttl.value_or(ctx_.signed_url_ttl));
  });
}

std::string FileService::RequestVariants(const std::string& file_id, const std::string& owner_id,
                                         const std::vector<model::VariantKind>& variants) {
  return ObserveCall("FileService.RequestVariants", [&] {
    if (variants.empty()) throw util::InvalidArgument("at least one variant is required");

    FileRecord file;
    {
      auto tx = ctx_.repository->Begin();
      file    = LoadOwned(*ctx_.repository, *tx, file_id, owner_id);
    }
    if (file.status != FileStatus::kReady) {
      throw util::InvalidState("file " + file_id + " is " + std::string(model::ToString(file.status)));
    }
    if (file.type_category != model::TypeCategory::kImage && file.type_category != model::TypeCategory::kVideo) {
      throw util::UnsupportedType("variants are only available for images and video");
    }
    return ctx_.orchestrator->EnqueueVariants(file_id, variants);
  });
}

std::vector<db::model::VariantRecord> FileService::ListVariants(const std::string& file_id, const std::string& owner_id) {
  return ObserveCall("FileService.ListVariants", [&] {
    auto tx = ctx_.repository->Begin();
    LoadOwned(*ctx_.repository, *tx, file_id, owner_id);
    return ctx_.repository->ListVariants(*tx, file_id);
  });
}

} // namespace ingest::service
