#include "provider_router.hpp"

#include <stdexcept>

#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ingest::storage {

ProviderRouter::ProviderRouter(StorageProviderPtr media, StorageProviderPtr object_store, BackupOptions backup)
    : media_(std::move(media)), object_store_(std::move(object_store)), backup_(std::move(backup)) {
  if (!object_store_) {
    throw std::invalid_argument("provider router requires an object store");
  }
}

StorageProviderPtr ProviderRouter::Choose(model::TypeCategory category) const {
  if (ChooseProviderKind(category) == model::ProviderKind::kTransform && media_) {
    return media_;
  }
  return object_store_;
}

StorageProviderPtr ProviderRouter::ForKind(model::ProviderKind kind) const {
  switch (kind) {
    case model::ProviderKind::kTransform:
      if (media_) return media_;
      break;
    case model::ProviderKind::kObjectStore:
      return object_store_;
    default:
      break;
  }
  throw util::InvalidState("no provider configured for " + std::string(model::ToString(kind)));
}

std::optional<UploadResult> ProviderRouter::Replicate(const db::model::FileRecord& file, const std::shared_ptr<arrow::Buffer>& data) const {
  if (file.primary_provider == model::ProviderKind::kObjectStore) {
    return std::nullopt;
  }

  UploadRequest request;
  request.data                         = data;
  request.filename                     = "backup_" + file.generated_filename;
  request.mime_type                    = file.mime_type;
  request.is_public                    = false;
  request.folder                       = backup_.folder;
  request.metadata["is_backup"]        = "true";
  request.metadata["original_file_id"] = file.id;

  try {
    object_store_->CheckUploadable(file.type_category, data->size());
    auto result = object_store_->Upload(request);
    INGEST_LOG_INFO("backup replicated", {observability::StringField("file_id", file.id),
                                          observability::StringField("object_id", result.object_id)});
    return result;
  } catch (const std::exception& e) {
    INGEST_LOG_WARN("backup replication failed",
                    {observability::StringField("file_id", file.id), observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

} // namespace ingest::storage
