#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/model/file_record.hpp"
#include "internal/storage/storage_provider.hpp"

namespace ingest::storage {

// Images and video go to the transform provider, everything else to object storage.
constexpr model::ProviderKind ChooseProviderKind(model::TypeCategory category) {
  switch (category) {
    case model::TypeCategory::kImage:
    case model::TypeCategory::kVideo:
      return model::ProviderKind::kTransform;
    default:
      return model::ProviderKind::kObjectStore;
  }
}

struct BackupOptions {
  bool        enabled = false;
  std::string folder  = "backups";
};

/*
  ProviderRouter

  Owns the configured providers and decides where a file lives.

  The object store is mandatory. When no transform provider is
  configured, images and video fall back to the object store.
*/
class ProviderRouter {
 public:
  ProviderRouter(StorageProviderPtr media, StorageProviderPtr object_store, BackupOptions backup);

  StorageProviderPtr Choose(model::TypeCategory category) const;

  // Provider that stores objects of the given kind; throws InvalidState if not configured.
  StorageProviderPtr ForKind(model::ProviderKind kind) const;

  bool HasMedia() const {
    return media_ != nullptr;
  }
  bool BackupEnabled() const {
    return backup_.enabled;
  }

  /*
    Best-effort private copy into the object store.

    Skipped (nullopt) when the primary already is the object store.
    Errors are logged and reported as nullopt.
  */
  std::optional<UploadResult> Replicate(const db::model::FileRecord& file, const std::shared_ptr<arrow::Buffer>& data) const;

 private:
  StorageProviderPtr media_;
  StorageProviderPtr object_store_;
  BackupOptions      backup_;
};

} // namespace ingest::storage
