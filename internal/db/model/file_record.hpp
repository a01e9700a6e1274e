#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/file.hpp"
#include "internal/model/metadata.hpp"
#include "internal/model/provider_kind.hpp"

namespace ingest::db::model {

/*
  Persistent file row.

  IMPORTANT:
  - primary_* is only set once status leaves Uploading.
  - backup_* is only set after a successful replication.
  - Deleted rows are kept (soft delete) with deleted_at_ms set.
*/

struct FileRecord {
  std::string id;
  std::string owner_id;

  std::string original_name;
  std::string generated_filename;
  std::string mime_type;

  ingest::model::TypeCategory type_category = ingest::model::TypeCategory::kOther;

  uint64_t    size_bytes = 0;
  std::string content_hash;

  ingest::model::ProviderKind primary_provider = ingest::model::ProviderKind::kNone;
  std::string                 primary_url;
  std::string                 primary_object_id;

  ingest::model::ProviderKind backup_provider = ingest::model::ProviderKind::kNone;
  std::string                 backup_url;
  std::string                 backup_object_id;

  ingest::model::FileCategory category = ingest::model::FileCategory::kContent;
  ingest::model::Privacy      privacy  = ingest::model::Privacy::kPublic;
  ingest::model::FileStatus   status   = ingest::model::FileStatus::kUploading;

  ingest::model::Metadata metadata;

  uint64_t                created_at_ms = 0;
  uint64_t                updated_at_ms = 0;
  std::optional<uint64_t> deleted_at_ms;
};

} // namespace ingest::db::model
