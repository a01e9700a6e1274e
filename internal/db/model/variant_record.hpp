#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/metadata.hpp"
#include "internal/model/variant.hpp"

namespace ingest::db::model {

// Unique on (file_id, kind).
struct VariantRecord {
  std::string id;
  std::string file_id;

  ingest::model::VariantKind kind = ingest::model::VariantKind::kThumbnail;

  std::string             url;
  std::optional<uint32_t> width;
  std::optional<uint32_t> height;
  uint64_t                size_bytes = 0;
  std::string             format;

  ingest::model::Metadata metadata;

  uint64_t created_at_ms = 0;
};

} // namespace ingest::db::model
