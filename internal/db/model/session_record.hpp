#pragma once

#include <cstdint>
#include <set>
#include <string>

#include "internal/model/metadata.hpp"
#include "internal/model/upload_session.hpp"

namespace ingest::db::model {

/*
  Persistent upload session row.

  uploaded_chunks is the authoritative set of written chunk indices;
  uploaded_size is kept in step with it inside the same transaction.
*/

struct SessionRecord {
  std::string id;
  std::string owner_id;

  std::string filename;
  std::string mime_type;

  uint64_t total_size   = 0;
  uint64_t chunk_size   = 0;
  uint64_t total_chunks = 0;

  std::set<uint64_t> uploaded_chunks;
  uint64_t           uploaded_size = 0;

  ingest::model::SessionStatus status = ingest::model::SessionStatus::kActive;

  std::string             temp_path;
  ingest::model::Metadata metadata;

  uint64_t expires_at_ms = 0;
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  uint64_t RemainingChunks() const {
    return total_chunks - uploaded_chunks.size();
  }

  double ProgressPercent() const {
    return total_size == 0 ? 0.0 : static_cast<double>(uploaded_size) * 100.0 / static_cast<double>(total_size);
  }
};

} // namespace ingest::db::model
