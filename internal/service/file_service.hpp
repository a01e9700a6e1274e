#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/query.hpp"
#include "internal/db/model/file_record.hpp"
#include "internal/db/model/variant_record.hpp"
#include "internal/model/variant.hpp"
#include "service_context.hpp"

namespace ingest::service {

/*
  Read and lifecycle operations on stored files.

  Every call is scoped to an owner; a file owned by someone else is
  reported as NotFound.
*/
class FileService {
 public:
  explicit FileService(ServiceContext ctx);

  std::vector<db::model::FileRecord> ListFiles(const db::FileFilter& filter, const db::Page& page);

  db::model::FileRecord GetFile(const std::string& file_id, const std::string& owner_id);

  // Soft delete; variant rows go with it and remote objects are removed asynchronously.
  void DeleteFile(const std::string& file_id, const std::string& owner_id);

  // Public URL for public files, otherwise a signed URL valid for ttl.
  std::string DownloadUrl(const std::string& file_id, const std::string& owner_id, std::optional<std::chrono::seconds> ttl = std::nullopt);

  // Returns the id of the scheduled generate-variants job.
  std::string RequestVariants(const std::string& file_id, const std::string& owner_id, const std::vector<model::VariantKind>& variants);

  std::vector<db::model::VariantRecord> ListVariants(const std::string& file_id, const std::string& owner_id);

 private:
  ServiceContext ctx_;
};

} // namespace ingest::service
