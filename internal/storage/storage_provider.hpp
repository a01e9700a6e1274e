#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/file.hpp"
#include "internal/model/metadata.hpp"
#include "internal/model/provider_kind.hpp"
#include "internal/model/variant.hpp"

namespace ingest::storage {

struct UploadRequest {
  std::shared_ptr<arrow::Buffer> data;
  std::string                    filename; // generated storage name, extension included
  std::string                    mime_type;
  bool                           is_public = true;
  std::optional<std::string>     folder;
  model::Metadata                metadata;
};

struct UploadResult {
  std::string     url;
  std::string     object_id;
  uint64_t        size_bytes = 0;
  std::string     format;
  model::Metadata metadata;
};

// processed_by is "none" when the provider returned the original untouched.
struct ProcessResult {
  std::string             url;
  std::optional<uint32_t> width;
  std::optional<uint32_t> height;
  uint64_t                size_bytes = 0;
  std::string             format;
  std::string             processed_by;
  model::Metadata         metadata;
};

struct ObjectInfo {
  std::string             object_id;
  std::string             url;
  uint64_t                size_bytes = 0;
  std::string             format;
  std::optional<uint32_t> width;
  std::optional<uint32_t> height;
  model::Metadata         metadata;
};

inline constexpr std::string_view kNotProcessed = "none";

/*
  Remote storage abstraction.

  Implementations:
    MediaProvider       -> transform-capable media service (images/video)
    ObjectStoreProvider -> Arrow filesystem (S3 or local), any content

  Contract:
    - Upload is never retried inside a provider; the queue owns retries.
    - Every remote failure surfaces as util::ProviderFailure.
    - Delete(force=true) reports success even when the remote call failed.
*/

class StorageProvider {
 public:
  virtual ~StorageProvider() = default;

  virtual UploadResult Upload(const UploadRequest& request) = 0;

  virtual ProcessResult Process(const std::string& url, const model::Transform& transform) = 0;

  // Accepts an object id or a URL previously returned by this provider.
  virtual bool Delete(const std::string& object_id_or_url, bool force) = 0;

  virtual ObjectInfo GetInfo(const std::string& object_id) = 0;

  virtual std::string GenerateSignedUrl(const std::string& object_id, std::chrono::seconds ttl) = 0;

  virtual const std::vector<model::TypeCategory>& SupportedTypes() const = 0;
  virtual uint64_t                                MaxFileSize() const    = 0;
  virtual model::ProviderKind                     Kind() const           = 0;

  bool Supports(model::TypeCategory category) const;

  // Throws util::UnsupportedType / util::TooLarge.
  void CheckUploadable(model::TypeCategory category, uint64_t size_bytes) const;
};

using StorageProviderPtr = std::shared_ptr<StorageProvider>;

} // namespace ingest::storage
