#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/storage_provider.hpp"

namespace ingest::storage {

struct ObjectStoreOptions {
  std::string root;   // filesystem path under which keys live
  std::string bucket; // S3 only
  std::string region = "us-east-1";
  bool        is_s3  = false;

  std::string access_key_id;
  std::string secret_access_key;
  std::string endpoint_override; // host[:port]; switches URLs to path style
  std::string scheme = "https";
  std::string public_base_url;

  uint64_t             max_file_size  = 5ULL * 1024 * 1024 * 1024;
  std::string          default_folder = "files";
  std::chrono::seconds signed_url_ttl{3600};
};

/*
  Object storage provider on top of the Arrow filesystem layer.

  Key layout:

      <root>/<folder>/<filename>

  The object id is "<folder>/<filename>". Content type and ACL travel
  as object metadata; encryption is configured on the S3 filesystem
  (SSE-C) and applies to every write.
*/

class ObjectStoreProvider final : public StorageProvider {
 public:
  ObjectStoreProvider(std::shared_ptr<arrow::fs::FileSystem> fs, ObjectStoreOptions options);

  UploadResult  Upload(const UploadRequest& request) override;
  ProcessResult Process(const std::string& url, const model::Transform& transform) override;
  bool          Delete(const std::string& object_id_or_url, bool force) override;
  ObjectInfo    GetInfo(const std::string& object_id) override;
  std::string   GenerateSignedUrl(const std::string& object_id, std::chrono::seconds ttl) override;

  const std::vector<model::TypeCategory>& SupportedTypes() const override;
  uint64_t                                MaxFileSize() const override {
    return options_.max_file_size;
  }
  model::ProviderKind Kind() const override {
    return model::ProviderKind::kObjectStore;
  }

  std::string PublicUrl(const std::string& key) const;

 private:
  std::string ObjectPath(const std::string& key) const;
  // Key as seen by S3: the root prefix below the bucket plus the object id.
  std::string RemoteKey(const std::string& key) const;
  std::string KeyFromUrl(const std::string& object_id_or_url) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  ObjectStoreOptions                     options_;
};

// Lowercases and maps everything outside [a-z0-9-] to '-'.
std::string NormalizeMetadataKey(const std::string& key);

} // namespace ingest::storage
