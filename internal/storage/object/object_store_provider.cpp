#include "object_store_provider.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/util/key_value_metadata.h>

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/object/sigv4.hpp"
#include "internal/util/encoding.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/filename.hpp"

namespace ingest::storage {

using namespace ingest::storage::common;

namespace {

std::string Format(const std::string& filename) {
  auto ext = util::FileExtension(filename);
  return ext.empty() ? std::string() : ext.substr(1);
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

std::string NormalizeMetadataKey(const std::string& key) {
  std::string out = util::ToLower(key);
  for (auto& c : out) {
    if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-')) c = '-';
  }
  return out;
}

ObjectStoreProvider::ObjectStoreProvider(std::shared_ptr<arrow::fs::FileSystem> fs, ObjectStoreOptions options)
    : fs_(std::move(fs)), options_(std::move(options)) {
  while (!options_.root.empty() && options_.root.back() == '/') options_.root.pop_back();
}

const std::vector<model::TypeCategory>& ObjectStoreProvider::SupportedTypes() const {
  static const std::vector<model::TypeCategory> kTypes = {model::TypeCategory::kImage,    model::TypeCategory::kVideo,
                                                          model::TypeCategory::kAudio,    model::TypeCategory::kDocument,
                                                          model::TypeCategory::kArchive, model::TypeCategory::kOther};
  return kTypes;
}

std::string ObjectStoreProvider::ObjectPath(const std::string& key) const {
  if (key.empty() || key.find("..") != std::string::npos || key.front() == '/') {
    throw util::InvalidArgument("invalid object key: " + key);
  }
  return options_.root.empty() ? key : options_.root + "/" + key;
}

std::string ObjectStoreProvider::RemoteKey(const std::string& key) const {
  if (!options_.is_s3 || options_.root.size() <= options_.bucket.size()) return key;
  return options_.root.substr(options_.bucket.size() + 1) + "/" + key;
}

std::string ObjectStoreProvider::PublicUrl(const std::string& key) const {
  const auto encoded = util::UrlEncode(RemoteKey(key), false);
  if (!options_.public_base_url.empty()) {
    auto base = options_.public_base_url;
    if (base.back() == '/') base.pop_back();
    return base + "/" + encoded;
  }
  if (!options_.is_s3) {
    return "file://" + ObjectPath(key);
  }
  if (!options_.endpoint_override.empty()) {
    return options_.scheme + "://" + options_.endpoint_override + "/" + options_.bucket + "/" + encoded;
  }
  return "https://" + options_.bucket + ".s3." + options_.region + ".amazonaws.com/" + encoded;
}

// Public and signed URLs both end in the key; file:// URLs end in the full path.
std::string ObjectStoreProvider::KeyFromUrl(const std::string& object_id_or_url) const {
  auto scheme_end = object_id_or_url.find("://");
  if (scheme_end == std::string::npos) return object_id_or_url;

  auto path = object_id_or_url.substr(0, object_id_or_url.find('?'));
  if (path.rfind("file://", 0) == 0) {
    path = path.substr(7);
    auto prefix = options_.root + "/";
    return path.rfind(prefix, 0) == 0 ? path.substr(prefix.size()) : path;
  }

  if (!options_.public_base_url.empty() && path.rfind(options_.public_base_url, 0) == 0) {
    path = path.substr(options_.public_base_url.size());
  } else {
    auto path_start = path.find('/', scheme_end + 3);
    path            = path_start == std::string::npos ? std::string() : path.substr(path_start);
    if (!options_.endpoint_override.empty() && path.rfind("/" + options_.bucket + "/", 0) == 0) {
      path = path.substr(options_.bucket.size() + 1);
    }
  }
  while (!path.empty() && path.front() == '/') path.erase(path.begin());

  // Undo percent-encoding.
  std::string remote;
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (path[i] == '%' && i + 2 < path.size()) {
      remote += util::HexDecode(path.substr(i + 1, 2));
      i += 2;
    } else {
      remote.push_back(path[i]);
    }
  }

  const auto prefix = RemoteKey("");
  return !prefix.empty() && remote.rfind(prefix, 0) == 0 ? remote.substr(prefix.size()) : remote;
}

UploadResult ObjectStoreProvider::Upload(const UploadRequest& request) {
  observability::SpanScope span("object_store.upload");
  const auto               start = std::chrono::steady_clock::now();

  const auto folder = request.folder.value_or(options_.default_folder);
  const auto key    = folder.empty() ? request.filename : folder + "/" + request.filename;
  span.SetAttribute("object.key", key);

  model::Metadata stored;
  for (const auto& [k, v] : request.metadata) {
    stored[NormalizeMetadataKey(k)] = v;
  }

  try {
    const auto path = ObjectPath(key);
    // Local directories must exist before a write; S3 has no directories.
    if (!options_.is_s3) {
      const auto slash = path.rfind('/');
      if (slash != std::string::npos && slash > 0) Unwrap(fs_->CreateDir(path.substr(0, slash), true));
    }

    auto kv  = arrow::KeyValueMetadata::Make({"Content-Type", "ACL"}, {request.mime_type, request.is_public ? "public-read" : "private"});
    auto out = Unwrap(fs_->OpenOutputStream(path, kv));
    Unwrap(out->Write(request.data));
    Unwrap(out->Close());
  } catch (const util::Error&) {
    throw;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::ProviderFailure("object store upload of " + key + " failed: " + e.what());
  }
  observability::Metrics::Instance().ObserveProviderLatencyMs("object_store", "upload", ElapsedMs(start));

  UploadResult result;
  result.object_id  = key;
  result.size_bytes = static_cast<uint64_t>(request.data->size());
  result.format     = Format(request.filename);
  result.url        = request.is_public ? PublicUrl(key) : GenerateSignedUrl(key, options_.signed_url_ttl);
  result.metadata   = std::move(stored);
  result.metadata["content-type"] = request.mime_type;

  INGEST_LOG_INFO("object stored", {observability::StringField("key", key), observability::IntField("bytes", result.size_bytes)});
  return result;
}

ProcessResult ObjectStoreProvider::Process(const std::string& url, const model::Transform&) {
  ProcessResult result;
  result.url          = url;
  result.processed_by = std::string(kNotProcessed);
  return result;
}

bool ObjectStoreProvider::Delete(const std::string& object_id_or_url, bool force) {
  const auto key = KeyFromUrl(object_id_or_url);
  try {
    const auto path = ObjectPath(key);
    auto       info = Unwrap(fs_->GetFileInfo(path));
    if (info.type() == arrow::fs::FileType::NotFound) {
      return false;
    }
    Unwrap(fs_->DeleteFile(path));
    INGEST_LOG_INFO("object deleted", {observability::StringField("key", key)});
    return true;
  } catch (const std::exception& e) {
    if (force) {
      INGEST_LOG_WARN("forced object delete ignored error", {observability::StringField("key", key), observability::StringField("error", e.what())});
      return true;
    }
    throw util::ProviderFailure("object store delete of " + key + " failed: " + e.what());
  }
}

ObjectInfo ObjectStoreProvider::GetInfo(const std::string& object_id) {
  arrow::fs::FileInfo info;
  try {
    info = Unwrap(fs_->GetFileInfo(ObjectPath(object_id)));
  } catch (const util::Error&) {
    throw;
  } catch (const std::exception& e) {
    throw util::ProviderFailure("object store stat of " + object_id + " failed: " + e.what());
  }
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("object " + object_id + " not found");
  }

  ObjectInfo result;
  result.object_id  = object_id;
  result.url        = PublicUrl(object_id);
  result.size_bytes = static_cast<uint64_t>(info.size());
  result.format     = Format(object_id);
  return result;
}

std::string ObjectStoreProvider::GenerateSignedUrl(const std::string& object_id, std::chrono::seconds ttl) {
  if (!options_.is_s3) {
    return "file://" + ObjectPath(object_id);
  }
  if (options_.access_key_id.empty() || options_.secret_access_key.empty()) {
    throw util::ProviderFailure("presigning requires static access key credentials");
  }

  PresignRequest presign;
  presign.region            = options_.region;
  presign.access_key_id     = options_.access_key_id;
  presign.secret_access_key = options_.secret_access_key;
  presign.ttl               = ttl;
  if (!options_.endpoint_override.empty()) {
    presign.scheme        = options_.scheme;
    presign.host          = options_.endpoint_override;
    presign.canonical_uri = "/" + options_.bucket + "/" + RemoteKey(object_id);
  } else {
    presign.host          = options_.bucket + ".s3." + options_.region + ".amazonaws.com";
    presign.canonical_uri = "/" + RemoteKey(object_id);
  }
  return PresignGetUrl(presign, util::Now());
}

} // namespace ingest::storage
