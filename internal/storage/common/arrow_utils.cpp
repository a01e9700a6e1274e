#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

#include <filesystem>

#include "config/config.pb.h"
#include "internal/util/encoding.hpp"

namespace ingest::storage::common {

namespace {

bool IsS3Uri(const std::string& uri) {
  return uri.rfind("s3://", 0) == 0;
}

ResolvedFileSystem ResolveS3(const std::string& uri, const ingest::runtime::config::ObjectStoreConfig& config,
                             std::chrono::milliseconds timeout) {
  if (config.sse_customer_key().empty()) {
    throw std::invalid_argument("object_store.sse_customer_key is required for s3 stores");
  }

  Unwrap(arrow::fs::EnsureS3Initialized());

  std::string root;
  auto        options = Unwrap(arrow::fs::S3Options::FromUri(uri, &root));

  if (!config.region().empty()) options.region = config.region();
  if (!config.endpoint_override().empty()) options.endpoint_override = config.endpoint_override();
  if (!config.scheme().empty()) options.scheme = config.scheme();
  if (!config.access_key_id().empty()) {
    options.ConfigureAccessKey(config.access_key_id(), config.secret_access_key());
  }
  options.connect_timeout = static_cast<double>(timeout.count()) / 1000.0;
  options.request_timeout = static_cast<double>(timeout.count()) / 1000.0;

  // Customer keys are configured hex-encoded; Arrow wants the raw 32 bytes.
  options.sse_customer_key = util::HexDecode(config.sse_customer_key());

  ResolvedFileSystem resolved;
  resolved.fs     = Unwrap(arrow::fs::S3FileSystem::Make(options));
  resolved.root   = root;
  resolved.bucket = config.bucket().empty() ? root.substr(0, root.find('/')) : config.bucket();
  resolved.is_s3  = true;
  return resolved;
}

} // namespace

ResolvedFileSystem ResolveObjectStore(const ingest::runtime::config::ObjectStoreConfig& config, std::chrono::milliseconds timeout) {
  // A bare bucket means the bucket root.
  if (config.root_uri().empty() && !config.bucket().empty()) {
    return ResolveS3("s3://" + config.bucket(), config, timeout);
  }
  if (IsS3Uri(config.root_uri())) {
    return ResolveS3(config.root_uri(), config, timeout);
  }

  std::string root = config.root_uri();
  if (root.rfind("file://", 0) == 0) root = root.substr(7);
  if (root.empty()) root = (std::filesystem::temp_directory_path() / "ingest-objects").string();
  std::filesystem::create_directories(root);

  ResolvedFileSystem resolved;
  resolved.fs   = std::make_shared<arrow::fs::LocalFileSystem>();
  resolved.root = std::filesystem::absolute(root).string();
  return resolved;
}

} // namespace ingest::storage::common
