#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "internal/observability/logging.hpp"
#include "media/media_provider.hpp"
#include "object/object_store_provider.hpp"

namespace ingest::storage {

namespace {

std::chrono::milliseconds RequestTimeout(const ingest::runtime::config::ProvidersConfig& cfg) {
  return std::chrono::milliseconds(cfg.request_timeout_ms() == 0 ? 30000 : cfg.request_timeout_ms());
}

std::chrono::seconds SignedUrlTtl(const ingest::runtime::config::ProvidersConfig& cfg) {
  return std::chrono::seconds(cfg.signed_url_ttl_seconds() == 0 ? 3600 : cfg.signed_url_ttl_seconds());
}

} // namespace

StorageProviderPtr StorageFactory::BuildObjectStore(const ingest::runtime::config::ProvidersConfig& cfg) {
  const auto& object = cfg.object_store();
  auto        resolved = common::ResolveObjectStore(object, RequestTimeout(cfg));

  ObjectStoreOptions options;
  options.root              = resolved.root;
  options.bucket            = resolved.bucket;
  options.is_s3             = resolved.is_s3;
  options.access_key_id     = object.access_key_id();
  options.secret_access_key = object.secret_access_key();
  options.endpoint_override = object.endpoint_override();
  options.public_base_url   = object.public_base_url();
  options.signed_url_ttl    = SignedUrlTtl(cfg);
  if (!object.region().empty()) options.region = object.region();
  if (!object.scheme().empty()) options.scheme = object.scheme();
  if (object.max_file_size_bytes() != 0) options.max_file_size = object.max_file_size_bytes();

  INGEST_LOG_INFO("object store configured",
                  {observability::StringField("root", options.root), observability::BoolField("s3", options.is_s3)});
  return std::make_shared<ObjectStoreProvider>(std::move(resolved.fs), std::move(options));
}

std::shared_ptr<ProviderRouter> StorageFactory::Build(const ingest::runtime::config::ProvidersConfig& cfg,
                                                      std::shared_ptr<http::HttpClient>               http) {
  StorageProviderPtr media;
  if (cfg.media().enabled()) {
    const auto& config = cfg.media();

    MediaProviderOptions options;
    options.cloud_name     = config.cloud_name();
    options.api_key        = config.api_key();
    options.api_secret     = config.api_secret();
    options.auth_token_key = config.auth_token_key();
    options.signed_url_ttl = SignedUrlTtl(cfg);
    if (!config.folder().empty()) options.folder = config.folder();
    if (!config.api_base_url().empty()) options.api_base_url = config.api_base_url();
    if (!config.delivery_base_url().empty()) options.delivery_base_url = config.delivery_base_url();
    if (config.max_file_size_bytes() != 0) options.max_file_size = config.max_file_size_bytes();

    if (!http) http = std::make_shared<http::BeastHttpClient>(RequestTimeout(cfg));
    media = std::make_shared<MediaProvider>(std::move(http), std::move(options));
    INGEST_LOG_INFO("media provider configured", {observability::StringField("cloud", config.cloud_name())});
  } else {
    INGEST_LOG_INFO("media provider disabled; images and video go to the object store");
  }

  BackupOptions backup;
  backup.enabled = cfg.backup().enabled();
  if (!cfg.backup().folder().empty()) backup.folder = cfg.backup().folder();

  return std::make_shared<ProviderRouter>(std::move(media), BuildObjectStore(cfg), std::move(backup));
}

} // namespace ingest::storage
