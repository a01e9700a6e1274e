#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include "internal/http/http_client.hpp"
#include "internal/storage/storage_provider.hpp"

namespace ingest::storage {

struct MediaProviderOptions {
  std::string cloud_name;
  std::string api_key;
  std::string api_secret;
  std::string folder            = "uploads";
  std::string api_base_url      = "https://api.cloudinary.com/v1_1";
  std::string delivery_base_url = "https://res.cloudinary.com";
  std::string auth_token_key; // hex; falls back to api_secret when empty

  uint64_t             max_file_size = 100ULL * 1024 * 1024;
  std::chrono::seconds signed_url_ttl{3600};
};

/*
  Parsed form of a media object id: "<resource_type>/<type>/<public_id>".

    resource_type : image | video
    type          : upload (public) | private
*/
struct MediaObject {
  std::string resource_type;
  std::string type;
  std::string public_id;
  std::string extension; // only known when parsed from a URL

  std::string ObjectId() const {
    return resource_type + "/" + type + "/" + public_id;
  }
};

MediaObject ParseMediaObjectId(const std::string& object_id);

// Throws util::InvalidArgument when the URL is not a delivery URL.
MediaObject ParseDeliveryUrl(const std::string& url);

// "w_300,h_300,c_fill,q_80,f_webp,fl_progressive"; empty for an empty transform.
std::string TransformationSegment(const model::Transform& transform);

// SHA-1 hex of "k1=v1&k2=v2...<secret>" with keys in lexicographic order.
std::string SignParams(const std::map<std::string, std::string>& params, const std::string& secret);

/*
  MediaProvider

  Transform-capable media service spoken over its signed REST API.

  Uploads use a deterministic public id (folder/stem) with overwrite
  enabled, so a retried upload after a lost response lands on the same
  object. Derived assets are URL transformations and are never stored.
*/
class MediaProvider final : public StorageProvider {
 public:
  MediaProvider(std::shared_ptr<http::HttpClient> http, MediaProviderOptions options);

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
    return model::ProviderKind::kTransform;
  }

  std::string DeliveryUrl(const MediaObject& object, const std::string& transformation, const std::string& extension) const;

 private:
  http::HttpResponse Call(const http::HttpRequest& request, std::string_view op);
  std::string        Timestamp() const;
  std::string        TokenQuery(const MediaObject& object, std::chrono::seconds ttl) const;

  std::shared_ptr<http::HttpClient> http_;
  MediaProviderOptions              options_;
};

} // namespace ingest::storage
