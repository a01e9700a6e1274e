#include "media_provider.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/encoding.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/filename.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace ingest::storage {

namespace {

bool IsDeliveryType(const std::string& segment) {
  return segment == "upload" || segment == "private" || segment == "authenticated";
}

bool IsVersionSegment(const std::string& segment) {
  if (segment.size() < 2 || segment[0] != 'v') return false;
  for (std::size_t i = 1; i < segment.size(); ++i) {
    if (segment[i] < '0' || segment[i] > '9') return false;
  }
  return true;
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string::npos) end = path.size();
    if (end > start) parts.push_back(path.substr(start, end - start));
    start = end + 1;
  }
  return parts;
}

std::string FormEncode(const std::map<std::string, std::string>& fields) {
  std::string body;
  for (const auto& [key, value] : fields) {
    if (!body.empty()) body.push_back('&');
    body += util::UrlEncode(key) + "=" + util::UrlEncode(value);
  }
  return body;
}

std::string ErrorMessage(const http::HttpResponse& response) {
  try {
    auto json = util::ParseJsonObject(response.body);
    auto it   = json.fields().find("error");
    if (it != json.fields().end() && it->second.has_struct_value()) {
      if (auto message = util::GetString(it->second.struct_value(), "message")) return *message;
    }
  } catch (const std::exception&) {
    // Not JSON; fall through to the raw status.
  }
  return "http status " + std::to_string(response.status);
}

std::optional<uint32_t> OptionalDimension(const google::protobuf::Struct& json, const std::string& key) {
  auto value = util::GetNumber(json, key);
  if (!value) return std::nullopt;
  return static_cast<uint32_t>(*value);
}

} // namespace

MediaObject ParseMediaObjectId(const std::string& object_id) {
  auto first  = object_id.find('/');
  auto second = first == std::string::npos ? std::string::npos : object_id.find('/', first + 1);
  if (second == std::string::npos || second + 1 >= object_id.size()) {
    throw util::InvalidArgument("invalid media object id: " + object_id);
  }
  MediaObject object;
  object.resource_type = object_id.substr(0, first);
  object.type          = object_id.substr(first + 1, second - first - 1);
  object.public_id     = object_id.substr(second + 1);
  return object;
}

/*
  <base>/<cloud>/<resource_type>/<type>/[<transformations>/][v<version>/]<public_id>.<ext>

  Transformation segments are only recognised when a version segment
  follows them; otherwise everything after the type is the public id.
*/
MediaObject ParseDeliveryUrl(const std::string& url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) throw util::InvalidArgument("not a media url: " + url);
  auto path_start = url.find('/', scheme_end + 3);
  if (path_start == std::string::npos) throw util::InvalidArgument("not a media url: " + url);

  auto parts = SplitPath(url.substr(path_start, url.find('?') == std::string::npos ? std::string::npos : url.find('?') - path_start));

  std::size_t type_index = 0;
  for (std::size_t i = 1; i < parts.size(); ++i) {
    if ((parts[i - 1] == "image" || parts[i - 1] == "video") && IsDeliveryType(parts[i])) {
      type_index = i;
      break;
    }
  }
  if (type_index == 0 || type_index + 1 >= parts.size()) throw util::InvalidArgument("not a media url: " + url);

  MediaObject object;
  object.resource_type = parts[type_index - 1];
  object.type          = parts[type_index] == "authenticated" ? "private" : parts[type_index];

  std::size_t id_start = type_index + 1;
  for (std::size_t i = type_index + 1; i < parts.size(); ++i) {
    if (IsVersionSegment(parts[i])) {
      id_start = i + 1;
      break;
    }
  }
  if (id_start >= parts.size()) throw util::InvalidArgument("media url without public id: " + url);

  std::string public_id;
  for (std::size_t i = id_start; i < parts.size(); ++i) {
    if (!public_id.empty()) public_id.push_back('/');
    public_id += parts[i];
  }
  auto dot = public_id.rfind('.');
  if (dot != std::string::npos && public_id.find('/', dot) == std::string::npos) {
    object.extension = public_id.substr(dot + 1);
    public_id.resize(dot);
  }
  object.public_id = public_id;
  return object;
}

std::string TransformationSegment(const model::Transform& transform) {
  std::vector<std::string> parts;
  if (transform.width) parts.push_back("w_" + std::to_string(*transform.width));
  if (transform.height) parts.push_back("h_" + std::to_string(*transform.height));
  if (transform.width || transform.height) parts.push_back("c_" + transform.crop.value_or("fill"));
  if (transform.quality) parts.push_back("q_" + std::to_string(*transform.quality));
  if (transform.format) parts.push_back("f_" + *transform.format);
  if (transform.progressive) parts.push_back("fl_progressive");

  std::string out;
  for (const auto& part : parts) {
    if (!out.empty()) out.push_back(',');
    out += part;
  }
  return out;
}

std::string SignParams(const std::map<std::string, std::string>& params, const std::string& secret) {
  std::string payload;
  for (const auto& [key, value] : params) {
    if (value.empty()) continue;
    if (!payload.empty()) payload.push_back('&');
    payload += key + "=" + value;
  }
  return util::Sha1Hex(payload + secret);
}

MediaProvider::MediaProvider(std::shared_ptr<http::HttpClient> http, MediaProviderOptions options)
    : http_(std::move(http)), options_(std::move(options)) {
  if (options_.cloud_name.empty() || options_.api_key.empty() || options_.api_secret.empty()) {
    throw std::invalid_argument("media provider requires cloud_name, api_key and api_secret");
  }
}

const std::vector<model::TypeCategory>& MediaProvider::SupportedTypes() const {
  static const std::vector<model::TypeCategory> kTypes = {model::TypeCategory::kImage, model::TypeCategory::kVideo};
  return kTypes;
}

std::string MediaProvider::Timestamp() const {
  return std::to_string(util::NowMillis() / 1000);
}

http::HttpResponse MediaProvider::Call(const http::HttpRequest& request, std::string_view op) {
  const auto start = std::chrono::steady_clock::now();
  try {
    auto response = http_->Send(request);
    observability::Metrics::Instance().ObserveProviderLatencyMs(
        "media", op, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count());
    return response;
  } catch (const std::exception& e) {
    throw util::ProviderFailure("media " + std::string(op) + " request failed: " + e.what());
  }
}

std::string MediaProvider::DeliveryUrl(const MediaObject& object, const std::string& transformation, const std::string& extension) const {
  std::string url = options_.delivery_base_url + "/" + options_.cloud_name + "/" + object.resource_type + "/" + object.type + "/";
  if (!transformation.empty()) url += transformation + "/";
  url += object.public_id;
  if (!extension.empty()) url += "." + extension;
  return url;
}

UploadResult MediaProvider::Upload(const UploadRequest& request) {
  observability::SpanScope span("media.upload");

  MediaObject object;
  object.resource_type = model::CategoryFromMime(request.mime_type) == model::TypeCategory::kVideo ? "video" : "image";
  object.type          = request.is_public ? "upload" : "private";

  auto stem     = request.filename.substr(0, request.filename.size() - util::FileExtension(request.filename).size());
  auto folder   = request.folder.value_or(options_.folder);
  object.public_id = folder.empty() ? stem : folder + "/" + stem;
  span.SetAttribute("media.public_id", object.public_id);

  std::map<std::string, std::string> params = {
      {"public_id", object.public_id},
      {"overwrite", "true"},
      {"type", object.type},
      {"timestamp", Timestamp()},
  };
  if (!request.metadata.empty()) {
    std::string context;
    for (const auto& [key, value] : request.metadata) {
      if (!context.empty()) context.push_back('|');
      context += key + "=" + value;
    }
    params["context"] = context;
  }
  const auto signature = SignParams(params, options_.api_secret);

  http::MultipartForm form;
  for (const auto& [key, value] : params) form.AddField(key, value);
  form.AddField("api_key", options_.api_key);
  form.AddField("signature", signature);
  form.AddFile("file", request.filename, request.mime_type, request.data->ToString());

  http::HttpRequest http_request;
  http_request.method  = "POST";
  http_request.url     = options_.api_base_url + "/" + options_.cloud_name + "/" + object.resource_type + "/upload";
  http_request.headers = {{"Content-Type", form.ContentType()}};
  http_request.body    = form.Body();

  auto response = Call(http_request, "upload");
  if (!response.Ok()) {
    span.RecordException(ErrorMessage(response));
    throw util::ProviderFailure("media upload of " + object.public_id + " failed: " + ErrorMessage(response));
  }

  auto json = util::ParseJsonObject(response.body);

  const auto extension = util::FileExtension(request.filename);

  UploadResult result;
  result.url        = util::GetString(json, "secure_url").value_or(DeliveryUrl(object, "", extension.empty() ? "" : extension.substr(1)));
  result.object_id  = object.ObjectId();
  result.size_bytes = static_cast<uint64_t>(util::GetNumber(json, "bytes").value_or(static_cast<double>(request.data->size())));
  result.format     = util::GetString(json, "format").value_or("");
  if (auto width = util::GetNumber(json, "width")) result.metadata["width"] = std::to_string(static_cast<uint32_t>(*width));
  if (auto height = util::GetNumber(json, "height")) result.metadata["height"] = std::to_string(static_cast<uint32_t>(*height));
  if (auto version = util::GetNumber(json, "version")) result.metadata["version"] = std::to_string(static_cast<uint64_t>(*version));
  result.metadata["resource_type"] = object.resource_type;

  INGEST_LOG_INFO("media uploaded", {observability::StringField("public_id", object.public_id),
                                     observability::IntField("bytes", static_cast<int64_t>(result.size_bytes))});
  return result;
}

ProcessResult MediaProvider::Process(const std::string& url, const model::Transform& transform) {
  observability::SpanScope span("media.process");

  auto object = ParseDeliveryUrl(url);
  auto info   = GetInfo(object.ObjectId());

  const auto extension = transform.format.value_or(object.extension.empty() ? info.format : object.extension);

  ProcessResult result;
  result.url = DeliveryUrl(object, TransformationSegment(transform), extension);
  if (object.type != "upload") result.url += TokenQuery(object, options_.signed_url_ttl);
  result.width        = transform.width ? transform.width : info.width;
  result.height       = transform.height ? transform.height : info.height;
  result.size_bytes   = info.size_bytes;
  result.format       = extension;
  result.processed_by = "media";
  result.metadata["transformation"] = TransformationSegment(transform);
  return result;
}

bool MediaProvider::Delete(const std::string& object_id_or_url, bool force) {
  try {
    auto object =
        object_id_or_url.find("://") == std::string::npos ? ParseMediaObjectId(object_id_or_url) : ParseDeliveryUrl(object_id_or_url);

    std::map<std::string, std::string> params = {
        {"public_id", object.public_id},
        {"type", object.type},
        {"invalidate", "true"},
        {"timestamp", Timestamp()},
    };
    params["signature"] = SignParams(params, options_.api_secret);
    params["api_key"]   = options_.api_key;

    http::HttpRequest request;
    request.method  = "POST";
    request.url     = options_.api_base_url + "/" + options_.cloud_name + "/" + object.resource_type + "/destroy";
    request.headers = {{"Content-Type", "application/x-www-form-urlencoded"}};
    request.body    = FormEncode(params);

    auto response = Call(request, "delete");
    if (!response.Ok()) {
      throw util::ProviderFailure("media delete of " + object.public_id + " failed: " + ErrorMessage(response));
    }

    auto result = util::GetString(util::ParseJsonObject(response.body), "result").value_or("");
    if (result != "ok") {
      INGEST_LOG_WARN("media delete did not remove object",
                      {observability::StringField("public_id", object.public_id), observability::StringField("result", result)});
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    if (force) {
      INGEST_LOG_WARN("forced media delete ignored error",
                      {observability::StringField("object", object_id_or_url), observability::StringField("error", e.what())});
      return true;
    }
    if (dynamic_cast<const util::Error*>(&e)) throw;
    throw util::ProviderFailure(std::string("media delete failed: ") + e.what());
  }
}

ObjectInfo MediaProvider::GetInfo(const std::string& object_id) {
  auto object = ParseMediaObjectId(object_id);

  http::HttpRequest request;
  request.url = options_.api_base_url + "/" + options_.cloud_name + "/resources/" + object.resource_type + "/" + object.type + "/" +
                util::UrlEncode(object.public_id, false);
  request.headers = {{"Authorization", "Basic " + util::Base64Encode(options_.api_key + ":" + options_.api_secret)}};

  auto response = Call(request, "info");
  if (response.status == 404) {
    throw util::NotFound("media object " + object_id + " not found");
  }
  if (!response.Ok()) {
    throw util::ProviderFailure("media info for " + object_id + " failed: " + ErrorMessage(response));
  }

  auto json = util::ParseJsonObject(response.body);

  ObjectInfo info;
  info.object_id  = object_id;
  info.url        = util::GetString(json, "secure_url").value_or("");
  info.size_bytes = static_cast<uint64_t>(util::GetNumber(json, "bytes").value_or(0));
  info.format     = util::GetString(json, "format").value_or("");
  info.width      = OptionalDimension(json, "width");
  info.height     = OptionalDimension(json, "height");
  if (auto created = util::GetString(json, "created_at")) info.metadata["created_at"] = *created;
  return info;
}

/*
  Token authentication:

      __cld_token__=exp=<unix>~acl=<path>~hmac=<hex>

  hmac is HMAC-SHA256 over "exp=<unix>~acl=<path>" with the token key.
*/
std::string MediaProvider::TokenQuery(const MediaObject& object, std::chrono::seconds ttl) const {
  const auto expires = util::NowMillis() / 1000 + static_cast<uint64_t>(ttl.count());
  const auto acl     = "/" + object.resource_type + "/" + object.type + "/*";

  const auto key     = options_.auth_token_key.empty() ? options_.api_secret : util::HexDecode(options_.auth_token_key);
  const auto payload = "exp=" + std::to_string(expires) + "~acl=" + util::UrlEncode(acl, false);
  const auto token   = payload + "~hmac=" + util::HexEncode(util::HmacSha256(key, payload));

  return "?__cld_token__=" + token;
}

std::string MediaProvider::GenerateSignedUrl(const std::string& object_id, std::chrono::seconds ttl) {
  auto object = ParseMediaObjectId(object_id);
  return DeliveryUrl(object, "", object.extension) + TokenQuery(object, ttl);
}

} // namespace ingest::storage
