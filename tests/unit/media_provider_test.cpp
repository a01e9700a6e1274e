#include <cassert>
#include <deque>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/http/http_client.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/media/media_provider.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace {

using ingest::http::HttpClient;
using ingest::http::HttpRequest;
using ingest::http::HttpResponse;
using ingest::storage::MediaProvider;
using ingest::storage::MediaProviderOptions;
using ingest::storage::ParseDeliveryUrl;
using ingest::storage::ParseMediaObjectId;
using ingest::storage::SignParams;
using ingest::storage::TransformationSegment;
using ingest::storage::UploadRequest;
using ingest::storage::common::ToBuffer;

// Replays scripted responses and records every request.
class ScriptedHttpClient final : public HttpClient {
 public:
  HttpResponse Send(const HttpRequest& request) override {
    requests.push_back(request);
    if (responses.empty()) throw std::runtime_error("connection refused");
    auto response = responses.front();
    responses.pop_front();
    return response;
  }

  void Reply(int status, std::string body) {
    HttpResponse response;
    response.status = status;
    response.body   = std::move(body);
    responses.push_back(std::move(response));
  }

  std::deque<HttpResponse> responses;
  std::vector<HttpRequest> requests;
};

MediaProviderOptions Options() {
  MediaProviderOptions options;
  options.cloud_name = "demo";
  options.api_key    = "key";
  options.api_secret = "secret";
  return options;
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestDeliveryUrlParsing() {
  auto plain = ParseDeliveryUrl("https://res.cloudinary.com/demo/image/upload/v1700000000/uploads/photo_1_abc.png");
  assert(plain.resource_type == "image");
  assert(plain.type == "upload");
  assert(plain.public_id == "uploads/photo_1_abc");
  assert(plain.extension == "png");
  assert(plain.ObjectId() == "image/upload/uploads/photo_1_abc");

  auto transformed = ParseDeliveryUrl("https://res.cloudinary.com/demo/video/authenticated/w_300,c_limit/v12/uploads/clip.mp4?__cld_token__=x");
  assert(transformed.resource_type == "video");
  assert(transformed.type == "private");
  assert(transformed.public_id == "uploads/clip");
  assert(transformed.extension == "mp4");

  auto unversioned = ParseDeliveryUrl("https://res.cloudinary.com/demo/image/private/uploads/a.jpg");
  assert(unversioned.public_id == "uploads/a");

  bool threw = false;
  try {
    (void)ParseDeliveryUrl("https://example.com/files/a.png");
  } catch (const ingest::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  auto object = ParseMediaObjectId("video/private/uploads/nested/clip");
  assert(object.resource_type == "video");
  assert(object.type == "private");
  assert(object.public_id == "uploads/nested/clip");
}

void TestTransformationSegment() {
  ingest::model::Transform thumb;
  thumb.width  = 150;
  thumb.height = 150;
  thumb.crop   = "fill";
  assert(TransformationSegment(thumb) == "w_150,h_150,c_fill");

  ingest::model::Transform webp;
  webp.format  = "webp";
  webp.quality = 90;
  assert(TransformationSegment(webp) == "q_90,f_webp");

  ingest::model::Transform compressed;
  compressed.quality     = 60;
  compressed.progressive = true;
  assert(TransformationSegment(compressed) == "q_60,fl_progressive");

  assert(TransformationSegment({}).empty());
}

void TestSignature() {
  // Empty values are not signed.
  const auto signature = SignParams({{"timestamp", "1315060510"}, {"public_id", "sample"}, {"context", ""}}, "abcd");
  assert(signature == ingest::util::Sha1Hex("public_id=sample&timestamp=1315060510abcd"));
}

void TestUploadSendsSignedMultipart() {
  auto http = std::make_shared<ScriptedHttpClient>();
  http->Reply(200, R"({"secure_url":"https://res.cloudinary.com/demo/image/private/v17/uploads/photo_1_abc.png","bytes":4,"format":"png","width":640,"height":480,"version":17})");

  MediaProvider provider(http, Options());

  UploadRequest request;
  request.data      = ToBuffer("\x89PNG");
  request.filename  = "photo_1_abc.png";
  request.mime_type = "image/png";
  request.is_public = false;
  request.metadata  = {{"original_name", "photo.png"}};

  auto result = provider.Upload(request);
  assert(result.object_id == "image/private/uploads/photo_1_abc");
  assert(result.url == "https://res.cloudinary.com/demo/image/private/v17/uploads/photo_1_abc.png");
  assert(result.size_bytes == 4);
  assert(result.format == "png");
  assert(result.metadata.at("width") == "640");
  assert(result.metadata.at("version") == "17");

  assert(http->requests.size() == 1);
  const auto& sent = http->requests[0];
  assert(sent.method == "POST");
  assert(sent.url == "https://api.cloudinary.com/v1_1/demo/image/upload");
  assert(Contains(sent.body, "uploads/photo_1_abc"));
  assert(Contains(sent.body, "original_name=photo.png"));
  assert(Contains(sent.body, "name=\"signature\""));
  assert(Contains(sent.body, "name=\"api_key\""));
  assert(Contains(sent.body, "\x89PNG"));
}

void TestUploadVideoGoesToVideoEndpoint() {
  auto http = std::make_shared<ScriptedHttpClient>();
  http->Reply(200, R"({"bytes":3})");

  MediaProvider provider(http, Options());

  UploadRequest request;
  request.data      = ToBuffer("mp4");
  request.filename  = "clip_1_abc.mp4";
  request.mime_type = "video/mp4";
  request.folder    = "backups";

  auto result = provider.Upload(request);
  assert(result.object_id == "video/upload/backups/clip_1_abc");
  assert(result.url == "https://res.cloudinary.com/demo/video/upload/backups/clip_1_abc.mp4");
  assert(http->requests[0].url == "https://api.cloudinary.com/v1_1/demo/video/upload");
}

void TestUploadFailuresAreProviderFailures() {
  auto http = std::make_shared<ScriptedHttpClient>();
  http->Reply(500, R"({"error":{"message":"Internal error"}})");

  MediaProvider provider(http, Options());

  UploadRequest request;
  request.data      = ToBuffer("x");
  request.filename  = "a.png";
  request.mime_type = "image/png";

  for (int attempt = 0; attempt < 2; ++attempt) {
    bool failed = false;
    try {
      (void)provider.Upload(request);
    } catch (const ingest::util::ProviderFailure& e) {
      failed = true;
      // First an HTTP error, then a transport error from the empty script.
      if (attempt == 0) assert(Contains(e.what(), "Internal error"));
    }
    assert(failed);
  }
}

void TestProcessBuildsTransformationUrl() {
  auto http = std::make_shared<ScriptedHttpClient>();
  http->Reply(200, R"({"bytes":2048,"format":"jpg","width":1024,"height":768})");
  http->Reply(200, R"({"bytes":2048,"format":"jpg","width":1024,"height":768})");

  MediaProvider provider(http, Options());

  ingest::model::Transform medium;
  medium.width = 600;
  medium.crop  = "limit";

  auto result = provider.Process("https://res.cloudinary.com/demo/image/upload/v1/uploads/pic.jpg", medium);
  assert(result.url == "https://res.cloudinary.com/demo/image/upload/w_600,c_limit/uploads/pic.jpg");
  assert(result.width == 600u);
  assert(result.height == 768u);
  assert(result.processed_by == "media");
  assert(http->requests[0].method == "GET");
  assert(http->requests[0].url == "https://api.cloudinary.com/v1_1/demo/resources/image/upload/uploads/pic");
  assert(http->requests[0].headers[0].second == "Basic a2V5OnNlY3JldA==");

  ingest::model::Transform webp;
  webp.format  = "webp";
  webp.quality = 90;
  auto secured = provider.Process("https://res.cloudinary.com/demo/image/private/v1/uploads/pic.jpg", webp);
  assert(secured.url.rfind("https://res.cloudinary.com/demo/image/private/q_90,f_webp/uploads/pic.webp?__cld_token__=exp=", 0) == 0);
  assert(Contains(secured.url, "~hmac="));
  assert(secured.format == "webp");
}

void TestGetInfoNotFound() {
  auto http = std::make_shared<ScriptedHttpClient>();
  http->Reply(404, R"({"error":{"message":"Resource not found"}})");

  MediaProvider provider(http, Options());
  bool          not_found = false;
  try {
    (void)provider.GetInfo("image/upload/uploads/missing");
  } catch (const ingest::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestDelete() {
  auto http = std::make_shared<ScriptedHttpClient>();
  http->Reply(200, R"({"result":"ok"})");
  http->Reply(200, R"({"result":"not found"})");

  MediaProvider provider(http, Options());
  assert(provider.Delete("image/private/uploads/a", false));
  assert(http->requests[0].url == "https://api.cloudinary.com/v1_1/demo/image/destroy");
  assert(Contains(http->requests[0].body, "public_id=uploads%2Fa"));
  assert(Contains(http->requests[0].body, "type=private"));
  assert(Contains(http->requests[0].body, "signature="));

  assert(!provider.Delete("https://res.cloudinary.com/demo/video/upload/v3/uploads/b.mp4", false));
  assert(http->requests[1].url == "https://api.cloudinary.com/v1_1/demo/video/destroy");

  // Script exhausted: transport errors surface unless forced.
  bool failed = false;
  try {
    (void)provider.Delete("image/upload/uploads/c", false);
  } catch (const ingest::util::ProviderFailure&) {
    failed = true;
  }
  assert(failed);
  assert(provider.Delete("image/upload/uploads/c", true));
}

void TestSignedUrl() {
  auto http = std::make_shared<ScriptedHttpClient>();
  MediaProvider provider(http, Options());

  const auto url = provider.GenerateSignedUrl("image/private/uploads/a", std::chrono::seconds(600));
  assert(url.rfind("https://res.cloudinary.com/demo/image/private/uploads/a?__cld_token__=exp=", 0) == 0);
  assert(Contains(url, "~acl=/image/private/%2A~hmac="));
  assert(http->requests.empty());
}

void TestRequiresCredentials() {
  auto options       = Options();
  options.api_secret = "";
  bool threw         = false;
  try {
    MediaProvider provider(std::make_shared<ScriptedHttpClient>(), options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDeliveryUrlParsing();
  TestTransformationSegment();
  TestSignature();
  TestUploadSendsSignedMultipart();
  TestUploadVideoGoesToVideoEndpoint();
  TestUploadFailuresAreProviderFailures();
  TestProcessBuildsTransformationUrl();
  TestGetInfoNotFound();
  TestDelete();
  TestSignedUrl();
  TestRequiresCredentials();

  std::cout << "ingest_manager_unit_media_provider: pass\n";
  return 0;
}
