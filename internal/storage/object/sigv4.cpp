#include "sigv4.hpp"

#include <algorithm>

#include "internal/util/encoding.hpp"
#include "internal/util/hash.hpp"

namespace ingest::storage {

namespace {

constexpr int64_t kMaxPresignSeconds = 7 * 24 * 3600;

std::string SigningKey(const std::string& secret, const std::string& date, const std::string& region) {
  auto k_date    = util::HmacSha256("AWS4" + secret, date);
  auto k_region  = util::HmacSha256(k_date, region);
  auto k_service = util::HmacSha256(k_region, "s3");
  return util::HmacSha256(k_service, "aws4_request");
}

} // namespace

std::string PresignGetUrl(const PresignRequest& request, util::TimePoint now) {
  const auto amz_date = util::FormatUtc(now, "%Y%m%dT%H%M%SZ");
  const auto date     = amz_date.substr(0, 8);
  const auto scope    = date + "/" + request.region + "/s3/aws4_request";
  const auto expires  = std::clamp<int64_t>(request.ttl.count(), 1, kMaxPresignSeconds);

  const auto canonical_uri = util::UrlEncode(request.canonical_uri, false);

  // Parameters are already in lexicographic order.
  std::string query;
  query += "X-Amz-Algorithm=AWS4-HMAC-SHA256";
  query += "&X-Amz-Credential=" + util::UrlEncode(request.access_key_id + "/" + scope);
  query += "&X-Amz-Date=" + amz_date;
  query += "&X-Amz-Expires=" + std::to_string(expires);
  query += "&X-Amz-SignedHeaders=host";

  const auto canonical_request = "GET\n" + canonical_uri + "\n" + query + "\nhost:" + request.host + "\n\nhost\nUNSIGNED-PAYLOAD";

  const auto string_to_sign = "AWS4-HMAC-SHA256\n" + amz_date + "\n" + scope + "\n" + util::Sha256Hex(canonical_request);

  const auto signature = util::HexEncode(util::HmacSha256(SigningKey(request.secret_access_key, date, request.region), string_to_sign));

  return request.scheme + "://" + request.host + canonical_uri + "?" + query + "&X-Amz-Signature=" + signature;
}

} // namespace ingest::storage
