#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace ingest::storage {

struct PresignRequest {
  std::string scheme = "https";
  std::string host;          // e.g. bucket.s3.us-east-1.amazonaws.com
  std::string canonical_uri; // already starts with '/', unencoded
  std::string region;
  std::string access_key_id;
  std::string secret_access_key;
  std::chrono::seconds ttl{3600};
};

/*
  AWS Signature V4 query-string presigning for GET.

  Only the host header is signed and the payload is UNSIGNED-PAYLOAD,
  which is what browsers and curl send for a plain download.
*/
std::string PresignGetUrl(const PresignRequest& request, util::TimePoint now);

} // namespace ingest::storage
