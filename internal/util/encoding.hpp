#pragma once

#include <string>
#include <string_view>

namespace ingest::util {

std::string HexEncode(std::string_view bytes);
std::string HexDecode(std::string_view hex);

std::string Base64Encode(std::string_view bytes);

// RFC 3986 percent-encoding; '/' is kept when encode_slash is false.
std::string UrlEncode(std::string_view value, bool encode_slash = true);

std::string ToLower(std::string_view value);

} // namespace ingest::util
