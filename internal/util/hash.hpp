#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ingest::util {

/*
  Digest helpers backed by OpenSSL. Raw digests are returned as byte
  strings; *Hex variants return lowercase hex.
*/

std::string Sha256(const uint8_t* data, std::size_t size);
std::string Sha256(std::string_view data);
std::string Sha256Hex(const uint8_t* data, std::size_t size);
std::string Sha256Hex(std::string_view data);

std::string Sha1Hex(std::string_view data);

std::string HmacSha256(std::string_view key, std::string_view data);

} // namespace ingest::util
