#include "hash.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <stdexcept>

#include "encoding.hpp"

namespace ingest::util {

std::string Sha256(const uint8_t* data, std::size_t size) {
  std::string digest(SHA256_DIGEST_LENGTH, '\0');
  SHA256(data, size, reinterpret_cast<unsigned char*>(digest.data()));
  return digest;
}

std::string Sha256(std::string_view data) {
  return Sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string Sha256Hex(const uint8_t* data, std::size_t size) {
  return HexEncode(Sha256(data, size));
}

std::string Sha256Hex(std::string_view data) {
  return HexEncode(Sha256(data));
}

std::string Sha1Hex(std::string_view data) {
  std::string digest(SHA_DIGEST_LENGTH, '\0');
  SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(), reinterpret_cast<unsigned char*>(digest.data()));
  return HexEncode(digest);
}

std::string HmacSha256(std::string_view key, std::string_view data) {
  std::string  mac(EVP_MAX_MD_SIZE, '\0');
  unsigned int mac_len = 0;
  const auto*  result  = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(data.data()),
                              data.size(), reinterpret_cast<unsigned char*>(mac.data()), &mac_len);
  if (result == nullptr) {
    throw std::runtime_error("HMAC-SHA256 failed");
  }
  mac.resize(mac_len);
  return mac;
}

} // namespace ingest::util
