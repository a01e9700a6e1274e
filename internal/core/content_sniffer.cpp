#include "content_sniffer.hpp"

#include <array>
#include <regex>

#include "internal/util/encoding.hpp"

namespace ingest::core {

namespace {

struct Magic {
  std::size_t      offset;
  std::string_view bytes;
  const char*      mime;
};

using namespace std::string_view_literals;

// Longer and more specific signatures first.
const std::array kMagic = {
    Magic{0, "\x89PNG\r\n\x1a\n"sv, "image/png"},
    Magic{0, "\xff\xd8\xff"sv, "image/jpeg"},
    Magic{0, "GIF87a"sv, "image/gif"},
    Magic{0, "GIF89a"sv, "image/gif"},
    Magic{0, "II*\0"sv, "image/tiff"},
    Magic{0, "MM\0*"sv, "image/tiff"},
    Magic{0, "%PDF-"sv, "application/pdf"},
    Magic{0, "PK\x03\x04"sv, "application/zip"},
    Magic{0, "\x1f\x8b"sv, "application/gzip"},
    Magic{0, "Rar!\x1a\x07"sv, "application/vnd.rar"},
    Magic{0, "7z\xbc\xaf\x27\x1c"sv, "application/x-7z-compressed"},
    Magic{257, "ustar"sv, "application/x-tar"},
    Magic{0, "\x7f" "ELF"sv, "application/x-elf"},
    Magic{0, "OggS"sv, "audio/ogg"},
    Magic{0, "fLaC"sv, "audio/flac"},
    Magic{0, "ID3"sv, "audio/mpeg"},
    Magic{0, "\xff\xfb"sv, "audio/mpeg"},
    Magic{0, "\xff\xf3"sv, "audio/mpeg"},
    Magic{0, "\xff\xf2"sv, "audio/mpeg"},
    Magic{0, "MZ"sv, "application/x-msdownload"},
    Magic{0, "BM"sv, "image/bmp"},
};

bool HasAt(std::string_view content, std::size_t offset, std::string_view bytes) {
  return content.size() >= offset + bytes.size() && content.substr(offset, bytes.size()) == bytes;
}

/*
  ISO base media: "....ftyp<brand>". The major brand separates still
  images (HEIC/AVIF) from QuickTime and MP4 video.
*/
std::optional<std::string> SniffIsoMedia(std::string_view content) {
  if (!HasAt(content, 4, "ftyp")) return std::nullopt;
  if (content.size() < 12) return std::string("video/mp4");

  const auto brand = content.substr(8, 4);
  if (brand == "avif" || brand == "avis") return std::string("image/avif");
  if (brand == "heic" || brand == "heix" || brand == "mif1" || brand == "msf1") return std::string("image/heic");
  if (brand == "qt  ") return std::string("video/quicktime");
  if (brand == "M4A ") return std::string("audio/mp4");
  return std::string("video/mp4");
}

std::optional<std::string> SniffRiff(std::string_view content) {
  if (!HasAt(content, 0, "RIFF") || content.size() < 12) return std::nullopt;
  const auto form = content.substr(8, 4);
  if (form == "WEBP") return std::string("image/webp");
  if (form == "AVI ") return std::string("video/x-msvideo");
  if (form == "WAVE") return std::string("audio/wav");
  return std::nullopt;
}

std::optional<std::string> SniffMatroska(std::string_view content) {
  if (!HasAt(content, 0, "\x1a\x45\xdf\xa3")) return std::nullopt;
  const auto head = content.substr(0, 64);
  return std::string(head.find("webm") != std::string_view::npos ? "video/webm" : "video/x-matroska");
}

std::string_view Canonical(std::string_view mime) {
  static const std::array<std::pair<std::string_view, std::string_view>, 9> kAliases = {{
      {"image/jpg", "image/jpeg"},
      {"image/pjpeg", "image/jpeg"},
      {"image/x-png", "image/png"},
      {"image/heif", "image/heic"},
      {"audio/mp3", "audio/mpeg"},
      {"audio/x-wav", "audio/wav"},
      {"audio/wave", "audio/wav"},
      {"application/x-zip-compressed", "application/zip"},
      {"application/x-gzip", "application/gzip"},
  }};
  for (const auto& [alias, canonical] : kAliases) {
    if (mime == alias) return canonical;
  }
  return mime;
}

} // namespace

std::optional<std::string> SniffMimeType(std::string_view content) {
  if (auto iso = SniffIsoMedia(content)) return iso;
  if (auto riff = SniffRiff(content)) return riff;
  if (auto mkv = SniffMatroska(content)) return mkv;

  for (const auto& magic : kMagic) {
    if (HasAt(content, magic.offset, magic.bytes)) return std::string(magic.mime);
  }
  return std::nullopt;
}

bool MimeCompatible(std::string_view declared, std::string_view sniffed) {
  const auto lowered = util::ToLower(declared);
  const auto lhs     = Canonical(lowered);
  const auto rhs     = Canonical(sniffed);
  if (lhs == rhs) return true;
  // QuickTime containers are routinely declared as mp4 and vice versa.
  if ((lhs == "video/mp4" && rhs == "video/quicktime") || (lhs == "video/quicktime" && rhs == "video/mp4")) return true;
  return lhs.find(rhs) != std::string_view::npos;
}

std::optional<std::string> FindSuspiciousPattern(std::string_view content) {
  static const std::array<std::pair<std::regex, const char*>, 4> kPatterns = {{
      {std::regex("<script", std::regex::icase), "<script"},
      {std::regex("javascript:", std::regex::icase), "javascript:"},
      {std::regex("vbscript:", std::regex::icase), "vbscript:"},
      // Inline event handler inside a tag, e.g. <img onerror=...>
      {std::regex("<[a-z][^<>]*\\son[a-z]+\\s*=", std::regex::icase), "inline event handler"},
  }};

  const auto head = content.substr(0, kScriptScanBytes);
  for (const auto& [pattern, name] : kPatterns) {
    if (std::regex_search(head.begin(), head.end(), pattern)) return std::string(name);
  }
  return std::nullopt;
}

} // namespace ingest::core
