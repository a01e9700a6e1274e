#include "filename.hpp"

#include <cctype>
#include <random>

#include "encoding.hpp"

namespace ingest::util {

namespace {

std::string_view BaseName(std::string_view filename) {
  const auto slash = filename.find_last_of("/\\");
  if (slash != std::string_view::npos) {
    filename.remove_prefix(slash + 1);
  }
  return filename;
}

} // namespace

std::string FileExtension(std::string_view filename) {
  auto       base = BaseName(filename);
  const auto dot  = base.find_last_of('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == base.size()) {
    return {};
  }
  return ToLower(base.substr(dot));
}

std::string SanitizeStem(std::string_view filename) {
  auto       base = BaseName(filename);
  const auto ext  = FileExtension(base);
  base.remove_suffix(ext.size());

  std::string out;
  out.reserve(base.size());
  for (char c : base) {
    const auto uc = static_cast<unsigned char>(c);
    out.push_back(std::isalnum(uc) || c == '_' || c == '-' ? c : '_');
  }
  if (out.empty()) {
    out = "file";
  }
  return out;
}

std::string RandomSuffix(std::size_t length) {
  static constexpr char               kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);
  std::string                                out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(kAlphabet[pick(rng)]);
  }
  return out;
}

std::string GenerateStoredFilename(std::string_view original_name, uint64_t now_ms) {
  return GenerateStoredFilename(original_name, now_ms, RandomSuffix());
}

std::string GenerateStoredFilename(std::string_view original_name, uint64_t now_ms, std::string_view suffix) {
  std::string name = SanitizeStem(original_name);
  name += '_';
  name += std::to_string(now_ms);
  name += '_';
  name += suffix;
  name += FileExtension(original_name);
  return name;
}

} // namespace ingest::util
