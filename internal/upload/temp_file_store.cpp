#include "temp_file_store.hpp"

#include <arrow/io/file.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/filename.hpp"
#include "internal/util/time.hpp"

namespace ingest::upload {

using storage::common::Unwrap;

namespace {

std::string SafeName(std::string_view filename) {
  std::string out(filename);
  for (auto& c : out) {
    const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '-';
    if (!keep) c = '_';
  }
  return out;
}

} // namespace

TempFileStore::TempFileStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::string TempFileStore::NewPath(std::string_view filename) const {
  auto name = "upload_" + std::to_string(util::NowMillis()) + "_" + util::RandomSuffix() + "_" + SafeName(filename);
  return (root_ / name).string();
}

/*
  MemoryMappedFile::Create truncates the file to its final size, which
  leaves it sparse on filesystems that support holes.
*/
void TempFileStore::Allocate(const std::string& path, uint64_t size) {
  auto file = Unwrap(arrow::io::MemoryMappedFile::Create(path, static_cast<int64_t>(size)));
  Unwrap(file->Close());
}

void TempFileStore::WriteAt(const std::string& path, uint64_t offset, std::string_view bytes) {
  auto file = Unwrap(arrow::io::MemoryMappedFile::Open(path, arrow::io::FileMode::READWRITE));
  Unwrap(file->WriteAt(static_cast<int64_t>(offset), bytes.data(), static_cast<int64_t>(bytes.size())));
  Unwrap(file->Close());
}

std::shared_ptr<arrow::Buffer> TempFileStore::ReadAll(const std::string& path) {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(path));
  auto buffer = storage::common::ReadAll(file);
  Unwrap(file->Close());
  return buffer;
}

bool TempFileStore::Remove(const std::string& path) {
  return std::filesystem::remove(path);
}

} // namespace ingest::upload
