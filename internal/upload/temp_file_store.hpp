#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace ingest::upload {

/*
  Pre-sized temp files backing resumable uploads.

  A session file is created at its final size up front; chunks are
  positional writes into it, so they may arrive in any order.
*/
class TempFileStore {
 public:
  explicit TempFileStore(std::filesystem::path root);

  // upload_<epoch ms>_<random>_<safe filename>
  std::string NewPath(std::string_view filename) const;

  void Allocate(const std::string& path, uint64_t size);

  void WriteAt(const std::string& path, uint64_t offset, std::string_view bytes);

  std::shared_ptr<arrow::Buffer> ReadAll(const std::string& path);

  // false when the file was already gone
  bool Remove(const std::string& path);

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace ingest::upload
