#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace ingest::runtime::config {
class ObjectStoreConfig;
}

namespace ingest::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

inline std::shared_ptr<arrow::Buffer> ToBuffer(std::string bytes) {
  return arrow::Buffer::FromString(std::move(bytes));
}

struct ResolvedFileSystem {
  std::shared_ptr<arrow::fs::FileSystem> fs;
  std::string                            root;   // "bucket/prefix" for S3, directory for local
  std::string                            bucket; // empty for local
  bool                                   is_s3 = false;
};

/*
  s3://bucket[/prefix] -> S3FileSystem with static credentials and SSE-C.
  Anything else        -> LocalFileSystem rooted at the given directory.

  Throws std::invalid_argument when an S3 store has no customer key.
*/
ResolvedFileSystem ResolveObjectStore(const ingest::runtime::config::ObjectStoreConfig& config, std::chrono::milliseconds timeout);

} // namespace ingest::storage::common
