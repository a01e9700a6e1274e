#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/security/virus_scanner.hpp"
#include "internal/storage/storage_provider.hpp"
#include "internal/util/errors.hpp"

namespace ingest::testing {

/*
  In-memory provider used by the unit tests.

  Objects are kept by id. fail_uploads makes the next N uploads throw
  ProviderFailure; transform=false makes Process hand back the original.
  on_size_check runs inside CheckUploadable, before the upload claims the file.
*/
class FakeProvider final : public storage::StorageProvider {
 public:
  FakeProvider(model::ProviderKind kind, std::vector<model::TypeCategory> types, uint64_t max_size = 1ULL << 30)
      : kind_(kind), types_(std::move(types)), max_size_(max_size) {
  }

  storage::UploadResult Upload(const storage::UploadRequest& request) override {
    std::lock_guard lock(mutex);
    ++upload_calls;
    if (fail_uploads > 0) {
      --fail_uploads;
      throw util::ProviderFailure("injected upload failure");
    }
    const auto folder = request.folder.value_or("uploads");
    const auto id     = Prefix() + folder + "/" + request.filename;
    objects[id]       = request.data->ToString();
    last_upload       = request;

    storage::UploadResult result;
    result.object_id  = id;
    result.url        = "https://fake.test/" + id;
    result.size_bytes = static_cast<uint64_t>(request.data->size());
    result.metadata   = {{"stored_by", Prefix()}};
    return result;
  }

  storage::ProcessResult Process(const std::string& url, const model::Transform& transform) override {
    storage::ProcessResult result;
    if (!transform_) {
      result.url          = url;
      result.processed_by = std::string(storage::kNotProcessed);
      return result;
    }
    result.url          = url + "?w=" + std::to_string(transform.width.value_or(0));
    result.width        = transform.width;
    result.height       = transform.height;
    result.format       = transform.format.value_or("jpg");
    result.processed_by = "fake";
    return result;
  }

  bool Delete(const std::string& object_id_or_url, bool force) override {
    std::lock_guard lock(mutex);
    deleted.push_back(object_id_or_url);
    if (fail_deletes > 0) {
      --fail_deletes;
      if (force) return true;
      throw util::ProviderFailure("injected delete failure");
    }
    return objects.erase(object_id_or_url) > 0;
  }

  storage::ObjectInfo GetInfo(const std::string& object_id) override {
    std::lock_guard lock(mutex);
    auto            it = objects.find(object_id);
    if (it == objects.end()) throw util::NotFound("no object " + object_id);
    storage::ObjectInfo info;
    info.object_id  = object_id;
    info.size_bytes = it->second.size();
    return info;
  }

  std::string GenerateSignedUrl(const std::string& object_id, std::chrono::seconds ttl) override {
    return "https://fake.test/" + object_id + "?ttl=" + std::to_string(ttl.count());
  }

  const std::vector<model::TypeCategory>& SupportedTypes() const override {
    return types_;
  }
  uint64_t MaxFileSize() const override {
    if (on_size_check) on_size_check();
    return max_size_;
  }
  model::ProviderKind Kind() const override {
    return kind_;
  }

  void SetTransforms(bool enabled) {
    transform_ = enabled;
  }

  std::mutex                         mutex;
  std::map<std::string, std::string> objects;
  std::vector<std::string>           deleted;
  storage::UploadRequest             last_upload;
  int                                upload_calls = 0;
  int                                fail_uploads = 0;
  int                                fail_deletes = 0;
  std::function<void()>              on_size_check;

 private:
  std::string Prefix() const {
    return kind_ == model::ProviderKind::kTransform ? "media/" : "store/";
  }

  model::ProviderKind               kind_;
  std::vector<model::TypeCategory>  types_;
  uint64_t                          max_size_;
  bool                              transform_ = true;
};

inline std::shared_ptr<FakeProvider> MakeFakeMedia() {
  auto provider = std::make_shared<FakeProvider>(model::ProviderKind::kTransform,
                                                 std::vector<model::TypeCategory>{model::TypeCategory::kImage, model::TypeCategory::kVideo});
  return provider;
}

inline std::shared_ptr<FakeProvider> MakeFakeObjectStore() {
  auto provider = std::make_shared<FakeProvider>(
      model::ProviderKind::kObjectStore,
      std::vector<model::TypeCategory>{model::TypeCategory::kImage, model::TypeCategory::kVideo, model::TypeCategory::kAudio,
                                       model::TypeCategory::kDocument, model::TypeCategory::kArchive, model::TypeCategory::kOther});
  provider->SetTransforms(false);
  return provider;
}

class FakeScanner final : public security::VirusScanner {
 public:
  security::ScanResult Scan(std::string_view data, const std::string&) override {
    if (unavailable) throw std::runtime_error("clamd: connection refused");
    security::ScanResult result;
    if (data.find("EICAR") != std::string_view::npos) {
      result.infected = true;
      result.viruses.push_back("Eicar-Test-Signature");
    }
    return result;
  }

  bool unavailable = false;
};

} // namespace ingest::testing
