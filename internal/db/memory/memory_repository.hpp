#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ingest::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                              InsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;
  Result                              UpdateSession(Transaction&, const model::SessionRecord&) override;
  Result                              DeleteSession(Transaction&, const std::string&) override;
  std::vector<model::SessionRecord>   ListExpiredSessions(Transaction&, uint64_t now_ms) override;
  std::vector<model::SessionRecord>   ListStaleSessions(Transaction&, uint64_t cutoff_ms) override;

  Result                           InsertFile(Transaction&, const model::FileRecord&) override;
  std::optional<model::FileRecord> GetFile(Transaction&, const std::string&) override;
  Result                           UpdateFile(Transaction&, const model::FileRecord&) override;
  std::vector<model::FileRecord>   FindFilesByHash(Transaction&, const std::string& owner_id, const std::string& content_hash) override;
  std::vector<model::FileRecord>   ListFiles(Transaction&, const FileFilter& filter, const Page& page) override;

  Result                            UpsertVariant(Transaction&, const model::VariantRecord&) override;
  std::vector<model::VariantRecord> ListVariants(Transaction&, const std::string& file_id) override;
  Result                            DeleteVariants(Transaction&, const std::string& file_id) override;

  Result                          UpsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::vector<model::JobRecord>   ListJobs(Transaction&, const std::string& queue) override;
  Result                          DeleteJob(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::SessionRecord> sessions;
    std::unordered_map<std::string, model::FileRecord>    files;
    std::unordered_map<std::string, model::VariantRecord> variants;  // key: file_id#kind
    std::unordered_map<std::string, model::JobRecord>     jobs;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace ingest::db::memory
