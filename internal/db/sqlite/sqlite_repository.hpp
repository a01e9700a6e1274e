#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ingest::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace ingest::db::sqlite
