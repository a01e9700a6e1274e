#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/query.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/file_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/db/model/variant_record.hpp"

namespace ingest::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Session chunk bookkeeping relies on this for atomic updates

  The DB is the source of truth for:
    upload sessions
    files and their variants
    persisted queue jobs
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Upload sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& id) = 0;

  virtual Result UpdateSession(Transaction&, const model::SessionRecord&) = 0;

  virtual Result DeleteSession(Transaction&, const std::string& id) = 0;

  // Active sessions with expires_at_ms < now_ms.
  virtual std::vector<model::SessionRecord> ListExpiredSessions(Transaction&, uint64_t now_ms) = 0;

  // Sessions in a terminal state whose expiry passed before cutoff_ms.
  virtual std::vector<model::SessionRecord> ListStaleSessions(Transaction&, uint64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Files
  // ---------------------------------------------------------------------

  virtual Result InsertFile(Transaction&, const model::FileRecord&) = 0;

  virtual std::optional<model::FileRecord> GetFile(Transaction&, const std::string& id) = 0;

  virtual Result UpdateFile(Transaction&, const model::FileRecord&) = 0;

  // Non-deleted rows with the given hash for one owner, oldest first.
  virtual std::vector<model::FileRecord> FindFilesByHash(Transaction&, const std::string& owner_id, const std::string& content_hash) = 0;

  // Newest first.
  virtual std::vector<model::FileRecord> ListFiles(Transaction&, const FileFilter& filter, const Page& page) = 0;

  // ---------------------------------------------------------------------
  // Variants
  // ---------------------------------------------------------------------

  // Replaces an existing (file_id, kind) row.
  virtual Result UpsertVariant(Transaction&, const model::VariantRecord&) = 0;

  virtual std::vector<model::VariantRecord> ListVariants(Transaction&, const std::string& file_id) = 0;

  virtual Result DeleteVariants(Transaction&, const std::string& file_id) = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result UpsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  // Ordered by priority, then created_at.
  virtual std::vector<model::JobRecord> ListJobs(Transaction&, const std::string& queue) = 0;

  virtual Result DeleteJob(Transaction&, const std::string& id) = 0;
};

} // namespace ingest::db
