#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/names.hpp"
#include "memory_tx.hpp"

namespace ingest::db::memory {

namespace {

std::string VariantKey(const std::string& file_id, ingest::model::VariantKind kind) {
  return file_id + "#" + std::string(ingest::model::ToString(kind));
}

bool Matches(const model::FileRecord& r, const FileFilter& filter) {
  if (r.owner_id != filter.owner_id) return false;
  if (!filter.include_deleted && r.status == ingest::model::FileStatus::kDeleted) return false;
  if (filter.status && r.status != *filter.status) return false;
  if (filter.type_category && r.type_category != *filter.type_category) return false;
  if (filter.category && r.category != *filter.category) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.sessions[r.id] = r;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sessions.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.sessions[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSession(Transaction& t, const std::string& id) {
  TX(t).Mutable().sessions.erase(id);
  return Result::Ok();
}

std::vector<model::SessionRecord> MemoryRepository::ListExpiredSessions(Transaction& t, uint64_t now_ms) {
  std::vector<model::SessionRecord> out;
  for (const auto& [_, r] : TX(t).View().sessions) {
    if (r.status == ingest::model::SessionStatus::kActive && r.expires_at_ms < now_ms) out.push_back(r);
  }
  return out;
}

std::vector<model::SessionRecord> MemoryRepository::ListStaleSessions(Transaction& t, uint64_t cutoff_ms) {
  std::vector<model::SessionRecord> out;
  for (const auto& [_, r] : TX(t).View().sessions) {
    if (r.status != ingest::model::SessionStatus::kActive && r.expires_at_ms < cutoff_ms) out.push_back(r);
  }
  return out;
}

// ------------------------------------------------------------------
// Files
// ------------------------------------------------------------------

Result MemoryRepository::InsertFile(Transaction& t, const model::FileRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.files.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.files[r.id] = r;
  return Result::Ok();
}

std::optional<model::FileRecord> MemoryRepository::GetFile(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.files.find(id);
  if (it == s.files.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateFile(Transaction& t, const model::FileRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.files.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.files[r.id] = r;
  return Result::Ok();
}

std::vector<model::FileRecord> MemoryRepository::FindFilesByHash(Transaction& t, const std::string& owner_id,
                                                                 const std::string& content_hash) {
  std::vector<model::FileRecord> out;
  for (const auto& [_, r] : TX(t).View().files) {
    if (r.owner_id == owner_id && r.content_hash == content_hash && r.status != ingest::model::FileStatus::kDeleted) {
      out.push_back(r);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

std::vector<model::FileRecord> MemoryRepository::ListFiles(Transaction& t, const FileFilter& filter, const Page& page) {
  std::vector<model::FileRecord> matched;
  for (const auto& [_, r] : TX(t).View().files) {
    if (Matches(r, filter)) matched.push_back(r);
  }
  std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id < b.id;
  });

  std::vector<model::FileRecord> out;
  for (std::size_t i = page.offset; i < matched.size() && out.size() < page.limit; ++i) {
    out.push_back(std::move(matched[i]));
  }
  return out;
}

// ------------------------------------------------------------------
// Variants
// ------------------------------------------------------------------

Result MemoryRepository::UpsertVariant(Transaction& t, const model::VariantRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.files.contains(r.file_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown file " + r.file_id);
  auto  key      = VariantKey(r.file_id, r.kind);
  auto  existing = s.variants.find(key);
  if (existing == s.variants.end()) {
    s.variants[key] = r;
    return Result::Ok();
  }
  auto updated          = r;
  updated.id            = existing->second.id;
  updated.created_at_ms = existing->second.created_at_ms;
  existing->second      = std::move(updated);
  return Result::Ok();
}

std::vector<model::VariantRecord> MemoryRepository::ListVariants(Transaction& t, const std::string& file_id) {
  std::vector<model::VariantRecord> out;
  for (const auto& [_, r] : TX(t).View().variants) {
    if (r.file_id == file_id) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.kind < b.kind; });
  return out;
}

Result MemoryRepository::DeleteVariants(Transaction& t, const std::string& file_id) {
  std::erase_if(TX(t).Mutable().variants, [&](const auto& entry) { return entry.second.file_id == file_id; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::UpsertJob(Transaction& t, const model::JobRecord& r) {
  TX(t).Mutable().jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t, const std::string& queue) {
  std::vector<model::JobRecord> out;
  for (const auto& [_, r] : TX(t).View().jobs) {
    if (r.queue == queue) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    return a.created_at_ms < b.created_at_ms;
  });
  return out;
}

Result MemoryRepository::DeleteJob(Transaction& t, const std::string& id) {
  TX(t).Mutable().jobs.erase(id);
  return Result::Ok();
}

} // namespace ingest::db::memory
