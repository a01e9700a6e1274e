#include "session_locks.hpp"

namespace ingest::upload {

SessionLocks::Guard::Guard(SessionLocks& owner, std::string session_id, Entry& entry)
    : owner_(owner), session_id_(std::move(session_id)), entry_(entry) {
}

SessionLocks::Guard::~Guard() {
  entry_.mutex.unlock();
  owner_.Release(session_id_, entry_);
}

SessionLocks::Guard SessionLocks::Lock(const std::string& session_id) {
  Entry* entry = nullptr;
  {
    std::lock_guard lock(mutex_);
    auto&           slot = locks_[session_id];
    if (!slot) slot = std::make_unique<Entry>();
    ++slot->users;
    entry = slot.get();
  }
  // users > 0 keeps the entry alive while we wait.
  entry->mutex.lock();
  return Guard(*this, session_id, *entry);
}

void SessionLocks::Release(const std::string& session_id, Entry& entry) {
  std::lock_guard lock(mutex_);
  if (--entry.users == 0) locks_.erase(session_id);
}

std::size_t SessionLocks::Size() {
  std::lock_guard lock(mutex_);
  return locks_.size();
}

} // namespace ingest::upload
