#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ingest::upload {

/*
  Per-session mutex registry.

  Callers hold the returned Guard for the whole chunk write, so writes
  to one session are serialized while other sessions proceed.

  Entries are reference counted and dropped when the last holder or
  waiter lets go, so ids that never name a live session (unknown,
  foreign, already released) leave nothing behind.
*/
class SessionLocks {
  struct Entry {
    std::mutex  mutex;
    std::size_t users = 0;
  };

 public:
  class Guard {
   public:
    ~Guard();

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

   private:
    friend class SessionLocks;

    Guard(SessionLocks& owner, std::string session_id, Entry& entry);

    SessionLocks& owner_;
    std::string   session_id_;
    Entry&        entry_;
  };

  // Blocks until the session's mutex is held.
  Guard Lock(const std::string& session_id);

  // Sessions with a holder or waiter right now.
  std::size_t Size();

 private:
  void Release(const std::string& session_id, Entry& entry);

  std::mutex                                              mutex_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> locks_;
};

} // namespace ingest::upload
