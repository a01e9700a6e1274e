#include "session_sweeper.hpp"

#include "internal/observability/logging.hpp"

namespace ingest::upload {

SessionSweeper::SessionSweeper(std::shared_ptr<ResumableUploadManager> manager, std::chrono::milliseconds interval)
    : manager_(std::move(manager)), interval_(interval) {
}

SessionSweeper::~SessionSweeper() {
  Stop();
}

void SessionSweeper::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_   = std::thread(&SessionSweeper::Run, this);
}

void SessionSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void SessionSweeper::Run() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    if (cv_.wait_for(lock, interval_, [&] { return stopping_; })) break;

    lock.unlock();
    try {
      manager_->SweepExpired(util::Now());
    } catch (const std::exception& e) {
      INGEST_LOG_ERROR("session sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace ingest::upload
