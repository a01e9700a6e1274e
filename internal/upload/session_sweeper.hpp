#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/runtime/background_worker.hpp"
#include "internal/upload/resumable_upload_manager.hpp"

namespace ingest::upload {

/*
  Background thread that expires abandoned upload sessions.

  Runs SweepExpired once per interval until stopped. A failed sweep is
  logged and retried on the next tick.
*/
class SessionSweeper final : public runtime::BackgroundWorker {
 public:
  SessionSweeper(std::shared_ptr<ResumableUploadManager> manager, std::chrono::milliseconds interval);
  ~SessionSweeper() override;

  void Start() override;
  void Stop() override;

 private:
  void Run();

  std::shared_ptr<ResumableUploadManager> manager_;
  std::chrono::milliseconds               interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

} // namespace ingest::upload
