#pragma once

#include <memory>

namespace ingest::runtime {

/*
  Long-running component owned by the application.

  Start is called once after construction; Stop must be idempotent and
  join any threads the worker owns.
*/
class BackgroundWorker {
 public:
  virtual ~BackgroundWorker() = default;

  virtual void Start() = 0;
  virtual void Stop()  = 0;
};

using BackgroundWorkerPtr = std::shared_ptr<BackgroundWorker>;

} // namespace ingest::runtime
