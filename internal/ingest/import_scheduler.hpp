#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace routebroker::ingest {

class MeshIngestor;

/*
  Runs MeshIngestor::ImportNewMeshes on a fixed interval on its own thread.

  A failed run is logged and counted; the schedule keeps going.
*/
class MeshImportScheduler {
 public:
  MeshImportScheduler(std::shared_ptr<MeshIngestor> ingestor, std::chrono::seconds interval, bool run_on_startup);
  ~MeshImportScheduler();

  void Start();
  void Stop();

  // One ingestion pass on the calling thread. Returns false on failure.
  bool RunOnce();

  std::uint64_t runs() const;
  std::uint64_t failures() const;

 private:
  void Run();

  std::shared_ptr<MeshIngestor> ingestor_;
  std::chrono::seconds          interval_;
  bool                          run_on_startup_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;

  std::uint64_t runs_     = 0;
  std::uint64_t failures_ = 0;
};

} // namespace routebroker::ingest
