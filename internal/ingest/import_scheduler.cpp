#include "import_scheduler.hpp"

#include "internal/ingest/mesh_ingestor.hpp"
#include "internal/observability/logging.hpp"

namespace routebroker::ingest {

using namespace routebroker::observability;

MeshImportScheduler::MeshImportScheduler(std::shared_ptr<MeshIngestor> ingestor, std::chrono::seconds interval, bool run_on_startup)
    : ingestor_(std::move(ingestor)), interval_(interval), run_on_startup_(run_on_startup) {
}

MeshImportScheduler::~MeshImportScheduler() {
  Stop();
}

void MeshImportScheduler::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;

  stopping_ = false;
  thread_   = std::thread(&MeshImportScheduler::Run, this);
}

void MeshImportScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool MeshImportScheduler::RunOnce() {
  bool ok = true;
  try {
    auto added = ingestor_->ImportNewMeshes();
    ROUTEBROKER_LOG_INFO("mesh import finished", {IntField("added", static_cast<std::int64_t>(added.size()))});
  } catch (const std::exception& e) {
    ok = false;
    ROUTEBROKER_LOG_ERROR("mesh import failed", {StringField("mesh_dir", ingestor_->mesh_dir()), StringField("error", e.what())});
  }

  std::lock_guard lock(mutex_);
  ++runs_;
  if (!ok) ++failures_;
  return ok;
}

void MeshImportScheduler::Run() {
  if (run_on_startup_) {
    RunOnce();
  }

  std::unique_lock lock(mutex_);
  while (!stopping_) {
    if (cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
      break;
    }

    lock.unlock();
    RunOnce();
    lock.lock();
  }
}

std::uint64_t MeshImportScheduler::runs() const {
  std::lock_guard lock(mutex_);
  return runs_;
}

std::uint64_t MeshImportScheduler::failures() const {
  std::lock_guard lock(mutex_);
  return failures_;
}

} // namespace routebroker::ingest
