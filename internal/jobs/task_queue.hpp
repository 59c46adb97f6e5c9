#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "compute_task.hpp"

namespace routebroker::jobs {

/*
  Thread-safe blocking queue feeding the worker pool.
*/
class TaskQueue {
 public:
  void Enqueue(ComputeRouteTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<ComputeRouteTask> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex           mutex_;
  std::condition_variable      cv_;
  std::queue<ComputeRouteTask> queue_;
  bool                         shutdown_ = false;
};

} // namespace routebroker::jobs
