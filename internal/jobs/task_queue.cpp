#include "task_queue.hpp"

#include <stdexcept>

namespace routebroker::jobs {

void TaskQueue::Enqueue(ComputeRouteTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) throw std::runtime_error("task queue is shut down");
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<ComputeRouteTask> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  ComputeRouteTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t TaskQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace routebroker::jobs
