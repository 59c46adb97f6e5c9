#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "task_queue.hpp"
#include "task_registry.hpp"

namespace routebroker::jobs {

/*
  Background threads draining the task queue.

  A task revoked before a worker picks it up is dropped. Every other task
  runs exactly once and its outcome is published in the registry.
*/
class WorkerPool {
 public:
  WorkerPool(std::shared_ptr<TaskQueue> queue, std::shared_ptr<TaskRegistry> registry, std::shared_ptr<TaskExecutor> executor,
             std::size_t threads);
  ~WorkerPool();

  void Start();
  void Stop();

 private:
  void Run();
  void RunTask(const ComputeRouteTask& task);

  std::shared_ptr<TaskQueue>    queue_;
  std::shared_ptr<TaskRegistry> registry_;
  std::shared_ptr<TaskExecutor> executor_;
  std::size_t                   thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace routebroker::jobs
