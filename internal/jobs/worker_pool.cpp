#include "worker_pool.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"

namespace routebroker::jobs {

WorkerPool::WorkerPool(std::shared_ptr<TaskQueue> queue, std::shared_ptr<TaskRegistry> registry, std::shared_ptr<TaskExecutor> executor,
                       std::size_t threads)
    : queue_(std::move(queue)), registry_(std::move(registry)), executor_(std::move(executor)), thread_count_(threads == 0 ? 1 : threads) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;

  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop() {
  queue_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Run() {
  for (;;) {
    auto task = queue_->Dequeue();
    if (!task) break;

    RunTask(*task);
  }
}

void WorkerPool::RunTask(const ComputeRouteTask& task) {
  if (!registry_->TryStart(task.task_id)) {
    ROUTEBROKER_LOG_INFO("skipping revoked task", {observability::JobId(task.task_id),
                                                   observability::RouteId(task.route_id)});
    return;
  }

  observability::SpanScope span("route.compute");
  span.SetAttribute("job_id", task.task_id);
  span.SetAttribute("route_id", static_cast<std::int64_t>(task.route_id));

  const auto started = std::chrono::steady_clock::now();

  ComputationOutcome outcome;
  try {
    outcome = executor_->Execute(task);
  } catch (const std::exception& e) {
    outcome = ComputationOutcome::Failure(e.what());
  }

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveComputation(TaskStateName(outcome.ok ? TaskState::kSuccess : TaskState::kFailure), elapsed_ms);

  if (outcome.ok) {
    ROUTEBROKER_LOG_INFO("route computed", {observability::JobId(task.task_id),
                                            observability::RouteId(task.route_id),
                                            observability::DoubleField("duration_ms", elapsed_ms)});
  } else {
    span.RecordError(outcome.error);
    ROUTEBROKER_LOG_ERROR("route computation failed", {observability::JobId(task.task_id),
                                                       observability::RouteId(task.route_id),
                                                       observability::StringField("error", outcome.error)});
  }

  registry_->Complete(task.task_id, outcome);
}

} // namespace routebroker::jobs
