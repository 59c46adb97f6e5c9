#pragma once

#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "compute_task.hpp"

namespace routebroker::jobs {

enum class TaskState {
  kPending,
  kRunning,
  kSuccess,
  kFailure,
  kRevoked,
};

const char* TaskStateName(TaskState state);

inline bool IsTerminal(TaskState state) {
  return state == TaskState::kSuccess || state == TaskState::kFailure || state == TaskState::kRevoked;
}

/*
  Live status of an asynchronous task.
*/
class StatusProvider {
 public:
  virtual ~StatusProvider() = default;

  // Unknown ids report kPending.
  virtual TaskState Query(const std::string& task_id) const = 0;
};

/*
  In-process task state table.

  Transitions:
      PENDING -> RUNNING -> SUCCESS | FAILURE
      PENDING -> REVOKED

  Only ids handed to Register are tracked. A finished task keeps its state
  and error text, never its geometry; once more than max_finished tasks
  have finished, the oldest finished entries are dropped and read as
  unknown again. Callers that hold the persisted route fall back to it
  (see JobLifecycleTracker).
*/
class TaskRegistry final : public StatusProvider {
 public:
  static constexpr std::size_t kDefaultMaxFinished = 10000;

  // Zero selects kDefaultMaxFinished.
  explicit TaskRegistry(std::size_t max_finished = kDefaultMaxFinished);

  // Adds a PENDING task. Registering a known id keeps its current state.
  // The returned future becomes ready with the terminal state.
  std::shared_future<TaskState> Register(const std::string& task_id);

  // PENDING -> RUNNING. False when the task is unknown or was revoked.
  bool TryStart(const std::string& task_id);

  // RUNNING -> SUCCESS / FAILURE according to the outcome.
  void Complete(const std::string& task_id, const ComputationOutcome& outcome);

  // PENDING -> FAILURE without running, e.g. when the task never reached
  // the queue.
  void Fail(const std::string& task_id, const std::string& error);

  // Marks a pending task REVOKED. Unknown, running and finished tasks are
  // left untouched. Returns true when the task is (now) revoked.
  bool Revoke(const std::string& task_id);

  TaskState Query(const std::string& task_id) const override;

  // nullopt for ids this process does not (or no longer) track.
  std::optional<TaskState> Find(const std::string& task_id) const;

  std::optional<std::shared_future<TaskState>> Completion(const std::string& task_id) const;

  // Error text of a FAILURE task.
  std::optional<std::string> Error(const std::string& task_id) const;

  std::size_t Size() const;

 private:
  struct Entry {
    TaskState                     state = TaskState::kPending;
    std::promise<TaskState>       promise;
    std::shared_future<TaskState> done;
    std::string                   error;
  };

  void FinishLocked(const std::string& task_id, Entry& entry, TaskState state, std::string error);

  const std::size_t max_finished_;

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> tasks_;
  std::deque<std::string>                finished_;  // oldest first
};

} // namespace routebroker::jobs
