#include "task_registry.hpp"

namespace routebroker::jobs {

const char* TaskStateName(TaskState state) {
  switch (state) {
    case TaskState::kPending:
      return "PENDING";
    case TaskState::kRunning:
      return "RUNNING";
    case TaskState::kSuccess:
      return "SUCCESS";
    case TaskState::kFailure:
      return "FAILURE";
    case TaskState::kRevoked:
      return "REVOKED";
  }
  return "PENDING";
}

TaskRegistry::TaskRegistry(std::size_t max_finished) : max_finished_(max_finished == 0 ? kDefaultMaxFinished : max_finished) {
}

std::shared_future<TaskState> TaskRegistry::Register(const std::string& task_id) {
  std::lock_guard lock(mutex_);
  auto [it, inserted] = tasks_.try_emplace(task_id);
  if (inserted) {
    it->second.done = it->second.promise.get_future().share();
  }
  return it->second.done;
}

bool TaskRegistry::TryStart(const std::string& task_id) {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end() || it->second.state != TaskState::kPending) {
    return false;
  }
  it->second.state = TaskState::kRunning;
  return true;
}

void TaskRegistry::FinishLocked(const std::string& task_id, Entry& entry, TaskState state, std::string error) {
  entry.state = state;
  entry.error = std::move(error);
  entry.promise.set_value(state);

  finished_.push_back(task_id);
  while (finished_.size() > max_finished_) {
    tasks_.erase(finished_.front());
    finished_.pop_front();
  }
}

void TaskRegistry::Complete(const std::string& task_id, const ComputationOutcome& outcome) {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end() || IsTerminal(it->second.state)) {
    return;
  }
  FinishLocked(task_id, it->second, outcome.ok ? TaskState::kSuccess : TaskState::kFailure, outcome.error);
}

void TaskRegistry::Fail(const std::string& task_id, const std::string& error) {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end() || it->second.state != TaskState::kPending) {
    return;
  }
  FinishLocked(task_id, it->second, TaskState::kFailure, error);
}

bool TaskRegistry::Revoke(const std::string& task_id) {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return false;
  }
  if (it->second.state == TaskState::kRevoked) {
    return true;
  }
  if (it->second.state != TaskState::kPending) {
    return false;
  }

  FinishLocked(task_id, it->second, TaskState::kRevoked, "revoked");
  return true;
}

TaskState TaskRegistry::Query(const std::string& task_id) const {
  return Find(task_id).value_or(TaskState::kPending);
}

std::optional<TaskState> TaskRegistry::Find(const std::string& task_id) const {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second.state;
}

std::optional<std::shared_future<TaskState>> TaskRegistry::Completion(const std::string& task_id) const {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second.done;
}

std::optional<std::string> TaskRegistry::Error(const std::string& task_id) const {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end() || it->second.state != TaskState::kFailure) {
    return std::nullopt;
  }
  return it->second.error;
}

std::size_t TaskRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return tasks_.size();
}

} // namespace routebroker::jobs
