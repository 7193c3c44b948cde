// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "task_state_tracker.hpp"

#include <random>

#define IMGDROP_LOG_COMPONENT "task_tracker"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

TaskStateTracker::TaskStateTracker(const TaskTrackerConfig& config)
    : config_(config) {}

TaskStateTracker::~TaskStateTracker() {
  stopSweeper();
}

std::string TaskStateTracker::generateTaskId() {
  static constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 35);

  std::string suffix(7, '0');
  for (auto& c : suffix) {
    c = kBase36[dist(rng)];
  }

  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch()
  )
                        .count();
  return "upload_" + std::to_string(now_ms) + "_" + suffix;
}

std::string TaskStateTracker::createTask(
  const std::string& source_ref, const CreateTaskParams& params
) {
  UploadTask task;
  task.state = UploadState::PENDING;
  task.target_folder = params.folder;
  task.start_time = std::chrono::system_clock::now();
  task.updated_at = std::chrono::steady_clock::now();
  task.origin.source_ref = source_ref;
  task.origin.surface = params.surface;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    do {
      task.id = generateTaskId();
    } while (tasks_.count(task.id) > 0);
    tasks_.emplace(task.id, task);
  }

  IMGDROP_LOG_DEBUG("Task created" << kv("task_id", task.id) << kv("source", source_ref));
  return task.id;
}

bool TaskStateTracker::updateState(
  const std::string& task_id, UploadState state, const std::string& message
) {
  std::string applied_message;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
      return false;
    }

    UploadTask& task = it->second;
    if (isTerminalState(task.state)) {
      IMGDROP_LOG_DEBUG(
        "Ignoring transition of finished task" << kv("task_id", task_id)
                                               << kv("state", uploadStateToString(task.state))
                                               << kv("requested", uploadStateToString(state))
      );
      return false;
    }
    if (state == UploadState::PENDING || state == UploadState::IDLE) {
      return false;
    }

    task.state = state;
    task.updated_at = std::chrono::steady_clock::now();
    if (!message.empty()) {
      task.error_message = message;
    }
    if (isTerminalState(state)) {
      task.finished_at = task.updated_at;
    }
    applied_message = task.error_message.value_or("");
  }

  IMGDROP_LOG_DEBUG(
    "Task transition" << kv("task_id", task_id) << kv("state", uploadStateToString(state))
                      << kv("message", applied_message)
  );
  notifyObservers(task_id, state, applied_message);
  return true;
}

std::optional<UploadState> TaskStateTracker::getState(const std::string& task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second.state;
}

std::optional<UploadTask> TaskStateTracker::getTask(const std::string& task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool TaskStateTracker::setFolder(
  const std::string& task_id, const std::optional<std::string>& folder
) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return false;
  }
  it->second.target_folder = folder;
  return true;
}

bool TaskStateTracker::shouldRetry(const std::string& task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end() || isTerminalState(it->second.state)) {
    return false;
  }
  return it->second.retry_count < config_.max_retry_count;
}

std::optional<int> TaskStateTracker::incrementRetryCount(
  const std::string& task_id, const std::string& failure_reason
) {
  int count = 0;
  bool exhausted = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
      return std::nullopt;
    }
    UploadTask& task = it->second;
    if (task.retry_count < config_.max_retry_count) {
      ++task.retry_count;
    }
    count = task.retry_count;
    exhausted = count >= config_.max_retry_count;
  }

  if (exhausted) {
    updateState(
      task_id, UploadState::ERROR,
      failure_reason.empty()
        ? "Maximum retry count (" + std::to_string(config_.max_retry_count) + ") reached"
        : failure_reason
    );
  }
  return count;
}

std::optional<RetryState> TaskStateTracker::getRetryState(const std::string& task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  RetryState state;
  state.retry_count = it->second.retry_count;
  state.max_retry_count = config_.max_retry_count;
  state.can_retry =
    !isTerminalState(it->second.state) && it->second.retry_count < config_.max_retry_count;
  return state;
}

bool TaskStateTracker::cleanupTask(const std::string& task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.erase(task_id) > 0;
}

bool TaskStateTracker::markSurfaceLost(const std::string& task_id) {
  const bool repaired = updateState(task_id, UploadState::ERROR, "Observing surface was closed");
  if (repaired) {
    IMGDROP_LOG_INFO("Task observer disappeared, marked as error" << kv("task_id", task_id));
  }
  return repaired;
}

size_t TaskStateTracker::sweep(std::chrono::steady_clock::time_point now) {
  size_t removed = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = tasks_.begin(); it != tasks_.end();) {
      const auto& finished_at = it->second.finished_at;
      if (finished_at && now - *finished_at >= config_.retention) {
        it = tasks_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  if (removed > 0) {
    IMGDROP_LOG_DEBUG("Swept finished tasks" << kv("removed", removed));
  }
  return removed;
}

void TaskStateTracker::startSweeper() {
  if (sweeper_running_.exchange(true)) {
    return;
  }
  sweeper_thread_ = std::thread(&TaskStateTracker::sweeperLoop, this);
}

void TaskStateTracker::stopSweeper() {
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    if (!sweeper_running_.exchange(false)) {
      return;
    }
  }
  sweeper_cv_.notify_all();
  if (sweeper_thread_.joinable()) {
    sweeper_thread_.join();
  }
}

void TaskStateTracker::sweeperLoop() {
  while (sweeper_running_) {
    {
      std::unique_lock<std::mutex> lock(sweeper_mutex_);
      sweeper_cv_.wait_for(lock, config_.sweep_interval, [this] {
        return !sweeper_running_;
      });
    }
    if (!sweeper_running_) {
      break;
    }
    sweep();
  }
}

bool TaskStateTracker::canProcessRequest(std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (last_request_time_ && now - *last_request_time_ < config_.request_cooldown) {
    return false;
  }
  last_request_time_ = now;
  return true;
}

void TaskStateTracker::addObserver(TransitionObserver observer) {
  std::lock_guard<std::mutex> lock(observers_mutex_);
  observers_.push_back(std::move(observer));
}

size_t TaskStateTracker::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void TaskStateTracker::notifyObservers(
  const std::string& task_id, UploadState state, const std::string& message
) {
  std::vector<TransitionObserver> observers;
  {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers = observers_;
  }
  for (const auto& observer : observers) {
    observer(task_id, state, message);
  }
}

}  // namespace uploader
}  // namespace imgdrop
