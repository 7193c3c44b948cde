// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_TASK_STATE_TRACKER_HPP
#define IMGDROP_TASK_STATE_TRACKER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "upload_task.hpp"

namespace imgdrop {
namespace uploader {

struct TaskTrackerConfig {
  int max_retry_count = 3;
  std::chrono::milliseconds request_cooldown{300};  // Between user-initiated requests
  std::chrono::seconds sweep_interval{1800};
  std::chrono::seconds retention{1800};  // How long finished tasks stay queryable
};

/**
 * In-memory registry of upload tasks keyed by task id.
 *
 * The single owner of UploadTask records: other components read copies and
 * mutate through updateState()/setFolder()/incrementRetryCount() only.
 * Terminal states are sticky.
 *
 * Thread-safety: all methods are thread-safe. Observers are invoked after the
 * registry lock is released.
 */
class TaskStateTracker {
public:
  using TransitionObserver =
    std::function<void(const std::string& task_id, UploadState state, const std::string& message)>;

  explicit TaskStateTracker(const TaskTrackerConfig& config = {});
  ~TaskStateTracker();

  TaskStateTracker(const TaskStateTracker&) = delete;
  TaskStateTracker& operator=(const TaskStateTracker&) = delete;
  TaskStateTracker(TaskStateTracker&&) = delete;
  TaskStateTracker& operator=(TaskStateTracker&&) = delete;

  /**
   * Register a new task in PENDING.
   *
   * @return Generated task id ("upload_<epoch ms>_<7 base36 chars>")
   */
  std::string createTask(const std::string& source_ref, const CreateTaskParams& params = {});

  /**
   * Move a task to a new state.
   *
   * Unknown ids are ignored. Terminal tasks never change. PENDING and IDLE
   * cannot be re-entered. An empty message keeps the previous one.
   *
   * @return true if the transition was applied
   */
  bool updateState(const std::string& task_id, UploadState state, const std::string& message = "");

  std::optional<UploadState> getState(const std::string& task_id) const;
  std::optional<UploadTask> getTask(const std::string& task_id) const;

  bool setFolder(const std::string& task_id, const std::optional<std::string>& folder);

  /**
   * True while the task exists, is not terminal and retry_count < max_retry_count.
   */
  bool shouldRetry(const std::string& task_id) const;

  /**
   * Count one more task-level retry. Reaching max_retry_count moves the task to ERROR
   * with failure_reason as its message, or a generic limit message when it is empty.
   *
   * @return New retry count, or nullopt for an unknown id
   */
  std::optional<int> incrementRetryCount(
    const std::string& task_id, const std::string& failure_reason = ""
  );

  std::optional<RetryState> getRetryState(const std::string& task_id) const;

  bool cleanupTask(const std::string& task_id);

  /**
   * Error-repair path for a task whose observing surface went away.
   *
   * @return true if the task was still in progress and is now ERROR
   */
  bool markSurfaceLost(const std::string& task_id);

  /**
   * Drop terminal tasks that finished more than retention ago.
   *
   * @return Number of tasks removed
   */
  size_t sweep(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

  void startSweeper();
  void stopSweeper();

  /**
   * Debounce for user-initiated requests (double clicks, repeated menu picks).
   */
  bool canProcessRequest(
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()
  );

  void addObserver(TransitionObserver observer);

  size_t size() const;
  int maxRetryCount() const {
    return config_.max_retry_count;
  }

  static std::string generateTaskId();

private:
  void notifyObservers(const std::string& task_id, UploadState state, const std::string& message);
  void sweeperLoop();

  TaskTrackerConfig config_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, UploadTask> tasks_;
  std::optional<std::chrono::steady_clock::time_point> last_request_time_;

  std::mutex observers_mutex_;
  std::vector<TransitionObserver> observers_;

  std::atomic<bool> sweeper_running_{false};
  std::thread sweeper_thread_;
  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_cv_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_TASK_STATE_TRACKER_HPP
