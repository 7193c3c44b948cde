// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_UPLOAD_DISPATCHER_HPP
#define IMGDROP_UPLOAD_DISPATCHER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "http_transport.hpp"
#include "image_uploader.hpp"
#include "task_state_tracker.hpp"
#include "upload_queue.hpp"
#include "uploader_config.hpp"

namespace imgdrop {
namespace uploader {

/**
 * Counters, updated lock-free by the workers
 */
struct DispatcherStats {
  std::atomic<uint64_t> tasks_submitted{0};
  std::atomic<uint64_t> tasks_pending{0};
  std::atomic<uint64_t> tasks_uploading{0};
  std::atomic<uint64_t> tasks_completed{0};
  std::atomic<uint64_t> tasks_failed{0};
  std::atomic<uint64_t> tasks_requeued{0};
};

/**
 * Plain copy of DispatcherStats
 */
struct DispatcherStatsSnapshot {
  uint64_t tasks_submitted = 0;
  uint64_t tasks_pending = 0;
  uint64_t tasks_uploading = 0;
  uint64_t tasks_completed = 0;
  uint64_t tasks_failed = 0;
  uint64_t tasks_requeued = 0;
};

/**
 * Called once per task when it reaches a final outcome
 */
using CompletionCallback =
  std::function<void(const std::string& task_id, const ImageUploadOutcome& outcome)>;

/**
 * Worker pool running ImageUploader over an UploadQueue.
 *
 * A task whose source fetch failed transiently is put back on the queue
 * after retry_interval, counted through TaskStateTracker::incrementRetryCount.
 * Once the tracker refuses further retries the task is finalised as failed.
 */
class UploadDispatcher {
public:
  UploadDispatcher(
    ImageUploader& uploader, TaskStateTracker& tracker, const DispatcherConfig& config = {}
  );
  ~UploadDispatcher();

  UploadDispatcher(const UploadDispatcher&) = delete;
  UploadDispatcher& operator=(const UploadDispatcher&) = delete;

  void start();

  /**
   * Cancel in-flight transfers, join the workers and fail whatever is still queued.
   */
  void stop();

  bool isRunning() const;

  /**
   * Create a task for source_ref and queue it.
   *
   * @return Task id, or empty if the dispatcher has been stopped
   */
  std::string submit(
    const std::string& source_ref, const CreateTaskParams& params = {},
    ProgressSink progress = nullptr
  );

  /**
   * Block until every submitted task has a final outcome.
   *
   * @return false on timeout
   */
  bool waitForIdle(std::chrono::milliseconds timeout = std::chrono::milliseconds::max());

  DispatcherStatsSnapshot getStats() const;

  void setCallback(CompletionCallback callback);

  const DispatcherConfig& config() const {
    return config_;
  }

private:
  void workerLoop(int worker_id);
  void processItem(UploadItem item);
  void finish(const std::string& task_id, const ImageUploadOutcome& outcome);

  ImageUploader& uploader_;
  TaskStateTracker& tracker_;
  DispatcherConfig config_;

  std::unique_ptr<UploadQueue> queue_;
  CancellationToken stop_token_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
  std::vector<std::thread> workers_;

  DispatcherStats stats_;

  // Tasks submitted but not yet finalised
  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
  uint64_t outstanding_ = 0;

  std::mutex callback_mutex_;
  CompletionCallback callback_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_UPLOAD_DISPATCHER_HPP
