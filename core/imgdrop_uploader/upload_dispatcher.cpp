// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_dispatcher.hpp"

#include <exception>
#include <stdexcept>

#define IMGDROP_LOG_COMPONENT "upload_dispatcher"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

UploadDispatcher::UploadDispatcher(
  ImageUploader& uploader, TaskStateTracker& tracker, const DispatcherConfig& config
)
    : uploader_(uploader)
    , tracker_(tracker)
    , config_(config)
    , queue_(std::make_unique<UploadQueue>()) {
  if (config_.num_workers < 1) {
    throw std::invalid_argument("UploadDispatcher requires at least one worker");
  }
}

UploadDispatcher::~UploadDispatcher() {
  stop();
}

void UploadDispatcher::start() {
  if (stopped_ || running_.exchange(true)) {
    return;
  }

  workers_.reserve(config_.num_workers);
  for (int i = 0; i < config_.num_workers; ++i) {
    workers_.emplace_back(&UploadDispatcher::workerLoop, this, i);
  }
  IMGDROP_LOG_INFO("Upload dispatcher started" << kv("workers", config_.num_workers));
}

void UploadDispatcher::stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  running_ = false;

  stop_token_.cancel();
  queue_->shutdown();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  // Anything left in the queue will never run
  for (auto& item : queue_->drain()) {
    stats_.tasks_pending--;
    finish(item.task_id, uploader_.failTask(item.task_id, "Upload cancelled"));
  }
  IMGDROP_LOG_INFO("Upload dispatcher stopped");
}

bool UploadDispatcher::isRunning() const {
  return running_.load();
}

std::string UploadDispatcher::submit(
  const std::string& source_ref, const CreateTaskParams& params, ProgressSink progress
) {
  if (stopped_) {
    IMGDROP_LOG_ERROR("Cannot submit upload - dispatcher is stopped");
    return "";
  }

  const std::string task_id = tracker_.createTask(source_ref, params);

  UploadItem item(task_id, source_ref);
  item.folder = params.folder;
  item.progress = std::move(progress);

  {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    ++outstanding_;
  }
  // Count before enqueue; a worker may pick the item up immediately
  stats_.tasks_submitted++;
  stats_.tasks_pending++;
  if (!queue_->enqueue(std::move(item))) {
    stats_.tasks_pending--;
    IMGDROP_LOG_ERROR("Failed to enqueue upload" << kv("task_id", task_id));
    finish(task_id, uploader_.failTask(task_id, "Upload queue rejected the task"));
    return task_id;
  }

  IMGDROP_LOG_DEBUG("Upload queued" << kv("task_id", task_id) << kv("source", source_ref));
  return task_id;
}

bool UploadDispatcher::waitForIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(idle_mutex_);
  if (timeout == std::chrono::milliseconds::max()) {
    idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
    return true;
  }
  return idle_cv_.wait_for(lock, timeout, [this] { return outstanding_ == 0; });
}

DispatcherStatsSnapshot UploadDispatcher::getStats() const {
  DispatcherStatsSnapshot snapshot;
  snapshot.tasks_submitted = stats_.tasks_submitted.load();
  snapshot.tasks_pending = stats_.tasks_pending.load();
  snapshot.tasks_uploading = stats_.tasks_uploading.load();
  snapshot.tasks_completed = stats_.tasks_completed.load();
  snapshot.tasks_failed = stats_.tasks_failed.load();
  snapshot.tasks_requeued = stats_.tasks_requeued.load();
  return snapshot;
}

void UploadDispatcher::setCallback(CompletionCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  callback_ = std::move(callback);
}

void UploadDispatcher::workerLoop(int worker_id) {
  IMGDROP_LOG_DEBUG("Worker started" << kv("worker", worker_id));

  while (running_) {
    auto item = queue_->dequeue_with_timeout(std::chrono::milliseconds(1000));
    if (!item) {
      continue;  // Timeout or shutdown
    }

    stats_.tasks_pending--;
    stats_.tasks_uploading++;

    processItem(std::move(*item));

    stats_.tasks_uploading--;
  }
}

void UploadDispatcher::processItem(UploadItem item) {
  ImageUploadOutcome outcome;
  UploadOptions options;
  options.allow_task_retry = true;
  options.token = stop_token_;

  try {
    outcome = uploader_.uploadImage(item.source_ref, item.task_id, item.folder, item.progress, options);
  } catch (const std::exception& e) {
    IMGDROP_LOG_ERROR("Upload threw" << kv("task_id", item.task_id) << kv("error", e.what()));
    finish(item.task_id, uploader_.failTask(item.task_id, std::string("Internal error: ") + e.what()));
    return;
  }

  if (!outcome.will_retry) {
    finish(item.task_id, outcome);
    return;
  }

  auto retry_count = tracker_.incrementRetryCount(item.task_id, outcome.error);
  auto state = tracker_.getState(item.task_id);
  if (!retry_count || !state || isTerminalState(*state) || !running_) {
    finish(item.task_id, uploader_.failTask(item.task_id, outcome.error));
    return;
  }

  item.retry_count = *retry_count;
  item.next_retry_at = std::chrono::steady_clock::now() + config_.retry_interval;
  IMGDROP_LOG_INFO(
    "Requeueing task" << kv("task_id", item.task_id) << kv("retry", item.retry_count)
                      << kv("delay_ms", config_.retry_interval.count())
  );

  const std::string task_id = item.task_id;
  stats_.tasks_pending++;
  if (!queue_->requeue_for_retry(std::move(item))) {
    stats_.tasks_pending--;
    finish(task_id, uploader_.failTask(task_id, outcome.error));
    return;
  }
  stats_.tasks_requeued++;
}

void UploadDispatcher::finish(const std::string& task_id, const ImageUploadOutcome& outcome) {
  if (outcome.success) {
    stats_.tasks_completed++;
  } else {
    stats_.tasks_failed++;
  }

  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (callback_) {
      callback_(task_id, outcome);
    }
  }

  {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    if (outstanding_ > 0) {
      --outstanding_;
    }
  }
  idle_cv_.notify_all();
}

}  // namespace uploader
}  // namespace imgdrop
