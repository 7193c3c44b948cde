// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_UPLOAD_QUEUE_HPP
#define IMGDROP_UPLOAD_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

#include "upload_types.hpp"

namespace imgdrop {
namespace uploader {

/**
 * One queued upload request
 */
struct UploadItem {
  std::string task_id;
  std::string source_ref;              // URL, data URL or local path
  std::optional<std::string> folder;   // nullopt uses the task's folder
  ProgressSink progress;            // May be empty
  int retry_count = 0;                 // Task-level retries so far
  std::chrono::steady_clock::time_point created_at;
  std::chrono::steady_clock::time_point next_retry_at;

  UploadItem()
      : created_at(std::chrono::steady_clock::now()) {}

  UploadItem(const std::string& task, const std::string& source)
      : task_id(task)
      , source_ref(source)
      , created_at(std::chrono::steady_clock::now()) {}
};

/**
 * Min-heap ordering by next_retry_at
 */
struct RetryItemComparator {
  bool operator()(const UploadItem& a, const UploadItem& b) const {
    return a.next_retry_at > b.next_retry_at;
  }
};

/**
 * Thread-safe upload queue with delayed retry
 *
 * - Any number of producers (submit) and consumers (dispatcher workers)
 * - Retry items become visible to dequeue once next_retry_at has passed
 */
class UploadQueue {
public:
  /**
   * @param capacity Maximum number of items in the main queue (0 = unlimited)
   */
  explicit UploadQueue(size_t capacity = 0);
  ~UploadQueue();

  UploadQueue(const UploadQueue&) = delete;
  UploadQueue& operator=(const UploadQueue&) = delete;
  UploadQueue(UploadQueue&&) = delete;
  UploadQueue& operator=(UploadQueue&&) = delete;

  /**
   * @return false if the queue is full or shut down
   */
  bool enqueue(UploadItem item);

  /**
   * Blocks until an item is available or shutdown is requested.
   *
   * @return Item, or std::nullopt once the queue is shutting down
   */
  std::optional<UploadItem> dequeue();

  std::optional<UploadItem> dequeue_with_timeout(std::chrono::milliseconds timeout);

  /**
   * Re-queue an item to become available at its next_retry_at.
   *
   * @return false if the queue is shut down
   */
  bool requeue_for_retry(UploadItem item);

  size_t size() const;
  size_t retry_size() const;
  bool empty() const;

  /**
   * Remove and return everything still queued, retry items included.
   */
  std::vector<UploadItem> drain();

  /**
   * dequeue() returns nullopt from now on
   */
  void shutdown();
  bool is_shutdown() const;

private:
  // Caller holds mutex_
  void process_retry_queue();
  std::optional<UploadItem> pop_ready();

  mutable std::mutex mutex_;
  std::condition_variable cv_;

  std::queue<UploadItem> main_queue_;
  std::priority_queue<UploadItem, std::vector<UploadItem>, RetryItemComparator> retry_queue_;

  size_t capacity_;
  std::atomic<bool> shutdown_{false};
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_UPLOAD_QUEUE_HPP
