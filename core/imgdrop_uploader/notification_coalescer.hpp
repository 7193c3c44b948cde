// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_NOTIFICATION_COALESCER_HPP
#define IMGDROP_NOTIFICATION_COALESCER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace imgdrop {
namespace uploader {

enum class NotificationType { INFO, SUCCESS, ERROR, LOADING };

std::string notificationTypeToString(NotificationType type);

// Titles used by the upload flow
constexpr const char* kTitleDropping = "Dropping";
constexpr const char* kTitleDone = "Done";
constexpr const char* kTitleFailed = "Failed";

struct NotificationRequest {
  std::string title;
  std::string message;
  NotificationType type = NotificationType::INFO;
  std::string image_url;
  std::string task_id;  // Empty for events not tied to a task
};

struct Notification {
  std::string id;
  std::string title;
  std::string message;
  NotificationType type = NotificationType::INFO;
  std::string image_url;
  std::string task_id;
  std::chrono::steady_clock::time_point created_at;
  bool processed = false;  // Delivered, superseded or otherwise done
};

/**
 * Outcome of handing a notification to the observing surface.
 */
enum class DeliveryStatus {
  DELIVERED,
  NO_RECEIVER,  // Nobody is listening; not an error
  FAILED
};

class INotificationSink {
public:
  virtual ~INotificationSink() = default;
  virtual DeliveryStatus deliver(const Notification& notification) = 0;
};

struct CoalescerConfig {
  std::chrono::milliseconds drain_interval{300};
  std::chrono::milliseconds min_spacing{1000};  // Between two deliveries
  size_t max_queue_length = 10;
  std::chrono::seconds processed_retention{1800};
  std::chrono::seconds cleanup_interval{300};
};

/**
 * Serialises user-visible upload events into a calm, non-flickering stream.
 *
 * - At most one active loading entry; a loading update for the same task
 *   rewrites that entry while it is still undelivered.
 * - A terminal (SUCCESS/ERROR) event for a task takes over the task's pending
 *   loading entry and is delivered exactly once.
 * - Undelivered duplicates (title + message + type) collapse into one.
 * - The drain thread delivers at most one entry per min_spacing.
 *
 * Thread-safe. The sink is called without the queue lock held.
 */
class NotificationCoalescer {
public:
  explicit NotificationCoalescer(
    std::shared_ptr<INotificationSink> sink, const CoalescerConfig& config = {}
  );
  ~NotificationCoalescer();

  NotificationCoalescer(const NotificationCoalescer&) = delete;
  NotificationCoalescer& operator=(const NotificationCoalescer&) = delete;

  /**
   * Queue an event.
   *
   * @return Id of the entry now carrying the event (may be an existing entry)
   */
  std::string notify(
    const NotificationRequest& request,
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()
  );

  /**
   * Replace the content of an entry. A delivered entry is re-queued.
   *
   * @return false if the id is unknown
   */
  bool updateNotification(const std::string& id, const NotificationRequest& request);

  /**
   * Deliver the oldest undelivered entry if min_spacing has elapsed.
   *
   * @return true if an entry was handed to the sink
   */
  bool processQueue(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

  /**
   * Remove processed entries older than processed_retention.
   */
  size_t cleanupOld(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

  void start();
  void stop();

  /**
   * Deliver everything still queued, ignoring min_spacing. Used at shutdown.
   */
  void flush();

  std::vector<Notification> snapshot() const;
  size_t pendingCount() const;
  std::optional<std::string> activeLoadingId() const;

private:
  std::string nextId();
  void evictForSpace();
  std::deque<Notification>::iterator findById(const std::string& id);
  std::deque<Notification>::iterator findPendingLoading(const std::string& task_id);
  std::optional<Notification> takeNextLocked(std::chrono::steady_clock::time_point now, bool ignore_spacing);
  void dispatch(const Notification& notification);
  void drainLoop();

  std::shared_ptr<INotificationSink> sink_;
  CoalescerConfig config_;

  mutable std::mutex mutex_;
  std::deque<Notification> queue_;
  std::optional<std::string> active_loading_id_;
  std::set<std::string> finished_tasks_;
  std::optional<std::chrono::steady_clock::time_point> last_dispatch_;
  uint64_t id_counter_ = 0;

  std::atomic<bool> running_{false};
  std::thread drain_thread_;
  std::mutex drain_mutex_;
  std::condition_variable drain_cv_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_NOTIFICATION_COALESCER_HPP
