// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "notification_coalescer.hpp"

#include <algorithm>
#include <stdexcept>

#define IMGDROP_LOG_COMPONENT "notifications"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

namespace {

bool isTerminal(NotificationType type) {
  return type == NotificationType::SUCCESS || type == NotificationType::ERROR;
}

void assignContent(Notification& entry, const NotificationRequest& request) {
  entry.title = request.title;
  entry.message = request.message;
  entry.type = request.type;
  entry.image_url = request.image_url;
  if (!request.task_id.empty()) {
    entry.task_id = request.task_id;
  }
}

}  // namespace

std::string notificationTypeToString(NotificationType type) {
  switch (type) {
    case NotificationType::INFO:
      return "info";
    case NotificationType::SUCCESS:
      return "success";
    case NotificationType::ERROR:
      return "error";
    case NotificationType::LOADING:
      return "loading";
  }
  return "info";
}

NotificationCoalescer::NotificationCoalescer(
  std::shared_ptr<INotificationSink> sink, const CoalescerConfig& config
)
    : sink_(std::move(sink))
    , config_(config) {
  if (!sink_) {
    throw std::invalid_argument("NotificationCoalescer requires a sink");
  }
  if (config_.max_queue_length == 0) {
    throw std::invalid_argument("max_queue_length must be positive");
  }
}

NotificationCoalescer::~NotificationCoalescer() {
  stop();
}

std::string NotificationCoalescer::notify(
  const NotificationRequest& request, std::chrono::steady_clock::time_point now
) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (request.type == NotificationType::LOADING) {
    if (!request.task_id.empty() && finished_tasks_.count(request.task_id) > 0) {
      // Late progress for a task that already reported its result
      return "";
    }

    // Same task still has an undelivered loading entry: rewrite it in place
    auto existing = findPendingLoading(request.task_id);
    if (existing != queue_.end()) {
      assignContent(*existing, request);
      active_loading_id_ = existing->id;
      return existing->id;
    }

    // Any other pending loading entry is superseded by this one
    for (auto& entry : queue_) {
      if (!entry.processed && entry.type == NotificationType::LOADING) {
        entry.processed = true;
      }
    }
  } else {
    active_loading_id_.reset();

    if (isTerminal(request.type) && !request.task_id.empty()) {
      if (!finished_tasks_.insert(request.task_id).second) {
        IMGDROP_LOG_DEBUG("Dropping second result for task" << kv("task_id", request.task_id));
        return "";
      }
      auto loading = findPendingLoading(request.task_id);
      if (loading != queue_.end()) {
        assignContent(*loading, request);
        return loading->id;
      }
    }
  }

  for (const auto& entry : queue_) {
    if (!entry.processed && entry.task_id == request.task_id && entry.title == request.title &&
        entry.message == request.message && entry.type == request.type) {
      return entry.id;
    }
  }

  if (queue_.size() >= config_.max_queue_length) {
    evictForSpace();
  }

  Notification entry;
  entry.id = nextId();
  entry.created_at = now;
  assignContent(entry, request);
  queue_.push_back(entry);

  if (request.type == NotificationType::LOADING) {
    active_loading_id_ = entry.id;
  }
  return entry.id;
}

bool NotificationCoalescer::updateNotification(
  const std::string& id, const NotificationRequest& request
) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = findById(id);
  if (it == queue_.end()) {
    return false;
  }
  assignContent(*it, request);
  it->processed = false;
  return true;
}

bool NotificationCoalescer::processQueue(std::chrono::steady_clock::time_point now) {
  std::optional<Notification> next;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    next = takeNextLocked(now, false);
  }
  if (!next) {
    return false;
  }
  dispatch(*next);
  return true;
}

size_t NotificationCoalescer::cleanupOld(std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t before = queue_.size();
  for (auto it = queue_.begin(); it != queue_.end();) {
    if (it->processed && now - it->created_at > config_.processed_retention) {
      if (isTerminal(it->type) && !it->task_id.empty()) {
        finished_tasks_.erase(it->task_id);
      }
      it = queue_.erase(it);
    } else {
      ++it;
    }
  }
  return before - queue_.size();
}

void NotificationCoalescer::start() {
  if (running_.exchange(true)) {
    return;
  }
  drain_thread_ = std::thread(&NotificationCoalescer::drainLoop, this);
}

void NotificationCoalescer::stop() {
  {
    std::lock_guard<std::mutex> lock(drain_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  drain_cv_.notify_all();
  if (drain_thread_.joinable()) {
    drain_thread_.join();
  }
}

void NotificationCoalescer::flush() {
  while (true) {
    std::optional<Notification> next;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      next = takeNextLocked(std::chrono::steady_clock::now(), true);
    }
    if (!next) {
      return;
    }
    dispatch(*next);
  }
}

std::vector<Notification> NotificationCoalescer::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<Notification>(queue_.begin(), queue_.end());
}

size_t NotificationCoalescer::pendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count_if(queue_.begin(), queue_.end(), [](const Notification& n) {
    return !n.processed;
  }));
}

std::optional<std::string> NotificationCoalescer::activeLoadingId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_loading_id_;
}

std::string NotificationCoalescer::nextId() {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch()
  )
                        .count();
  return "notification_" + std::to_string(now_ms) + "_" + std::to_string(++id_counter_);
}

void NotificationCoalescer::evictForSpace() {
  // Oldest undelivered progress entry first; results are kept as long as possible
  auto progress = std::find_if(queue_.begin(), queue_.end(), [](const Notification& n) {
    return !n.processed && !isTerminal(n.type);
  });
  if (progress != queue_.end()) {
    if (active_loading_id_ && *active_loading_id_ == progress->id) {
      active_loading_id_.reset();
    }
    queue_.erase(progress);
    return;
  }

  const size_t processed = static_cast<size_t>(
    std::count_if(queue_.begin(), queue_.end(), [](const Notification& n) { return n.processed; })
  );
  if (processed > 0) {
    size_t to_remove = std::max<size_t>(1, processed / 2);
    for (auto it = queue_.begin(); it != queue_.end() && to_remove > 0;) {
      if (it->processed) {
        it = queue_.erase(it);
        --to_remove;
      } else {
        ++it;
      }
    }
    return;
  }

  IMGDROP_LOG_WARN("Notification queue full of results, dropping oldest" << kv("id", queue_.front().id));
  queue_.pop_front();
}

std::deque<Notification>::iterator NotificationCoalescer::findById(const std::string& id) {
  return std::find_if(queue_.begin(), queue_.end(), [&id](const Notification& n) {
    return n.id == id;
  });
}

std::deque<Notification>::iterator NotificationCoalescer::findPendingLoading(
  const std::string& task_id
) {
  if (task_id.empty()) {
    if (!active_loading_id_) {
      return queue_.end();
    }
    auto it = findById(*active_loading_id_);
    if (it != queue_.end() && !it->processed && it->type == NotificationType::LOADING) {
      return it;
    }
    return queue_.end();
  }
  return std::find_if(queue_.begin(), queue_.end(), [&task_id](const Notification& n) {
    return !n.processed && n.type == NotificationType::LOADING && n.task_id == task_id;
  });
}

std::optional<Notification> NotificationCoalescer::takeNextLocked(
  std::chrono::steady_clock::time_point now, bool ignore_spacing
) {
  if (!ignore_spacing && last_dispatch_ && now - *last_dispatch_ < config_.min_spacing) {
    return std::nullopt;
  }
  auto it = std::find_if(queue_.begin(), queue_.end(), [](const Notification& n) {
    return !n.processed;
  });
  if (it == queue_.end()) {
    return std::nullopt;
  }
  it->processed = true;
  last_dispatch_ = now;
  return *it;
}

void NotificationCoalescer::dispatch(const Notification& notification) {
  const DeliveryStatus status = sink_->deliver(notification);
  switch (status) {
    case DeliveryStatus::DELIVERED:
      IMGDROP_LOG_DEBUG(
        "Notification delivered" << kv("id", notification.id)
                                 << kv("type", notificationTypeToString(notification.type))
      );
      break;
    case DeliveryStatus::NO_RECEIVER:
      IMGDROP_LOG_DEBUG_EVERY_N(20, "No receiver for notification" << kv("id", notification.id));
      break;
    case DeliveryStatus::FAILED:
      IMGDROP_LOG_WARN(
        "Notification delivery failed" << kv("id", notification.id)
                                       << kv("title", notification.title)
      );
      break;
  }
}

void NotificationCoalescer::drainLoop() {
  auto last_cleanup = std::chrono::steady_clock::now();
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(drain_mutex_);
      drain_cv_.wait_for(lock, config_.drain_interval, [this] {
        return !running_;
      });
    }
    if (!running_) {
      break;
    }

    const auto now = std::chrono::steady_clock::now();
    processQueue(now);
    if (now - last_cleanup >= config_.cleanup_interval) {
      cleanupOld(now);
      last_cleanup = now;
    }
  }
}

}  // namespace uploader
}  // namespace imgdrop
