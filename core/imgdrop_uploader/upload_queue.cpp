// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_queue.hpp"

namespace imgdrop {
namespace uploader {

UploadQueue::UploadQueue(size_t capacity)
    : capacity_(capacity) {}

UploadQueue::~UploadQueue() {
  shutdown();
}

bool UploadQueue::enqueue(UploadItem item) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (shutdown_) {
    return false;
  }
  if (capacity_ > 0 && main_queue_.size() >= capacity_) {
    return false;
  }

  main_queue_.push(std::move(item));
  cv_.notify_one();
  return true;
}

std::optional<UploadItem> UploadQueue::pop_ready() {
  process_retry_queue();
  if (main_queue_.empty()) {
    return std::nullopt;
  }
  UploadItem item = std::move(main_queue_.front());
  main_queue_.pop();
  return item;
}

std::optional<UploadItem> UploadQueue::dequeue() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (true) {
    if (shutdown_) {
      return std::nullopt;
    }

    if (auto item = pop_ready()) {
      return item;
    }

    if (!retry_queue_.empty()) {
      cv_.wait_until(lock, retry_queue_.top().next_retry_at);
    } else {
      cv_.wait(lock);
    }
  }
}

std::optional<UploadItem> UploadQueue::dequeue_with_timeout(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    if (shutdown_) {
      return std::nullopt;
    }

    if (auto item = pop_ready()) {
      return item;
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }

    auto wait_until = deadline;
    if (!retry_queue_.empty() && retry_queue_.top().next_retry_at < wait_until) {
      wait_until = retry_queue_.top().next_retry_at;
    }
    cv_.wait_until(lock, wait_until);
  }
}

bool UploadQueue::requeue_for_retry(UploadItem item) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (shutdown_) {
    return false;
  }

  if (item.next_retry_at <= std::chrono::steady_clock::now()) {
    main_queue_.push(std::move(item));
  } else {
    retry_queue_.push(std::move(item));
  }
  cv_.notify_one();
  return true;
}

size_t UploadQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return main_queue_.size();
}

size_t UploadQueue::retry_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return retry_queue_.size();
}

bool UploadQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return main_queue_.empty() && retry_queue_.empty();
}

std::vector<UploadItem> UploadQueue::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<UploadItem> items;
  while (!main_queue_.empty()) {
    items.push_back(std::move(main_queue_.front()));
    main_queue_.pop();
  }
  while (!retry_queue_.empty()) {
    items.push_back(retry_queue_.top());
    retry_queue_.pop();
  }
  return items;
}

void UploadQueue::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool UploadQueue::is_shutdown() const {
  return shutdown_.load();
}

void UploadQueue::process_retry_queue() {
  const auto now = std::chrono::steady_clock::now();

  while (!retry_queue_.empty()) {
    if (retry_queue_.top().next_retry_at > now) {
      break;
    }
    // priority_queue::top() is const; copy out
    UploadItem item = retry_queue_.top();
    retry_queue_.pop();
    main_queue_.push(std::move(item));
  }
}

}  // namespace uploader
}  // namespace imgdrop
