// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for UploadQueue
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "upload_queue.hpp"

using namespace imgdrop::uploader;

class UploadQueueTest : public ::testing::Test {
protected:
  void SetUp() override {
    queue_ = std::make_unique<UploadQueue>();
  }

  void TearDown() override {
    if (queue_) {
      queue_->shutdown();
    }
  }

  std::unique_ptr<UploadQueue> queue_;
};

TEST_F(UploadQueueTest, EnqueueDequeue) {
  UploadItem item("task_001", "https://img.example.com/a.png");
  item.folder = std::string("blog");

  ASSERT_TRUE(queue_->enqueue(item));
  EXPECT_EQ(queue_->size(), 1u);
  EXPECT_FALSE(queue_->empty());

  auto dequeued = queue_->dequeue_with_timeout(std::chrono::milliseconds(100));
  ASSERT_TRUE(dequeued.has_value());
  EXPECT_EQ(dequeued->task_id, "task_001");
  EXPECT_EQ(dequeued->source_ref, "https://img.example.com/a.png");
  ASSERT_TRUE(dequeued->folder.has_value());
  EXPECT_EQ(*dequeued->folder, "blog");

  EXPECT_EQ(queue_->size(), 0u);
  EXPECT_TRUE(queue_->empty());
}

TEST_F(UploadQueueTest, FifoOrder) {
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(queue_->enqueue(UploadItem("task_" + std::to_string(i), "src")));
  }
  EXPECT_EQ(queue_->size(), 10u);

  for (int i = 0; i < 10; ++i) {
    auto dequeued = queue_->dequeue_with_timeout(std::chrono::milliseconds(100));
    ASSERT_TRUE(dequeued.has_value());
    EXPECT_EQ(dequeued->task_id, "task_" + std::to_string(i));
  }
  EXPECT_TRUE(queue_->empty());
}

TEST_F(UploadQueueTest, DequeueTimeout) {
  auto start = std::chrono::steady_clock::now();
  auto result = queue_->dequeue_with_timeout(std::chrono::milliseconds(100));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.has_value());
  EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 90);
}

TEST_F(UploadQueueTest, RequeueForRetry) {
  UploadItem item("task_001", "src");
  item.retry_count = 1;
  item.next_retry_at = std::chrono::steady_clock::now() + std::chrono::milliseconds(50);

  ASSERT_TRUE(queue_->requeue_for_retry(item));
  EXPECT_EQ(queue_->retry_size(), 1u);
  EXPECT_EQ(queue_->size(), 0u);
  EXPECT_FALSE(queue_->empty());

  // Not visible before next_retry_at
  auto result = queue_->dequeue_with_timeout(std::chrono::milliseconds(10));
  EXPECT_FALSE(result.has_value());

  std::this_thread::sleep_for(std::chrono::milliseconds(60));

  result = queue_->dequeue_with_timeout(std::chrono::milliseconds(100));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->task_id, "task_001");
  EXPECT_EQ(result->retry_count, 1);
}

TEST_F(UploadQueueTest, RequeueImmediateRetry) {
  UploadItem item("task_001", "src");
  item.next_retry_at = std::chrono::steady_clock::now();

  ASSERT_TRUE(queue_->requeue_for_retry(item));
  EXPECT_EQ(queue_->retry_size(), 0u);

  auto result = queue_->dequeue_with_timeout(std::chrono::milliseconds(10));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->task_id, "task_001");
}

TEST_F(UploadQueueTest, RetryQueueOrdering) {
  const auto now = std::chrono::steady_clock::now();
  UploadItem late("late", "src");
  late.next_retry_at = now + std::chrono::milliseconds(60);
  UploadItem early("early", "src");
  early.next_retry_at = now + std::chrono::milliseconds(30);

  ASSERT_TRUE(queue_->requeue_for_retry(late));
  ASSERT_TRUE(queue_->requeue_for_retry(early));

  std::this_thread::sleep_for(std::chrono::milliseconds(80));

  auto first = queue_->dequeue_with_timeout(std::chrono::milliseconds(100));
  auto second = queue_->dequeue_with_timeout(std::chrono::milliseconds(100));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->task_id, "early");
  EXPECT_EQ(second->task_id, "late");
}

TEST_F(UploadQueueTest, CapacityLimit) {
  auto limited_queue = std::make_unique<UploadQueue>(3);

  for (int i = 0; i < 3; ++i) {
    EXPECT_TRUE(limited_queue->enqueue(UploadItem("task_" + std::to_string(i), "src")));
  }
  EXPECT_FALSE(limited_queue->enqueue(UploadItem("extra", "src")));

  limited_queue->dequeue_with_timeout(std::chrono::milliseconds(10));
  EXPECT_TRUE(limited_queue->enqueue(UploadItem("extra", "src")));

  limited_queue->shutdown();
}

TEST_F(UploadQueueTest, ShutdownRejectsNewItems) {
  queue_->shutdown();
  EXPECT_TRUE(queue_->is_shutdown());

  EXPECT_FALSE(queue_->enqueue(UploadItem("task_001", "src")));

  UploadItem retry("task_002", "src");
  retry.next_retry_at = std::chrono::steady_clock::now() + std::chrono::milliseconds(100);
  EXPECT_FALSE(queue_->requeue_for_retry(retry));

  auto result = queue_->dequeue_with_timeout(std::chrono::milliseconds(1000));
  EXPECT_FALSE(result.has_value());
}

TEST_F(UploadQueueTest, DequeueBlockingShutdown) {
  std::atomic<bool> shutdown_received{false};

  std::thread consumer([this, &shutdown_received]() {
    auto result = queue_->dequeue();
    if (!result) {
      shutdown_received = true;
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  queue_->shutdown();
  consumer.join();

  EXPECT_TRUE(shutdown_received);
}

TEST_F(UploadQueueTest, DequeueBlockingWaitsForRetryItem) {
  UploadItem retry_item("task_retry", "src");
  retry_item.next_retry_at = std::chrono::steady_clock::now() + std::chrono::milliseconds(50);
  ASSERT_TRUE(queue_->requeue_for_retry(retry_item));

  std::atomic<bool> item_dequeued{false};
  std::thread consumer([this, &item_dequeued]() {
    auto result = queue_->dequeue();
    if (result && result->task_id == "task_retry") {
      item_dequeued = true;
    }
  });
  consumer.join();

  EXPECT_TRUE(item_dequeued);
  EXPECT_EQ(queue_->retry_size(), 0u);
}

TEST_F(UploadQueueTest, DrainReturnsEverything) {
  ASSERT_TRUE(queue_->enqueue(UploadItem("main_1", "src")));
  ASSERT_TRUE(queue_->enqueue(UploadItem("main_2", "src")));
  UploadItem retry("retry_1", "src");
  retry.next_retry_at = std::chrono::steady_clock::now() + std::chrono::minutes(1);
  ASSERT_TRUE(queue_->requeue_for_retry(retry));

  auto items = queue_->drain();

  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items[0].task_id, "main_1");
  EXPECT_EQ(items[1].task_id, "main_2");
  EXPECT_EQ(items[2].task_id, "retry_1");
  EXPECT_TRUE(queue_->empty());
}

TEST_F(UploadQueueTest, ConcurrentEnqueueDequeue) {
  constexpr int num_items = 100;
  std::atomic<int> dequeued_count{0};

  std::thread consumer([this, &dequeued_count]() {
    while (dequeued_count < num_items) {
      auto item = queue_->dequeue_with_timeout(std::chrono::milliseconds(100));
      if (item) {
        dequeued_count++;
      }
    }
  });

  for (int i = 0; i < num_items; ++i) {
    queue_->enqueue(UploadItem("task_" + std::to_string(i), "src"));
    std::this_thread::sleep_for(std::chrono::microseconds(100));
  }

  consumer.join();
  EXPECT_EQ(dequeued_count, num_items);
  EXPECT_TRUE(queue_->empty());
}
