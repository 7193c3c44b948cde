// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for NotificationCoalescer
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>

#include "notification_coalescer.hpp"
#include "uploader_mocks.hpp"

using namespace imgdrop::uploader;
using namespace imgdrop::uploader::test;
using ::testing::_;
using ::testing::Return;

namespace {

NotificationRequest loading(const std::string& task_id, const std::string& message) {
  return NotificationRequest{kTitleDropping, message, NotificationType::LOADING, "", task_id};
}

NotificationRequest done(const std::string& task_id, const std::string& url) {
  return NotificationRequest{kTitleDone, "Upload complete!", NotificationType::SUCCESS, url, task_id};
}

NotificationRequest failed(const std::string& task_id, const std::string& message) {
  return NotificationRequest{kTitleFailed, message, NotificationType::ERROR, "", task_id};
}

}  // namespace

class NotificationCoalescerTest : public ::testing::Test {
protected:
  void SetUp() override {
    sink_ = std::make_shared<RecordingNotificationSink>();
    CoalescerConfig config;
    config.min_spacing = std::chrono::milliseconds(1000);
    config.max_queue_length = 10;
    config.processed_retention = std::chrono::seconds(1800);
    coalescer_ = std::make_unique<NotificationCoalescer>(sink_, config);
    t0_ = std::chrono::steady_clock::now();
  }

  std::chrono::steady_clock::time_point at(int ms) const {
    return t0_ + std::chrono::milliseconds(ms);
  }

  std::shared_ptr<RecordingNotificationSink> sink_;
  std::unique_ptr<NotificationCoalescer> coalescer_;
  std::chrono::steady_clock::time_point t0_;
};

TEST_F(NotificationCoalescerTest, RequiresSinkAndCapacity) {
  EXPECT_THROW(NotificationCoalescer(nullptr), std::invalid_argument);
  CoalescerConfig config;
  config.max_queue_length = 0;
  EXPECT_THROW(NotificationCoalescer(sink_, config), std::invalid_argument);
}

TEST_F(NotificationCoalescerTest, DeliveriesAreSpaced) {
  coalescer_->notify({"Info", "first", NotificationType::INFO, "", ""}, at(0));
  coalescer_->notify({"Info", "second", NotificationType::INFO, "", ""}, at(0));

  EXPECT_TRUE(coalescer_->processQueue(at(0)));
  EXPECT_FALSE(coalescer_->processQueue(at(500)));
  EXPECT_TRUE(coalescer_->processQueue(at(1000)));
  EXPECT_FALSE(coalescer_->processQueue(at(3000)));

  auto delivered = sink_->delivered();
  ASSERT_EQ(delivered.size(), 2u);
  EXPECT_EQ(delivered[0].message, "first");
  EXPECT_EQ(delivered[1].message, "second");
}

TEST_F(NotificationCoalescerTest, LoadingUpdatesRewriteTheSameEntry) {
  auto first = coalescer_->notify(loading("t1", "Preparing upload..."), at(0));
  auto second = coalescer_->notify(loading("t1", "Uploading chunks: 3/5 (60%)"), at(10));

  EXPECT_EQ(first, second);
  EXPECT_EQ(coalescer_->pendingCount(), 1u);
  EXPECT_EQ(coalescer_->activeLoadingId(), first);

  coalescer_->processQueue(at(20));
  ASSERT_EQ(sink_->delivered().size(), 1u);
  EXPECT_EQ(sink_->delivered()[0].message, "Uploading chunks: 3/5 (60%)");
}

TEST_F(NotificationCoalescerTest, NewLoadingSupersedesOtherTasks) {
  coalescer_->notify(loading("t1", "Preparing upload..."), at(0));
  auto second = coalescer_->notify(loading("t2", "Preparing upload..."), at(10));

  EXPECT_EQ(coalescer_->pendingCount(), 1u);
  EXPECT_EQ(coalescer_->activeLoadingId(), second);

  coalescer_->flush();
  ASSERT_EQ(sink_->delivered().size(), 1u);
  EXPECT_EQ(sink_->delivered()[0].task_id, "t2");
}

TEST_F(NotificationCoalescerTest, TerminalTakesOverPendingLoading) {
  auto loading_id = coalescer_->notify(loading("t1", "Uploading..."), at(0));
  auto done_id = coalescer_->notify(done("t1", "https://cdn.example.com/a.png"), at(10));

  EXPECT_EQ(loading_id, done_id);
  EXPECT_FALSE(coalescer_->activeLoadingId().has_value());
  coalescer_->flush();

  auto delivered = sink_->delivered();
  ASSERT_EQ(delivered.size(), 1u);
  EXPECT_EQ(delivered[0].title, kTitleDone);
  EXPECT_EQ(delivered[0].type, NotificationType::SUCCESS);
  EXPECT_EQ(delivered[0].image_url, "https://cdn.example.com/a.png");
}

TEST_F(NotificationCoalescerTest, TerminalAfterDeliveredLoadingIsAppended) {
  coalescer_->notify(loading("t1", "Uploading..."), at(0));
  coalescer_->processQueue(at(0));
  coalescer_->notify(failed("t1", "Network error, please check your connection"), at(10));

  coalescer_->processQueue(at(1000));
  auto delivered = sink_->delivered();
  ASSERT_EQ(delivered.size(), 2u);
  EXPECT_EQ(delivered[0].type, NotificationType::LOADING);
  EXPECT_EQ(delivered[1].type, NotificationType::ERROR);
}

TEST_F(NotificationCoalescerTest, SecondTerminalForTaskIsDropped) {
  EXPECT_FALSE(coalescer_->notify(done("t1", "https://cdn.example.com/a.png"), at(0)).empty());
  EXPECT_TRUE(coalescer_->notify(failed("t1", "late"), at(10)).empty());
  EXPECT_TRUE(coalescer_->notify(loading("t1", "late progress"), at(20)).empty());

  coalescer_->flush();
  ASSERT_EQ(sink_->delivered().size(), 1u);
  EXPECT_EQ(sink_->delivered()[0].title, kTitleDone);
}

TEST_F(NotificationCoalescerTest, UndeliveredDuplicatesCollapse) {
  auto a = coalescer_->notify({"Info", "Config reloaded", NotificationType::INFO, "", ""}, at(0));
  auto b = coalescer_->notify({"Info", "Config reloaded", NotificationType::INFO, "", ""}, at(5));
  EXPECT_EQ(a, b);
  EXPECT_EQ(coalescer_->pendingCount(), 1u);

  coalescer_->flush();
  auto c = coalescer_->notify({"Info", "Config reloaded", NotificationType::INFO, "", ""}, at(10));
  EXPECT_NE(a, c);
}

TEST_F(NotificationCoalescerTest, ResultsForDifferentTasksStaySeparate) {
  auto a = coalescer_->notify(done("task_a", "https://cdn.example.com/a.jpg"), at(0));
  auto b = coalescer_->notify(done("task_b", "https://cdn.example.com/b.jpg"), at(1));
  EXPECT_NE(a, b);

  coalescer_->flush();
  auto delivered = sink_->delivered();
  ASSERT_EQ(delivered.size(), 2u);
  EXPECT_EQ(delivered[0].task_id, "task_a");
  EXPECT_EQ(delivered[0].image_url, "https://cdn.example.com/a.jpg");
  EXPECT_EQ(delivered[1].task_id, "task_b");
  EXPECT_EQ(delivered[1].image_url, "https://cdn.example.com/b.jpg");
}

TEST_F(NotificationCoalescerTest, EvictsOldestProgressFirst) {
  coalescer_->notify(loading("t0", "Uploading..."), at(0));
  for (int i = 0; i < 9; ++i) {
    coalescer_->notify(done("r" + std::to_string(i), "https://cdn.example.com/" + std::to_string(i)), at(i));
  }
  ASSERT_EQ(coalescer_->snapshot().size(), 10u);

  coalescer_->notify(done("r9", "https://cdn.example.com/9"), at(20));
  auto entries = coalescer_->snapshot();
  ASSERT_EQ(entries.size(), 10u);
  for (const auto& entry : entries) {
    EXPECT_NE(entry.type, NotificationType::LOADING);
  }
  EXPECT_FALSE(coalescer_->activeLoadingId().has_value());
}

TEST_F(NotificationCoalescerTest, EvictsHalfOfProcessedWhenNoProgressPending) {
  for (int i = 0; i < 10; ++i) {
    coalescer_->notify(done("r" + std::to_string(i), "https://cdn.example.com/" + std::to_string(i)), at(i));
  }
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(coalescer_->processQueue(at(1000 * (i + 1))));
  }

  coalescer_->notify(done("new", "https://cdn.example.com/new"), at(10000));
  auto entries = coalescer_->snapshot();
  // 4 processed, half of them removed, then the new entry appended
  EXPECT_EQ(entries.size(), 9u);
  EXPECT_EQ(entries.back().task_id, "new");
  EXPECT_EQ(entries.front().task_id, "r2");
}

TEST_F(NotificationCoalescerTest, DropsOldestWhenFullOfResults) {
  for (int i = 0; i < 10; ++i) {
    coalescer_->notify(done("r" + std::to_string(i), "https://cdn.example.com/" + std::to_string(i)), at(i));
  }
  coalescer_->notify(done("new", "https://cdn.example.com/new"), at(20));

  auto entries = coalescer_->snapshot();
  ASSERT_EQ(entries.size(), 10u);
  EXPECT_EQ(entries.front().task_id, "r1");
  EXPECT_EQ(entries.back().task_id, "new");
}

TEST_F(NotificationCoalescerTest, UpdateNotificationRequeues) {
  auto id = coalescer_->notify({"Info", "v1", NotificationType::INFO, "", ""}, at(0));
  coalescer_->flush();
  EXPECT_EQ(coalescer_->pendingCount(), 0u);

  EXPECT_TRUE(coalescer_->updateNotification(id, {"Info", "v2", NotificationType::INFO, "", ""}));
  EXPECT_EQ(coalescer_->pendingCount(), 1u);
  EXPECT_FALSE(coalescer_->updateNotification("notification_missing", {}));

  coalescer_->flush();
  ASSERT_EQ(sink_->delivered().size(), 2u);
  EXPECT_EQ(sink_->delivered()[1].message, "v2");
}

TEST_F(NotificationCoalescerTest, CleanupOldRemovesExpiredProcessed) {
  coalescer_->notify(done("t1", "https://cdn.example.com/a.png"), at(0));
  coalescer_->notify({"Info", "pending", NotificationType::INFO, "", ""}, at(0));
  coalescer_->processQueue(at(0));

  EXPECT_EQ(coalescer_->cleanupOld(at(1000)), 0u);
  EXPECT_EQ(coalescer_->cleanupOld(at(1801 * 1000)), 1u);
  EXPECT_EQ(coalescer_->snapshot().size(), 1u);

  // The task's result slot is free again once its entry is gone
  EXPECT_FALSE(coalescer_->notify(done("t1", "https://cdn.example.com/b.png"), at(1802 * 1000)).empty());
}

TEST_F(NotificationCoalescerTest, SinkFailuresAreNotRetried) {
  auto sink = std::make_shared<MockNotificationSink>();
  EXPECT_CALL(*sink, deliver(_))
    .WillOnce(Return(DeliveryStatus::FAILED))
    .WillOnce(Return(DeliveryStatus::NO_RECEIVER));

  NotificationCoalescer coalescer(sink);
  coalescer.notify({"Info", "a", NotificationType::INFO, "", ""});
  coalescer.notify({"Info", "b", NotificationType::INFO, "", ""});
  coalescer.flush();
  EXPECT_EQ(coalescer.pendingCount(), 0u);
}

TEST_F(NotificationCoalescerTest, DrainThreadDelivers) {
  CoalescerConfig config;
  config.drain_interval = std::chrono::milliseconds(10);
  config.min_spacing = std::chrono::milliseconds(0);
  NotificationCoalescer coalescer(sink_, config);
  coalescer.start();
  coalescer.notify(done("t1", "https://cdn.example.com/a.png"));

  for (int i = 0; i < 200 && sink_->delivered().empty(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  coalescer.stop();
  ASSERT_EQ(sink_->delivered().size(), 1u);
}

TEST_F(NotificationCoalescerTest, StopDoesNotWaitForDrainInterval) {
  CoalescerConfig config;
  config.drain_interval = std::chrono::milliseconds(60000);
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 50; ++i) {
    NotificationCoalescer coalescer(sink_, config);
    coalescer.start();
    coalescer.stop();
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}
