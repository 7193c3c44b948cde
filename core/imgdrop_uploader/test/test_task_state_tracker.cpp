// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for TaskStateTracker
 */

#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <thread>
#include <tuple>
#include <vector>

#include "task_state_tracker.hpp"

using namespace imgdrop::uploader;

class TaskStateTrackerTest : public ::testing::Test {
protected:
  void SetUp() override {
    TaskTrackerConfig config;
    config.max_retry_count = 3;
    config.request_cooldown = std::chrono::milliseconds(300);
    config.retention = std::chrono::seconds(1800);
    tracker_ = std::make_unique<TaskStateTracker>(config);
  }

  std::unique_ptr<TaskStateTracker> tracker_;
};

TEST_F(TaskStateTrackerTest, TaskIdFormat) {
  const std::regex pattern("^upload_[0-9]+_[0-9a-z]{7}$");
  std::set<std::string> ids;
  for (int i = 0; i < 100; ++i) {
    auto id = TaskStateTracker::generateTaskId();
    EXPECT_TRUE(std::regex_match(id, pattern)) << id;
    ids.insert(id);
  }
  EXPECT_EQ(ids.size(), 100u);
}

TEST_F(TaskStateTrackerTest, CreateTaskStartsPending) {
  CreateTaskParams params;
  params.folder = "screenshots";
  params.surface = SurfaceRef{7, "tab"};
  auto id = tracker_->createTask("https://example.com/a.png", params);

  auto task = tracker_->getTask(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->state, UploadState::PENDING);
  EXPECT_EQ(task->retry_count, 0);
  EXPECT_EQ(task->target_folder, std::optional<std::string>("screenshots"));
  EXPECT_EQ(task->origin.source_ref, "https://example.com/a.png");
  ASSERT_TRUE(task->origin.surface.has_value());
  EXPECT_EQ(task->origin.surface->id, 7);
  EXPECT_FALSE(task->error_message.has_value());
  EXPECT_EQ(tracker_->size(), 1u);
}

TEST_F(TaskStateTrackerTest, UnknownIdIsIgnored) {
  EXPECT_FALSE(tracker_->updateState("upload_0_missing", UploadState::LOADING));
  EXPECT_FALSE(tracker_->getState("upload_0_missing").has_value());
  EXPECT_FALSE(tracker_->incrementRetryCount("upload_0_missing").has_value());
  EXPECT_FALSE(tracker_->shouldRetry("upload_0_missing"));
  EXPECT_FALSE(tracker_->cleanupTask("upload_0_missing"));
}

TEST_F(TaskStateTrackerTest, TransitionsThroughStages) {
  auto id = tracker_->createTask("src");
  EXPECT_TRUE(tracker_->updateState(id, UploadState::LOADING, "Preparing upload..."));
  EXPECT_TRUE(tracker_->updateState(id, UploadState::FETCHING, "Fetching image..."));
  EXPECT_TRUE(tracker_->updateState(id, UploadState::UPLOADING));

  auto task = tracker_->getTask(id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->state, UploadState::UPLOADING);
  // Empty message keeps the previous text
  EXPECT_EQ(task->error_message, std::optional<std::string>("Fetching image..."));
}

TEST_F(TaskStateTrackerTest, TerminalStatesAreSticky) {
  auto id = tracker_->createTask("src");
  ASSERT_TRUE(tracker_->updateState(id, UploadState::SUCCESS, "Upload complete!"));
  EXPECT_FALSE(tracker_->updateState(id, UploadState::ERROR, "late failure"));
  EXPECT_FALSE(tracker_->updateState(id, UploadState::UPLOADING));

  auto task = tracker_->getTask(id);
  EXPECT_EQ(task->state, UploadState::SUCCESS);
  EXPECT_EQ(task->error_message, std::optional<std::string>("Upload complete!"));
  EXPECT_TRUE(task->finished_at.has_value());
}

TEST_F(TaskStateTrackerTest, PendingCannotBeReentered) {
  auto id = tracker_->createTask("src");
  ASSERT_TRUE(tracker_->updateState(id, UploadState::LOADING));
  EXPECT_FALSE(tracker_->updateState(id, UploadState::PENDING));
  EXPECT_FALSE(tracker_->updateState(id, UploadState::IDLE));
  EXPECT_EQ(tracker_->getState(id), UploadState::LOADING);
}

TEST_F(TaskStateTrackerTest, RetryCountReachesLimitAndFails) {
  auto id = tracker_->createTask("src");
  EXPECT_TRUE(tracker_->shouldRetry(id));

  EXPECT_EQ(tracker_->incrementRetryCount(id), 1);
  EXPECT_EQ(tracker_->incrementRetryCount(id), 2);
  EXPECT_TRUE(tracker_->shouldRetry(id));
  EXPECT_EQ(tracker_->getState(id), UploadState::PENDING);

  EXPECT_EQ(tracker_->incrementRetryCount(id), 3);
  EXPECT_FALSE(tracker_->shouldRetry(id));
  EXPECT_EQ(tracker_->getState(id), UploadState::ERROR);
  EXPECT_EQ(
    tracker_->getTask(id)->error_message,
    std::optional<std::string>("Maximum retry count (3) reached")
  );

  // Never exceeds the limit
  EXPECT_EQ(tracker_->incrementRetryCount(id), 3);

  auto retry = tracker_->getRetryState(id);
  ASSERT_TRUE(retry.has_value());
  EXPECT_EQ(retry->retry_count, 3);
  EXPECT_EQ(retry->max_retry_count, 3);
  EXPECT_FALSE(retry->can_retry);
}

TEST_F(TaskStateTrackerTest, RetryLimitKeepsFailureReason) {
  auto id = tracker_->createTask("src");
  tracker_->incrementRetryCount(id, "Network error: connection reset");
  tracker_->incrementRetryCount(id, "Network error: connection reset");
  EXPECT_EQ(tracker_->getTask(id)->error_message, std::nullopt);

  EXPECT_EQ(tracker_->incrementRetryCount(id, "Network error: connection reset"), 3);
  EXPECT_EQ(tracker_->getState(id), UploadState::ERROR);
  EXPECT_EQ(
    tracker_->getTask(id)->error_message,
    std::optional<std::string>("Network error: connection reset")
  );
}

TEST_F(TaskStateTrackerTest, SetFolder) {
  auto id = tracker_->createTask("src");
  EXPECT_TRUE(tracker_->setFolder(id, std::string("2024/05")));
  EXPECT_EQ(tracker_->getTask(id)->target_folder, std::optional<std::string>("2024/05"));
  EXPECT_TRUE(tracker_->setFolder(id, std::nullopt));
  EXPECT_FALSE(tracker_->getTask(id)->target_folder.has_value());
}

TEST_F(TaskStateTrackerTest, SurfaceLostMarksInProgressTaskAsError) {
  auto id = tracker_->createTask("src");
  tracker_->updateState(id, UploadState::UPLOADING);
  EXPECT_TRUE(tracker_->markSurfaceLost(id));
  EXPECT_EQ(tracker_->getState(id), UploadState::ERROR);
  EXPECT_EQ(
    tracker_->getTask(id)->error_message, std::optional<std::string>("Observing surface was closed")
  );

  // Already finished: nothing to repair
  EXPECT_FALSE(tracker_->markSurfaceLost(id));
}

TEST_F(TaskStateTrackerTest, SweepDropsOnlyExpiredFinishedTasks) {
  auto finished = tracker_->createTask("a");
  auto running = tracker_->createTask("b");
  tracker_->updateState(finished, UploadState::ERROR, "boom");
  tracker_->updateState(running, UploadState::UPLOADING);

  const auto now = std::chrono::steady_clock::now();
  EXPECT_EQ(tracker_->sweep(now), 0u);
  EXPECT_EQ(tracker_->sweep(now + std::chrono::seconds(1801)), 1u);
  EXPECT_FALSE(tracker_->getTask(finished).has_value());
  EXPECT_TRUE(tracker_->getTask(running).has_value());
}

TEST_F(TaskStateTrackerTest, CleanupTask) {
  auto id = tracker_->createTask("src");
  EXPECT_TRUE(tracker_->cleanupTask(id));
  EXPECT_FALSE(tracker_->getTask(id).has_value());
  EXPECT_EQ(tracker_->size(), 0u);
}

TEST_F(TaskStateTrackerTest, RequestCooldown) {
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_TRUE(tracker_->canProcessRequest(t0));
  EXPECT_FALSE(tracker_->canProcessRequest(t0 + std::chrono::milliseconds(100)));
  EXPECT_TRUE(tracker_->canProcessRequest(t0 + std::chrono::milliseconds(300)));
}

TEST_F(TaskStateTrackerTest, ObserversSeeAppliedTransitions) {
  std::vector<std::tuple<std::string, UploadState, std::string>> seen;
  tracker_->addObserver([&seen](const std::string& id, UploadState state, const std::string& msg) {
    seen.emplace_back(id, state, msg);
  });

  auto id = tracker_->createTask("src");
  tracker_->updateState(id, UploadState::LOADING, "Preparing upload...");
  tracker_->updateState(id, UploadState::SUCCESS, "Upload complete!");
  tracker_->updateState(id, UploadState::ERROR, "ignored");

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(std::get<1>(seen[0]), UploadState::LOADING);
  EXPECT_EQ(std::get<2>(seen[0]), "Preparing upload...");
  EXPECT_EQ(std::get<1>(seen[1]), UploadState::SUCCESS);
}

TEST_F(TaskStateTrackerTest, ObserverMayQueryTracker) {
  std::optional<UploadState> observed;
  tracker_->addObserver([this, &observed](const std::string& id, UploadState, const std::string&) {
    observed = tracker_->getState(id);
  });
  auto id = tracker_->createTask("src");
  tracker_->updateState(id, UploadState::FETCHING);
  EXPECT_EQ(observed, UploadState::FETCHING);
}

TEST_F(TaskStateTrackerTest, ConcurrentUpdates) {
  std::vector<std::string> ids;
  for (int i = 0; i < 20; ++i) {
    ids.push_back(tracker_->createTask("src" + std::to_string(i)));
  }

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, &ids] {
      for (const auto& id : ids) {
        tracker_->updateState(id, UploadState::UPLOADING);
        tracker_->updateState(id, UploadState::SUCCESS, "Upload complete!");
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (const auto& id : ids) {
    EXPECT_EQ(tracker_->getState(id), UploadState::SUCCESS);
  }
}

TEST_F(TaskStateTrackerTest, SweeperStartsAndStops) {
  tracker_->startSweeper();
  tracker_->startSweeper();
  tracker_->stopSweeper();
  tracker_->stopSweeper();
}

TEST_F(TaskStateTrackerTest, StopSweeperDoesNotWaitForInterval) {
  // The sweep interval is 30 minutes; every stop must wake the sweeper at once
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 50; ++i) {
    tracker_->startSweeper();
    tracker_->stopSweeper();
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST(UploadStateTest, Names) {
  EXPECT_EQ(uploadStateToString(UploadState::PENDING), "pending");
  EXPECT_EQ(uploadStateToString(UploadState::PROCESSING), "processing");
  EXPECT_TRUE(isTerminalState(UploadState::SUCCESS));
  EXPECT_TRUE(isTerminalState(UploadState::ERROR));
  EXPECT_FALSE(isTerminalState(UploadState::UPLOADING));
}
