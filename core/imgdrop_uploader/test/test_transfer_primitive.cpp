// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for TransferPrimitive with a mocked HTTP transport
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "transfer_primitive.hpp"
#include "uploader_mocks.hpp"

using namespace imgdrop::uploader;
using namespace imgdrop::uploader::test;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

class TransferPrimitiveTest : public ::testing::Test {
protected:
  void SetUp() override {
    transport_ = std::make_shared<MockHttpTransport>();
    TransferTimeouts timeouts;
    timeouts.fetch = std::chrono::milliseconds(15000);
    timeouts.upload = std::chrono::milliseconds(30000);
    timeouts.chunk = std::chrono::milliseconds(20000);
    timeouts.probe = std::chrono::milliseconds(5000);
    primitive_ = std::make_unique<TransferPrimitive>(transport_, tracker_, timeouts);

    task_id_ = tracker_.createTask("https://example.com/a.png");
    tracker_.updateState(task_id_, UploadState::LOADING);
  }

  MultipartForm singleForm() {
    MultipartForm form;
    const std::vector<uint8_t> bytes = {1, 2, 3};
    form.addFile("file", "image_1.png", "image/png", bytes.data(), bytes.size());
    form.addField("cloudflareId", "acct");
    return form;
  }

  TaskStateTracker tracker_;
  std::shared_ptr<MockHttpTransport> transport_;
  std::unique_ptr<TransferPrimitive> primitive_;
  std::string task_id_;
  CancellationToken token_;
};

TEST_F(TransferPrimitiveTest, RequiresTransport) {
  EXPECT_THROW(TransferPrimitive(nullptr, tracker_), std::invalid_argument);
}

TEST_F(TransferPrimitiveTest, FetchSourceSendsAcceptAndMovesToFetching) {
  HttpRequest captured;
  EXPECT_CALL(*transport_, perform(_, _)).WillOnce(Invoke([&](const HttpRequest& req, const CancellationToken&) {
    captured = req;
    EXPECT_EQ(tracker_.getState(task_id_), UploadState::FETCHING);
    return makeResponse(200, "PNGDATA", "image/PNG");
  }));

  auto result = primitive_->fetchSource("https://example.com/a.png", task_id_, token_);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(std::string(result.bytes.begin(), result.bytes.end()), "PNGDATA");
  EXPECT_EQ(result.content_type, "image/png");
  EXPECT_EQ(captured.method, HttpMethod::GET);
  EXPECT_EQ(captured.timeout, std::chrono::milliseconds(15000));
  ASSERT_EQ(captured.headers.size(), 1u);
  EXPECT_EQ(captured.headers[0].first, "Accept");
  EXPECT_EQ(captured.headers[0].second, "image/*,*/*;q=0.8");
}

TEST_F(TransferPrimitiveTest, FetchSourceGuessesTypeFromUrl) {
  EXPECT_CALL(*transport_, perform(_, _))
    .WillOnce(Return(makeResponse(200, "x", "application/octet-stream")))
    .WillOnce(Return(makeResponse(200, "x", "")));

  EXPECT_EQ(primitive_->fetchSource("https://example.com/a.webp", task_id_, token_).content_type, "image/webp");
  EXPECT_EQ(primitive_->fetchSource("https://example.com/render", task_id_, token_).content_type, "image/jpeg");
}

TEST_F(TransferPrimitiveTest, FetchSourceFailures) {
  EXPECT_CALL(*transport_, perform(_, _))
    .WillOnce(Return(makeResponse(404, "", "text/plain")))
    .WillOnce(Return(makeTimeout(15000)));

  auto missing = primitive_->fetchSource("https://example.com/a.png", task_id_, token_);
  EXPECT_FALSE(missing.success);
  EXPECT_EQ(missing.status_code, std::optional<int>(404));
  EXPECT_EQ(missing.error, "Failed to get image: 404 Not Found");

  auto slow = primitive_->fetchSource("https://example.com/a.png", task_id_, token_);
  EXPECT_FALSE(slow.success);
  EXPECT_TRUE(slow.timed_out);
  EXPECT_EQ(slow.error, "Image fetch timed out after 15 seconds.");
}

TEST_F(TransferPrimitiveTest, PostFormSuccessReportsPhases) {
  std::vector<UploadState> phases;
  tracker_.addObserver([&phases](const std::string&, UploadState state, const std::string&) {
    phases.push_back(state);
  });

  HttpRequest captured;
  EXPECT_CALL(*transport_, perform(_, _)).WillOnce(Invoke([&](const HttpRequest& req, const CancellationToken&) {
    captured = req;
    return makeSuccess("https://cdn.example.com/image_1.png");
  }));

  auto result = primitive_->postForm(
    "https://w.example.com", singleForm(), task_id_, std::chrono::milliseconds(30000), token_
  );
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.response.url, "https://cdn.example.com/image_1.png");
  EXPECT_EQ(result.status_code, std::optional<int>(200));

  EXPECT_EQ(captured.method, HttpMethod::POST);
  EXPECT_EQ(captured.url, "https://w.example.com");
  EXPECT_NE(captured.content_type.find("multipart/form-data; boundary="), std::string::npos);
  ASSERT_FALSE(captured.headers.empty());
  EXPECT_EQ(captured.headers.back().first, "X-Upload-ID");
  EXPECT_EQ(captured.headers.back().second, task_id_);

  ASSERT_EQ(phases.size(), 2u);
  EXPECT_EQ(phases[0], UploadState::UPLOADING);
  EXPECT_EQ(phases[1], UploadState::PROCESSING);
}

TEST_F(TransferPrimitiveTest, ChunkTrafficReportsUploadingOnly) {
  EXPECT_CALL(*transport_, perform(_, _)).WillOnce(Return(makeResponse(200, R"({"success":true,"chunkIndex":0})")));

  auto result = primitive_->postForm(
    "https://w.example.com", singleForm(), task_id_, std::chrono::milliseconds(20000), token_,
    PhaseReporting::UPLOADING_ONLY
  );
  EXPECT_TRUE(result.success);
  EXPECT_EQ(tracker_.getState(task_id_), UploadState::UPLOADING);
}

TEST_F(TransferPrimitiveTest, NonSuccessStatusCarriesServerError) {
  EXPECT_CALL(*transport_, perform(_, _))
    .WillOnce(Return(makeResponse(400, R"({"success":false,"error":"Missing cloudflareId"})")))
    .WillOnce(Return(makeResponse(502, "<html>Bad Gateway</html>", "text/html")));

  auto rejected = primitive_->postForm(
    "https://w.example.com", singleForm(), task_id_, std::chrono::milliseconds(30000), token_
  );
  EXPECT_FALSE(rejected.success);
  EXPECT_FALSE(rejected.fatal);
  EXPECT_EQ(rejected.status_code, std::optional<int>(400));
  EXPECT_EQ(rejected.error, "Server responded with status: 400");
  EXPECT_EQ(rejected.server_error, "Missing cloudflareId");
  EXPECT_EQ(rejected.diagnostic(), "Server responded with status: 400 (Missing cloudflareId)");

  auto gateway = primitive_->postForm(
    "https://w.example.com", singleForm(), task_id_, std::chrono::milliseconds(30000), token_
  );
  EXPECT_EQ(gateway.error, "Server responded with status: 502");
  EXPECT_TRUE(gateway.server_error.empty());
  EXPECT_EQ(gateway.diagnostic(), gateway.error);
}

TEST_F(TransferPrimitiveTest, UnparseableSuccessBodyIsFatal) {
  EXPECT_CALL(*transport_, perform(_, _)).WillOnce(Return(makeResponse(200, "<html>ok</html>", "text/html")));

  auto result = primitive_->postForm(
    "https://w.example.com", singleForm(), task_id_, std::chrono::milliseconds(30000), token_
  );
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.fatal);
  EXPECT_EQ(result.error, kResponseFormatError);
}

TEST_F(TransferPrimitiveTest, ApplicationLevelFailure) {
  EXPECT_CALL(*transport_, perform(_, _))
    .WillOnce(Return(makeResponse(200, R"({"success":false,"error":"Folder not allowed"})")))
    .WillOnce(Return(makeResponse(200, R"({"success":false})")));

  auto named = primitive_->postForm(
    "https://w.example.com", singleForm(), task_id_, std::chrono::milliseconds(30000), token_
  );
  EXPECT_EQ(named.error, "Folder not allowed");
  auto bare = primitive_->postForm(
    "https://w.example.com", singleForm(), task_id_, std::chrono::milliseconds(30000), token_
  );
  EXPECT_EQ(bare.error, "Upload failed");
}

TEST_F(TransferPrimitiveTest, TimeoutMessagesDependOnTrafficKind) {
  EXPECT_CALL(*transport_, perform(_, _)).WillRepeatedly(Return(makeTimeout()));

  auto single = primitive_->postForm(
    "https://w.example.com", singleForm(), task_id_, std::chrono::milliseconds(30000), token_
  );
  EXPECT_TRUE(single.timed_out);
  EXPECT_EQ(single.error, "Upload timed out after 30 seconds. Please try again.");
  EXPECT_FALSE(single.status_code.has_value());

  auto chunk = primitive_->postForm(
    "https://w.example.com", singleForm(), task_id_, std::chrono::milliseconds(20000), token_,
    PhaseReporting::UPLOADING_ONLY
  );
  EXPECT_EQ(chunk.error, "Chunk upload timed out after 20 seconds.");
}

TEST_F(TransferPrimitiveTest, TransportErrorPassesThrough) {
  HttpResponse cancelled;
  cancelled.cancelled = true;
  cancelled.error_message = "Request aborted";
  EXPECT_CALL(*transport_, perform(_, _))
    .WillOnce(Return(makeNetworkError()))
    .WillOnce(Return(cancelled));

  auto refused = primitive_->postJson("https://w.example.com", "{}", task_id_, token_);
  EXPECT_EQ(refused.error, "Network error: Connection refused");
  EXPECT_FALSE(refused.cancelled);

  auto aborted = primitive_->postJson("https://w.example.com", "{}", task_id_, token_);
  EXPECT_TRUE(aborted.cancelled);
  EXPECT_EQ(aborted.error, "Request aborted");
}

TEST_F(TransferPrimitiveTest, PostJsonUsesUploadTimeout) {
  HttpRequest captured;
  EXPECT_CALL(*transport_, perform(_, _)).WillOnce(Invoke([&](const HttpRequest& req, const CancellationToken&) {
    captured = req;
    return makeSuccess("https://cdn.example.com/a.png");
  }));

  auto result = primitive_->postJson("https://w.example.com", R"({"imageUrl":"x"})", task_id_, token_);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(captured.content_type, "application/json");
  EXPECT_EQ(captured.body, R"({"imageUrl":"x"})");
  EXPECT_EQ(captured.timeout, std::chrono::milliseconds(30000));
}

TEST_F(TransferPrimitiveTest, GetUsesProbeTimeoutWithoutTask) {
  HttpRequest captured;
  EXPECT_CALL(*transport_, perform(_, _)).WillOnce(Invoke([&](const HttpRequest& req, const CancellationToken&) {
    captured = req;
    return makeResponse(200, "{}");
  }));

  auto response = primitive_->get("https://w.example.com?cloudflareId=acct", token_);
  EXPECT_TRUE(response.ok());
  EXPECT_EQ(captured.timeout, std::chrono::milliseconds(5000));
  EXPECT_TRUE(captured.headers.empty());
  EXPECT_EQ(tracker_.getState(task_id_), UploadState::LOADING);
}
