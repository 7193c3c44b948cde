// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for parseUploadResponse
 */

#include <gtest/gtest.h>

#include "upload_response.hpp"

using namespace imgdrop::uploader;

TEST(UploadResponseTest, ParsesSuccessBody) {
  auto response = parseUploadResponse(
    R"({"success":true,"url":"https://cdn.example.com/blog/a.png","path":"blog/a.png","size":1234,"type":"image/png"})"
  );
  ASSERT_TRUE(response.has_value());
  EXPECT_TRUE(response->success);
  EXPECT_EQ(response->url, "https://cdn.example.com/blog/a.png");
  EXPECT_EQ(response->path, "blog/a.png");
  EXPECT_EQ(response->size, std::optional<uint64_t>(1234));
  EXPECT_EQ(response->type, "image/png");
  EXPECT_FALSE(response->recovered);
}

TEST(UploadResponseTest, ParsesChunkAcknowledgement) {
  auto response =
    parseUploadResponse(R"({"success":true,"chunkIndex":"3","totalChunks":5,"sessionId":"s1"})");
  ASSERT_TRUE(response.has_value());
  EXPECT_EQ(response->chunk_index, std::optional<int>(3));
  EXPECT_EQ(response->total_chunks, std::optional<int>(5));
  EXPECT_EQ(response->session_id, "s1");
  EXPECT_TRUE(response->url.empty());
}

TEST(UploadResponseTest, ParsesErrorBody) {
  auto response = parseUploadResponse(R"({"success":false,"error":"Missing chunks: expected 5, found 4"})");
  ASSERT_TRUE(response.has_value());
  EXPECT_FALSE(response->success);
  EXPECT_EQ(response->error, "Missing chunks: expected 5, found 4");
}

TEST(UploadResponseTest, WrongTypesAreIgnored) {
  auto response = parseUploadResponse(R"({"success":"yes","url":42,"chunkIndex":"x"})");
  ASSERT_TRUE(response.has_value());
  EXPECT_FALSE(response->success);
  EXPECT_TRUE(response->url.empty());
  EXPECT_FALSE(response->chunk_index.has_value());
}

TEST(UploadResponseTest, RecoversUrlFromBrokenJson) {
  auto response = parseUploadResponse(
    "<!-- proxy -->{\"success\": true, \"url\": \"https://cdn.example.com/x.jpg\",}"
  );
  ASSERT_TRUE(response.has_value());
  EXPECT_TRUE(response->success);
  EXPECT_TRUE(response->recovered);
  EXPECT_EQ(response->url, "https://cdn.example.com/x.jpg");
  EXPECT_FALSE(response->note.empty());
}

TEST(UploadResponseTest, UnrecoverableBody) {
  EXPECT_FALSE(parseUploadResponse("<html>502 Bad Gateway</html>").has_value());
  EXPECT_FALSE(parseUploadResponse("{\"success\": false, \"url\": \"x\"").has_value());
  EXPECT_FALSE(parseUploadResponse("[1,2,3]").has_value());
  EXPECT_FALSE(parseUploadResponse("").has_value());
}
