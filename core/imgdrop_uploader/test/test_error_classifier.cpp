// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for classifyError
 */

#include <gtest/gtest.h>

#include "error_classifier.hpp"

using namespace imgdrop::uploader;

TEST(ErrorClassifierTest, NetworkTokensAreTemporary) {
  EXPECT_EQ(classifyError("Network error: Connection refused"), ErrorCategory::TEMPORARY);
  EXPECT_EQ(classifyError("socket hang up"), ErrorCategory::TEMPORARY);
  EXPECT_EQ(classifyError("read ECONNRESET"), ErrorCategory::TEMPORARY);
  EXPECT_EQ(classifyError("getaddrinfo ENOTFOUND cdn.example.com"), ErrorCategory::TEMPORARY);
  EXPECT_EQ(classifyError("DNS lookup failed"), ErrorCategory::TEMPORARY);
}

TEST(ErrorClassifierTest, TimeoutTokens) {
  EXPECT_EQ(classifyError("Request timed out after 30000 ms"), ErrorCategory::TIMEOUT);
  EXPECT_EQ(classifyError("Upload timeout"), ErrorCategory::TIMEOUT);
  EXPECT_EQ(classifyError("Request aborted"), ErrorCategory::TIMEOUT);
}

TEST(ErrorClassifierTest, NetworkWinsOverTimeout) {
  // First matching rule decides
  EXPECT_EQ(classifyError("network timeout"), ErrorCategory::TEMPORARY);
}

TEST(ErrorClassifierTest, RateLimitByTokenOrStatus) {
  EXPECT_EQ(classifyError("Rate limit exceeded"), ErrorCategory::RATE_LIMIT);
  EXPECT_EQ(classifyError("Too Many Requests"), ErrorCategory::RATE_LIMIT);
  EXPECT_EQ(classifyError("Server responded with status: 429", 429), ErrorCategory::RATE_LIMIT);
}

TEST(ErrorClassifierTest, PermanentByTokenOrStatus) {
  EXPECT_EQ(classifyError("File not found"), ErrorCategory::PERMANENT);
  EXPECT_EQ(classifyError("Unauthorized"), ErrorCategory::PERMANENT);
  EXPECT_EQ(classifyError("FORBIDDEN"), ErrorCategory::PERMANENT);
  EXPECT_EQ(classifyError("Invalid image data"), ErrorCategory::PERMANENT);
  for (int status : {400, 401, 403, 404}) {
    EXPECT_EQ(classifyError("Server responded with status: " + std::to_string(status), status),
              ErrorCategory::PERMANENT)
      << "status " << status;
  }
}

TEST(ErrorClassifierTest, EverythingElseIsUnknown) {
  EXPECT_EQ(classifyError("Server responded with status: 503", 503), ErrorCategory::UNKNOWN);
  EXPECT_EQ(classifyError("something odd happened"), ErrorCategory::UNKNOWN);
  EXPECT_EQ(classifyError(""), ErrorCategory::UNKNOWN);
}

TEST(ErrorClassifierTest, CategoryNames) {
  EXPECT_EQ(errorCategoryToString(ErrorCategory::TEMPORARY), "TEMPORARY");
  EXPECT_EQ(errorCategoryToString(ErrorCategory::PERMANENT), "PERMANENT");
  EXPECT_EQ(errorCategoryToString(ErrorCategory::RATE_LIMIT), "RATE_LIMIT");
  EXPECT_EQ(errorCategoryToString(ErrorCategory::TIMEOUT), "TIMEOUT");
  EXPECT_EQ(errorCategoryToString(ErrorCategory::UNKNOWN), "UNKNOWN");
}
