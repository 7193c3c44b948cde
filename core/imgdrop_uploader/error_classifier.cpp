// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "error_classifier.hpp"

#include <boost/algorithm/string/case_conv.hpp>

#include <algorithm>
#include <array>

namespace imgdrop {
namespace uploader {

namespace {

constexpr std::array<const char*, 8> kTemporaryTokens = {
  "network", "connection", "socket", "reset", "econnreset", "etimedout", "enotfound", "dns"
};

constexpr std::array<const char*, 3> kTimeoutTokens = {"timeout", "timed out", "abort"};

constexpr std::array<const char*, 2> kRateLimitTokens = {"rate limit", "too many requests"};

constexpr std::array<const char*, 5> kPermanentTokens = {
  "not found", "unauthorized", "forbidden", "bad request", "invalid"
};

template <size_t N>
bool containsAny(const std::string& haystack, const std::array<const char*, N>& tokens) {
  return std::any_of(tokens.begin(), tokens.end(), [&haystack](const char* token) {
    return haystack.find(token) != std::string::npos;
  });
}

}  // namespace

std::string errorCategoryToString(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::TEMPORARY:
      return "TEMPORARY";
    case ErrorCategory::PERMANENT:
      return "PERMANENT";
    case ErrorCategory::RATE_LIMIT:
      return "RATE_LIMIT";
    case ErrorCategory::TIMEOUT:
      return "TIMEOUT";
    case ErrorCategory::UNKNOWN:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

ErrorCategory classifyError(const std::string& message, std::optional<int> status_code) {
  const std::string lower = boost::algorithm::to_lower_copy(message);

  if (containsAny(lower, kTemporaryTokens)) {
    return ErrorCategory::TEMPORARY;
  }
  if (containsAny(lower, kTimeoutTokens)) {
    return ErrorCategory::TIMEOUT;
  }
  if (containsAny(lower, kRateLimitTokens) || status_code == 429) {
    return ErrorCategory::RATE_LIMIT;
  }
  if (containsAny(lower, kPermanentTokens)) {
    return ErrorCategory::PERMANENT;
  }
  if (status_code) {
    switch (*status_code) {
      case 400:
      case 401:
      case 403:
      case 404:
        return ErrorCategory::PERMANENT;
      default:
        break;
    }
  }
  return ErrorCategory::UNKNOWN;
}

}  // namespace uploader
}  // namespace imgdrop
