// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retry_handler.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace imgdrop {
namespace uploader {

RetryHandler::RetryHandler(
  const RetryConfig& config, std::shared_ptr<NetworkConditionEstimator> estimator
)
    : config_(config)
    , estimator_(estimator ? std::move(estimator) : std::make_shared<NetworkConditionEstimator>())
    , rng_(std::random_device{}()) {}

RetryDecision RetryHandler::decide(
  const std::string& error, int attempt, int max_attempts, std::optional<int> status_code
) const {
  RetryDecision decision;
  decision.category = classifyError(error, status_code);

  if (attempt >= max_attempts) {
    decision.reason = "Maximum retry count (" + std::to_string(max_attempts) + ") reached";
    return decision;
  }

  if (decision.category == ErrorCategory::PERMANENT) {
    decision.reason = "Error is permanent (" + errorCategoryToString(decision.category) +
                      "): " + error;
    return decision;
  }

  decision.condition = estimator_->estimate({decision.category});
  if (decision.condition == NetworkCondition::OFFLINE && attempt > 0) {
    decision.reason = "Device appears to be offline";
    return decision;
  }

  decision.retry = true;
  decision.delay = getDelay(attempt, decision.category);
  decision.reason = "Retrying after " + errorCategoryToString(decision.category) +
                    " error with " + networkConditionToString(decision.condition) + " network";
  return decision;
}

std::chrono::milliseconds RetryHandler::baseDelay(int attempt) const {
  double delay_ms = static_cast<double>(config_.initial_delay.count()) *
                    std::pow(config_.exponential_base, static_cast<double>(std::max(attempt, 0)));
  delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

std::chrono::milliseconds RetryHandler::getDelay(int attempt, ErrorCategory category) const {
  double delay_ms = static_cast<double>(baseDelay(attempt).count());

  if (config_.jitter && config_.jitter_factor > 0.0) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<> dist(0.0, config_.jitter_factor);
    delay_ms += dist(rng_) * delay_ms;
  }

  delay_ms *= categoryFactor(category);
  return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

double RetryHandler::categoryFactor(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::RATE_LIMIT:
      return 2.0;
    case ErrorCategory::TIMEOUT:
      return 1.5;
    case ErrorCategory::PERMANENT:
      return 0.0;
    case ErrorCategory::TEMPORARY:
    case ErrorCategory::UNKNOWN:
      return 1.0;
  }
  return 1.0;
}

std::string RetryHandler::composeFailureMessage(
  const std::string& last_error, int retry_count, NetworkCondition condition,
  std::optional<int> status_code
) {
  if (last_error.empty() && !status_code) {
    return "Unknown upload error";
  }

  std::ostringstream oss;
  oss << "Failed after " << retry_count << " retries.";

  if (condition != NetworkCondition::GOOD) {
    oss << " Network appears to be " << networkConditionToString(condition) << ".";
  }

  if (status_code) {
    const int status = *status_code;
    if (status == 413) {
      oss << " The image may be too large for the server.";
    } else if (status == 415) {
      oss << " Invalid image format.";
    } else if (status == 429) {
      oss << " Server rate limit reached. Please try again later.";
    } else if (status >= 500) {
      oss << " Server is experiencing problems.";
    }
  }

  if (!last_error.empty()) {
    oss << " Error: " << last_error;
  }
  return oss.str();
}

}  // namespace uploader
}  // namespace imgdrop
