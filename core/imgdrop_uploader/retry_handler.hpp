// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_RETRY_HANDLER_HPP
#define IMGDROP_RETRY_HANDLER_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "error_classifier.hpp"
#include "network_condition.hpp"

namespace imgdrop {
namespace uploader {

/**
 * Configuration for retry behavior
 */
struct RetryConfig {
  int max_retries = 3;                            // Attempts allowed per transfer
  std::chrono::milliseconds initial_delay{1000};  // Delay before the first retry
  std::chrono::milliseconds max_delay{30000};     // Cap on the pre-jitter delay
  double exponential_base = 2.0;                  // Exponential backoff base
  bool jitter = true;                             // Add random jitter
  double jitter_factor = 0.3;                     // Jitter adds [0, factor] * base
};

/**
 * Outcome of one retry evaluation.
 */
struct RetryDecision {
  bool retry = false;
  std::chrono::milliseconds delay{0};  // Meaningless when retry is false
  std::string reason;
  ErrorCategory category = ErrorCategory::UNKNOWN;
  NetworkCondition condition = NetworkCondition::GOOD;
};

/**
 * Retry policy with exponential backoff, jitter and category escalation.
 *
 * decide() is stateless across calls: the caller keeps the attempt counter and
 * any cross-attempt error history. Thread-safe; the jitter RNG is guarded.
 */
class RetryHandler {
public:
  explicit RetryHandler(
    const RetryConfig& config = {}, std::shared_ptr<NetworkConditionEstimator> estimator = nullptr
  );

  /**
   * Decide whether the failed attempt should be retried.
   *
   * - attempt >= max_attempts: no retry
   * - PERMANENT classification: no retry
   * - estimated OFFLINE and attempt > 0: no retry
   * - otherwise retry after getDelay(attempt, category)
   *
   * @param error Failure message of the attempt
   * @param attempt Number of attempts already retried (0-indexed)
   * @param max_attempts Retry budget for this transfer
   * @param status_code HTTP status of the failed attempt, if any
   */
  RetryDecision decide(
    const std::string& error, int attempt, int max_attempts,
    std::optional<int> status_code = std::nullopt
  ) const;

  /**
   * min(initial_delay * base^attempt, max_delay), before jitter and category factor.
   */
  std::chrono::milliseconds baseDelay(int attempt) const;

  /**
   * baseDelay plus jitter, scaled by categoryFactor(category).
   */
  std::chrono::milliseconds getDelay(int attempt, ErrorCategory category) const;

  /**
   * RATE_LIMIT 2.0, TIMEOUT 1.5, TEMPORARY and UNKNOWN 1.0, PERMANENT 0.
   */
  static double categoryFactor(ErrorCategory category);

  /**
   * Diagnostic surfaced to the caller once retries are exhausted, e.g.
   * "Failed after 3 retries. Network appears to be poor. Server is experiencing
   * problems. Error: Server responded with status: 503"
   */
  static std::string composeFailureMessage(
    const std::string& last_error, int retry_count, NetworkCondition condition,
    std::optional<int> status_code
  );

  bool shouldRetry(int retry_count) const {
    return retry_count < config_.max_retries;
  }

  int maxRetries() const {
    return config_.max_retries;
  }

  const RetryConfig& config() const {
    return config_;
  }

  const NetworkConditionEstimator& estimator() const {
    return *estimator_;
  }

private:
  RetryConfig config_;
  std::shared_ptr<NetworkConditionEstimator> estimator_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_RETRY_HANDLER_HPP
