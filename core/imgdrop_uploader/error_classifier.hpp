// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_ERROR_CLASSIFIER_HPP
#define IMGDROP_ERROR_CLASSIFIER_HPP

#include <optional>
#include <string>

namespace imgdrop {
namespace uploader {

enum class ErrorCategory {
  TEMPORARY,   // Network/connection/socket/DNS trouble
  PERMANENT,   // Configuration, auth or malformed request; never retried
  RATE_LIMIT,  // Server asked us to slow down
  TIMEOUT,     // Request deadline expired or was aborted
  UNKNOWN      // Anything else; retried conservatively
};

std::string errorCategoryToString(ErrorCategory category);

/**
 * Map a failure message and optional HTTP status to an ErrorCategory.
 *
 * Rules are evaluated in order, first match wins:
 *   1. network / connection / socket / reset / DNS tokens  -> TEMPORARY
 *   2. timeout / abort tokens                              -> TIMEOUT
 *   3. rate-limit tokens or status 429                     -> RATE_LIMIT
 *   4. not found / unauthorized / forbidden / bad request /
 *      invalid tokens or status 400, 401, 403, 404         -> PERMANENT
 *   5. otherwise                                           -> UNKNOWN
 *
 * Token matching ignores case. Pure function.
 */
ErrorCategory classifyError(
  const std::string& message, std::optional<int> status_code = std::nullopt
);

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_ERROR_CLASSIFIER_HPP
