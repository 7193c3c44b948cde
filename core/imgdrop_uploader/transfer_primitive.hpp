// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_TRANSFER_PRIMITIVE_HPP
#define IMGDROP_TRANSFER_PRIMITIVE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "http_transport.hpp"
#include "multipart_form.hpp"
#include "task_state_tracker.hpp"
#include "upload_response.hpp"

namespace imgdrop {
namespace uploader {

struct TransferTimeouts {
  std::chrono::milliseconds fetch{15000};
  std::chrono::milliseconds upload{30000};
  std::chrono::milliseconds chunk{30000};
  std::chrono::milliseconds probe{15000};
};

/**
 * Outcome of one POST to the storage endpoint.
 */
struct TransferResult {
  bool success = false;
  std::optional<int> status_code;  // Absent when no response arrived
  std::string error;               // Classified by the retry loops
  std::string server_error;        // "error" field of a non-2xx body, shown but never classified
  bool timed_out = false;
  bool cancelled = false;
  bool fatal = false;  // Response could not be interpreted; retrying will not help
  UploadResponse response;

  std::string diagnostic() const {
    return server_error.empty() ? error : error + " (" + server_error + ")";
  }
};

/**
 * Outcome of fetching the source image.
 */
struct FetchResult {
  bool success = false;
  std::vector<uint8_t> bytes;
  std::string content_type;
  std::optional<int> status_code;
  std::string error;
  bool timed_out = false;
};

/**
 * Which task phases a POST reports to the tracker.
 */
enum class PhaseReporting {
  FULL,            // UPLOADING before, PROCESSING once the server answered
  UPLOADING_ONLY,  // Chunk traffic: the finalize call reports PROCESSING
  NONE
};

/**
 * Exactly one network call per method, never retried here.
 *
 * Updates the owning task's phase immediately before each call. Timeouts and
 * cancellation come back as failed results, not exceptions.
 */
class TransferPrimitive {
public:
  TransferPrimitive(
    std::shared_ptr<IHttpTransport> transport, TaskStateTracker& tracker,
    const TransferTimeouts& timeouts = {}
  );

  /**
   * GET the source image (FETCHING, fetch timeout).
   */
  FetchResult fetchSource(
    const std::string& url, const std::string& task_id, const CancellationToken& token
  );

  /**
   * POST a multipart form. timeout selects the upload or chunk budget.
   */
  TransferResult postForm(
    const std::string& endpoint, const MultipartForm& form, const std::string& task_id,
    std::chrono::milliseconds timeout, const CancellationToken& token,
    PhaseReporting phases = PhaseReporting::FULL
  );

  /**
   * POST a JSON body (server-side fetch mode).
   */
  TransferResult postJson(
    const std::string& endpoint, const std::string& json_body, const std::string& task_id,
    const CancellationToken& token
  );

  /**
   * Plain GET with the probe timeout; not bound to a task.
   */
  HttpResponse get(const std::string& url, const CancellationToken& token);

  const TransferTimeouts& timeouts() const {
    return timeouts_;
  }

private:
  TransferResult post(
    HttpRequest request, const std::string& task_id, const CancellationToken& token,
    PhaseReporting phases, const std::string& timeout_message
  );

  std::shared_ptr<IHttpTransport> transport_;
  TaskStateTracker& tracker_;
  TransferTimeouts timeouts_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_TRANSFER_PRIMITIVE_HPP
