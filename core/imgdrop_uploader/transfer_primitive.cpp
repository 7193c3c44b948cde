// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_primitive.hpp"

#include <stdexcept>

#include "url_utils.hpp"

#define IMGDROP_LOG_COMPONENT "transfer"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

namespace {

std::string seconds(std::chrono::milliseconds ms) {
  return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(ms).count());
}

}  // namespace

TransferPrimitive::TransferPrimitive(
  std::shared_ptr<IHttpTransport> transport, TaskStateTracker& tracker,
  const TransferTimeouts& timeouts
)
    : transport_(std::move(transport))
    , tracker_(tracker)
    , timeouts_(timeouts) {
  if (!transport_) {
    throw std::invalid_argument("TransferPrimitive requires an HTTP transport");
  }
}

FetchResult TransferPrimitive::fetchSource(
  const std::string& url, const std::string& task_id, const CancellationToken& token
) {
  tracker_.updateState(task_id, UploadState::FETCHING, "Fetching image...");

  HttpRequest request;
  request.method = HttpMethod::GET;
  request.url = url;
  request.headers = {{"Accept", "image/*,*/*;q=0.8"}};
  request.timeout = timeouts_.fetch;

  const HttpResponse response = transport_->perform(request, token);

  FetchResult result;
  if (!response.completed) {
    result.timed_out = response.timed_out;
    result.error = response.timed_out
                     ? "Image fetch timed out after " + seconds(timeouts_.fetch) + " seconds."
                     : response.error_message;
    IMGDROP_LOG_WARN("Source fetch failed" << kv("task_id", task_id) << kv("error", result.error));
    return result;
  }

  result.status_code = response.status_code;
  if (!response.ok()) {
    result.error = "Failed to get image: " + std::to_string(response.status_code) + " " +
                   response.reason;
    IMGDROP_LOG_WARN("Source fetch rejected" << kv("task_id", task_id) << kv("status", response.status_code));
    return result;
  }

  result.success = true;
  result.bytes.assign(response.body.begin(), response.body.end());
  result.content_type = normalizeContentType(response.content_type);
  if (result.content_type.empty() || result.content_type == "application/octet-stream") {
    const std::string guessed = contentTypeForExtension(imageExtensionFromUrl(url));
    result.content_type = guessed.empty() ? "image/jpeg" : guessed;
  }
  IMGDROP_LOG_DEBUG(
    "Source fetched" << kv("task_id", task_id) << kv("bytes", result.bytes.size())
                     << kv("content_type", result.content_type)
  );
  return result;
}

TransferResult TransferPrimitive::postForm(
  const std::string& endpoint, const MultipartForm& form, const std::string& task_id,
  std::chrono::milliseconds timeout, const CancellationToken& token, PhaseReporting phases
) {
  HttpRequest request;
  request.method = HttpMethod::POST;
  request.url = endpoint;
  request.content_type = form.contentType();
  request.body = form.encode();
  request.timeout = timeout;

  const bool is_chunk = phases == PhaseReporting::UPLOADING_ONLY;
  const std::string timeout_message =
    is_chunk ? "Chunk upload timed out after " + seconds(timeout) + " seconds."
             : "Upload timed out after " + seconds(timeout) + " seconds. Please try again.";
  return post(std::move(request), task_id, token, phases, timeout_message);
}

TransferResult TransferPrimitive::postJson(
  const std::string& endpoint, const std::string& json_body, const std::string& task_id,
  const CancellationToken& token
) {
  HttpRequest request;
  request.method = HttpMethod::POST;
  request.url = endpoint;
  request.content_type = "application/json";
  request.body = json_body;
  request.timeout = timeouts_.upload;

  return post(
    std::move(request), task_id, token, PhaseReporting::FULL,
    "Upload timed out after " + seconds(timeouts_.upload) + " seconds. Please try again."
  );
}

HttpResponse TransferPrimitive::get(const std::string& url, const CancellationToken& token) {
  HttpRequest request;
  request.method = HttpMethod::GET;
  request.url = url;
  request.timeout = timeouts_.probe;
  return transport_->perform(request, token);
}

TransferResult TransferPrimitive::post(
  HttpRequest request, const std::string& task_id, const CancellationToken& token,
  PhaseReporting phases, const std::string& timeout_message
) {
  request.headers.emplace_back("X-Upload-ID", task_id);
  if (phases != PhaseReporting::NONE) {
    tracker_.updateState(task_id, UploadState::UPLOADING);
  }

  const HttpResponse response = transport_->perform(request, token);

  TransferResult result;
  if (!response.completed) {
    result.timed_out = response.timed_out;
    result.cancelled = response.cancelled;
    result.error = response.timed_out ? timeout_message : response.error_message;
    return result;
  }

  result.status_code = response.status_code;
  if (phases == PhaseReporting::FULL) {
    tracker_.updateState(task_id, UploadState::PROCESSING);
  }

  auto parsed = parseUploadResponse(response.body);

  if (!response.ok()) {
    result.error = "Server responded with status: " + std::to_string(response.status_code);
    if (parsed) {
      result.server_error = parsed->error;
    }
    return result;
  }

  if (!parsed) {
    result.fatal = true;
    result.error = kResponseFormatError;
    return result;
  }

  result.response = *parsed;
  if (!parsed->success) {
    result.error = parsed->error.empty() ? "Upload failed" : parsed->error;
    return result;
  }

  result.success = true;
  return result;
}

}  // namespace uploader
}  // namespace imgdrop
