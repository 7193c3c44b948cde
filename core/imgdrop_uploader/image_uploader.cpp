// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "image_uploader.hpp"

#include <boost/algorithm/string.hpp>
#include <nlohmann/json.hpp>

#include "error_classifier.hpp"
#include "jpeg_recompressor.hpp"
#include "url_utils.hpp"

#define IMGDROP_LOG_COMPONENT "image_uploader"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

namespace {

constexpr const char* kMissingConfiguration =
  "Missing configuration: endpoint URL and account id are required";
constexpr const char* kSurfaceClosed = "Observing surface was closed";
constexpr size_t kDisplayLimit = 100;

}  // namespace

std::string displayMessageFor(const std::string& diagnostic) {
  if (diagnostic.empty()) {
    return "Upload failed";
  }

  const std::string lower = boost::algorithm::to_lower_copy(diagnostic);
  if (lower.find("network") != std::string::npos) {
    return "Network error. Please check your connection.";
  }
  if (lower.find("timeout") != std::string::npos || lower.find("timed out") != std::string::npos) {
    return "Upload timed out. Please try again.";
  }
  if (lower.find("large") != std::string::npos || lower.find("413") != std::string::npos) {
    return "Image is too large. Max size is 20MB.";
  }
  if (lower.find("format") != std::string::npos || lower.find("415") != std::string::npos) {
    return "Invalid image format.";
  }

  std::string message = "Error: " + diagnostic.substr(0, kDisplayLimit);
  if (diagnostic.size() > kDisplayLimit) {
    message += "...";
  }
  return message;
}

std::optional<UploadState> stageToState(const std::string& stage) {
  if (stage == "fetching") return UploadState::FETCHING;
  if (stage == "compressing") return UploadState::PROCESSING;
  if (stage == "uploading") return UploadState::UPLOADING;
  if (stage == "processing") return UploadState::PROCESSING;
  return std::nullopt;
}

ImageUploader::ImageUploader(
  ConfigStore& config, TaskStateTracker& tracker, TransferPrimitive& primitive,
  ISourceResolver& resolver, SingleShotUploader& single_shot, ChunkedUploadEngine& engine,
  std::shared_ptr<NotificationCoalescer> notifications
)
    : config_(config)
    , tracker_(tracker)
    , primitive_(primitive)
    , resolver_(resolver)
    , single_shot_(single_shot)
    , engine_(engine)
    , notifications_(std::move(notifications)) {
  if (notifications_) {
    std::weak_ptr<NotificationCoalescer> weak = notifications_;
    tracker_.addObserver([weak](const std::string& task_id, UploadState state, const std::string& message) {
      if (isTerminalState(state) || message.empty()) {
        return;
      }
      if (auto coalescer = weak.lock()) {
        coalescer->notify({kTitleDropping, message, NotificationType::LOADING, "", task_id});
      }
    });
  }
}

bool ImageUploader::reportStage(
  const std::string& task_id, const std::string& stage, const std::string& message,
  const ProgressSink& progress
) {
  if (surfaceLost(task_id)) {
    return false;
  }

  if (auto state = stageToState(stage)) {
    tracker_.updateState(task_id, *state, message);
  }

  if (!progress) {
    return true;
  }

  switch (progress({task_id, stage, message})) {
    case ProgressDelivery::Delivered:
      break;
    case ProgressDelivery::NoReceiver:
      IMGDROP_LOG_DEBUG("No receiver for progress update" << kv("task_id", task_id) << kv("stage", stage));
      break;
    case ProgressDelivery::SurfaceGone:
      IMGDROP_LOG_WARN("Progress surface is gone, aborting task" << kv("task_id", task_id));
      tracker_.markSurfaceLost(task_id);
      return false;
  }
  return true;
}

bool ImageUploader::surfaceLost(const std::string& task_id) const {
  auto task = tracker_.getTask(task_id);
  return task && task->state == UploadState::ERROR && task->error_message &&
         *task->error_message == kSurfaceClosed;
}

std::optional<Destination> ImageUploader::destinationFor(
  const EndpointSettings& settings, const std::string& task_id,
  const std::optional<std::string>& folder
) const {
  if (!settings.complete()) {
    return std::nullopt;
  }

  Destination destination;
  destination.endpoint = formatEndpointUrl(settings.endpoint_url);
  destination.account_id = trim(settings.account_id);

  std::optional<std::string> target = folder;
  if (!target) {
    if (auto task = tracker_.getTask(task_id)) {
      target = task->target_folder;
    }
  }
  if (target && !trim(*target).empty()) {
    destination.folder = trim(*target);
  }
  return destination;
}

void ImageUploader::notify(
  const std::string& task_id, const char* title, const std::string& message,
  NotificationType type, const std::string& image_url
) {
  if (notifications_) {
    notifications_->notify({title, message, type, image_url, task_id});
  }
}

ImageUploadOutcome ImageUploader::finishSuccess(
  const std::string& task_id, const UploadOutcome& outcome
) {
  ImageUploadOutcome result;
  result.success = true;
  result.url = outcome.url;
  result.note = outcome.note;
  result.chunked = outcome.chunked;
  result.retries = outcome.retries;
  result.status_code = outcome.status_code;
  result.condition = outcome.condition;

  tracker_.updateState(task_id, UploadState::SUCCESS, "Upload complete!");
  notify(task_id, kTitleDone, "Upload complete!", NotificationType::SUCCESS, outcome.url);

  IMGDROP_LOG_INFO(
    "Upload complete" << kv("task_id", task_id) << kv("url", outcome.url)
                      << kv("chunked", outcome.chunked) << kv("retries", outcome.retries)
  );
  return result;
}

ImageUploadOutcome ImageUploader::finishFailure(
  const std::string& task_id, const std::string& error, bool fatal, std::optional<int> status_code
) {
  ImageUploadOutcome result;
  result.error = error.empty() ? "Unknown upload error" : error;
  result.display_message = displayMessageFor(result.error);
  result.fatal = fatal;
  result.status_code = status_code;
  result.category = classifyError(result.error, status_code);

  tracker_.updateState(task_id, UploadState::ERROR, result.error);
  notify(task_id, kTitleFailed, result.display_message, NotificationType::ERROR);

  IMGDROP_LOG_ERROR(
    "Upload failed" << kv("task_id", task_id) << kv("error", result.error)
                    << kv("category", errorCategoryToString(result.category))
  );
  return result;
}

ImageUploadOutcome ImageUploader::uploadImage(
  const std::string& source_ref, const std::string& task_id,
  const std::optional<std::string>& folder, const ProgressSink& progress,
  const UploadOptions& options
) {
  IMGDROP_LOG_SCOPED_CONTEXT(task_id, "");
  tracker_.updateState(task_id, UploadState::LOADING, "Preparing upload...");

  const EndpointSettings settings = config_.settings();
  auto destination = destinationFor(settings, task_id, folder);
  if (!destination) {
    return finishFailure(task_id, kMissingConfiguration, true);
  }
  if (folder) {
    tracker_.setFolder(task_id, destination->folder);
  }

  // fetching
  if (!reportStage(task_id, "fetching", "Fetching image...", progress)) {
    return finishFailure(task_id, kSurfaceClosed, true);
  }
  SourceResult source = resolver_.resolve(source_ref, task_id, options.token);
  if (!source.success) {
    const ErrorCategory category = classifyError(source.error, source.status_code);
    const bool transient = category == ErrorCategory::TEMPORARY || category == ErrorCategory::TIMEOUT;
    if (options.allow_task_retry && !source.fatal && transient && !options.token.isCancelled() &&
        tracker_.shouldRetry(task_id)) {
      IMGDROP_LOG_WARN(
        "Source fetch failed, task will be retried" << kv("task_id", task_id)
                                                    << kv("error", source.error)
      );
      ImageUploadOutcome result;
      result.error = source.error;
      result.display_message = displayMessageFor(source.error);
      result.status_code = source.status_code;
      result.category = category;
      result.will_retry = true;
      return result;
    }
    return finishFailure(task_id, source.error, source.fatal, source.status_code);
  }

  // compressing
  if (!reportStage(task_id, "compressing", "Compressing...", progress)) {
    return finishFailure(task_id, kSurfaceClosed, true);
  }
  Payload payload;
  payload.content_type = source.content_type;
  {
    JpegRecompressor recompressor(settings.compression_quality);
    CompressionResult compressed = recompressor.process(source.bytes, source.content_type);
    if (compressed.applied) {
      IMGDROP_LOG_INFO(
        "Image recompressed" << kv("input_bytes", compressed.input_bytes)
                             << kv("output_bytes", compressed.output_bytes)
      );
    }
    payload.bytes = std::move(compressed.bytes);
  }
  payload.filename = makeUploadFilename(source_ref, payload.content_type);

  // uploading
  if (!reportStage(task_id, "uploading", "Uploading...", progress)) {
    return finishFailure(task_id, kSurfaceClosed, true);
  }
  if (options.token.isCancelled()) {
    return finishFailure(task_id, "Upload cancelled", true);
  }

  UploadOutcome outcome = engine_.upload(payload, *destination, task_id, options.token);
  if (surfaceLost(task_id)) {
    return finishFailure(task_id, kSurfaceClosed, true);
  }
  if (!outcome.success) {
    ImageUploadOutcome result = finishFailure(task_id, outcome.error, outcome.fatal, outcome.status_code);
    result.retries = outcome.retries;
    result.chunked = outcome.chunked;
    result.condition = outcome.condition;
    return result;
  }

  if (progress) {
    progress({task_id, "processing", "Upload complete!"});
  }
  return finishSuccess(task_id, outcome);
}

ImageUploadOutcome ImageUploader::uploadFromUrl(
  const std::string& image_url, const std::string& task_id,
  const std::optional<std::string>& folder, const UploadOptions& options
) {
  IMGDROP_LOG_SCOPED_CONTEXT(task_id, "");
  tracker_.updateState(task_id, UploadState::LOADING, "Preparing upload...");

  auto destination = destinationFor(config_.settings(), task_id, folder);
  if (!destination) {
    return finishFailure(task_id, kMissingConfiguration, true);
  }
  if (!parseUrl(image_url)) {
    return finishFailure(task_id, "Invalid source reference: " + image_url, true);
  }

  UploadOutcome outcome = single_shot_.uploadRemote(image_url, *destination, task_id, options.token);
  if (!outcome.success) {
    ImageUploadOutcome result = finishFailure(task_id, outcome.error, outcome.fatal, outcome.status_code);
    result.retries = outcome.retries;
    result.condition = outcome.condition;
    return result;
  }
  return finishSuccess(task_id, outcome);
}

ImageUploadOutcome ImageUploader::failTask(const std::string& task_id, const std::string& error) {
  return finishFailure(task_id, error, false);
}

ProbeResult ImageUploader::probeEndpoint(const CancellationToken& token) {
  ProbeResult result;
  const EndpointSettings settings = config_.settings();
  if (!settings.complete()) {
    result.message = kMissingConfiguration;
    return result;
  }

  const std::string url = appendQueryParam(
    formatEndpointUrl(settings.endpoint_url), "cloudflareId", trim(settings.account_id)
  );
  HttpResponse response = primitive_.get(url, token);
  if (!response.completed) {
    result.message = response.error_message.empty() ? "Connection failed" : response.error_message;
    IMGDROP_LOG_WARN("Endpoint probe failed" << kv("url", url) << kv("error", result.message));
    return result;
  }

  result.status_code = response.status_code;
  if (!response.ok()) {
    std::string detail;
    if (!response.body.empty()) {
      detail = " - " + response.body.substr(0, 100);
    }
    result.message = "Connection failed: " + std::to_string(response.status_code) + " " +
                     response.reason + detail;
    IMGDROP_LOG_WARN("Endpoint probe rejected" << kv("status", response.status_code));
    return result;
  }

  result.success = true;
  result.message = "Connection successful";

  auto json = nlohmann::json::parse(response.body, nullptr, false);
  if (json.is_discarded()) {
    IMGDROP_LOG_DEBUG("Probe response is not JSON" << kv("bytes", response.body.size()));
    return result;
  }
  if (json.is_object()) {
    if (json.contains("message") && json["message"].is_string()) {
      result.message = json["message"].get<std::string>();
    }
    auto worker = json.find("workerInfo");
    if (worker != json.end() && worker->is_object()) {
      auto validation = worker->find("idValidation");
      if (validation != worker->end() && validation->is_object()) {
        auto valid = validation->find("valid");
        if (valid != validation->end() && valid->is_boolean() && !valid->get<bool>()) {
          result.success = false;
          result.message = "Connection failed, try again or change settings";
        }
      }
    }
  }

  IMGDROP_LOG_INFO("Endpoint probe finished" << kv("success", result.success));
  return result;
}

}  // namespace uploader
}  // namespace imgdrop
