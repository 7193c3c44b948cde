// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_IMAGE_UPLOADER_HPP
#define IMGDROP_IMAGE_UPLOADER_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "chunked_upload_engine.hpp"
#include "config_parser.hpp"
#include "http_transport.hpp"
#include "notification_coalescer.hpp"
#include "single_shot_uploader.hpp"
#include "source_resolver.hpp"
#include "task_state_tracker.hpp"
#include "transfer_primitive.hpp"

namespace imgdrop {
namespace uploader {

struct UploadOptions {
  // Leave transient source failures unfinalised so a dispatcher can requeue
  bool allow_task_retry = false;
  CancellationToken token;
};

struct ImageUploadOutcome {
  bool success = false;
  std::string url;
  std::string error;            // Full diagnostic
  std::string display_message;  // Short user-facing text
  std::string note;
  bool fatal = false;
  bool will_retry = false;  // Task left open for a task-level retry
  bool chunked = false;
  int retries = 0;
  std::optional<int> status_code;
  ErrorCategory category = ErrorCategory::UNKNOWN;
  NetworkCondition condition = NetworkCondition::GOOD;
};

struct ProbeResult {
  bool success = false;
  std::string message;
  std::optional<int> status_code;
};

/**
 * Map a diagnostic to the short text shown to the user.
 */
std::string displayMessageFor(const std::string& diagnostic);

/**
 * Stage name to tracker state: fetching/FETCHING, compressing/PROCESSING,
 * uploading/UPLOADING, processing/PROCESSING. nullopt for unknown names.
 */
std::optional<UploadState> stageToState(const std::string& stage);

/**
 * Runs one upload end to end: configuration check, source resolution,
 * optional JPEG recompression, transfer and final notification.
 *
 * Loading notifications follow the tracker: every in-progress transition
 * with a message rewrites the task's "Dropping" entry.
 */
class ImageUploader {
public:
  ImageUploader(
    ConfigStore& config, TaskStateTracker& tracker, TransferPrimitive& primitive,
    ISourceResolver& resolver, SingleShotUploader& single_shot, ChunkedUploadEngine& engine,
    std::shared_ptr<NotificationCoalescer> notifications = nullptr
  );

  /**
   * Upload source_ref for an existing task. folder overrides the task's
   * target folder; an empty folder means the root.
   */
  ImageUploadOutcome uploadImage(
    const std::string& source_ref, const std::string& task_id,
    const std::optional<std::string>& folder = std::nullopt, const ProgressSink& progress = nullptr,
    const UploadOptions& options = {}
  );

  /**
   * Ask the endpoint to fetch image_url itself.
   */
  ImageUploadOutcome uploadFromUrl(
    const std::string& image_url, const std::string& task_id,
    const std::optional<std::string>& folder = std::nullopt, const UploadOptions& options = {}
  );

  /**
   * GET <endpoint>?cloudflareId=<id> and interpret the worker's answer.
   */
  ProbeResult probeEndpoint(const CancellationToken& token = {});

  /**
   * Finalise a task that will not be attempted again (retries exhausted,
   * dispatcher shutting down). Sends the "Failed" notification.
   */
  ImageUploadOutcome failTask(const std::string& task_id, const std::string& error);

private:
  bool reportStage(
    const std::string& task_id, const std::string& stage, const std::string& message,
    const ProgressSink& progress
  );
  bool surfaceLost(const std::string& task_id) const;
  std::optional<Destination> destinationFor(
    const EndpointSettings& settings, const std::string& task_id,
    const std::optional<std::string>& folder
  ) const;
  ImageUploadOutcome finishSuccess(
    const std::string& task_id, const UploadOutcome& outcome
  );
  ImageUploadOutcome finishFailure(
    const std::string& task_id, const std::string& error, bool fatal,
    std::optional<int> status_code = std::nullopt
  );
  void notify(
    const std::string& task_id, const char* title, const std::string& message,
    NotificationType type, const std::string& image_url = ""
  );

  ConfigStore& config_;
  TaskStateTracker& tracker_;
  TransferPrimitive& primitive_;
  ISourceResolver& resolver_;
  SingleShotUploader& single_shot_;
  ChunkedUploadEngine& engine_;
  std::shared_ptr<NotificationCoalescer> notifications_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_IMAGE_UPLOADER_HPP
