// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_UPLOAD_SERVICE_HPP
#define IMGDROP_UPLOAD_SERVICE_HPP

#include <memory>

#include "chunked_upload_engine.hpp"
#include "config_parser.hpp"
#include "http_transport.hpp"
#include "image_uploader.hpp"
#include "notification_coalescer.hpp"
#include "retry_handler.hpp"
#include "single_shot_uploader.hpp"
#include "source_resolver.hpp"
#include "task_state_tracker.hpp"
#include "transfer_primitive.hpp"
#include "upload_dispatcher.hpp"
#include "uploader_interfaces.hpp"

namespace imgdrop {
namespace uploader {

/**
 * Collaborators that differ between the real process and tests.
 * Null members get the production implementation.
 */
struct ServiceDependencies {
  std::shared_ptr<IHttpTransport> transport;
  std::shared_ptr<IFileSystem> file_system;
  std::shared_ptr<IConnectivityProbe> connectivity;
  std::shared_ptr<INotificationSink> notification_sink;  // Null disables notifications
  Sleeper sleeper;
};

/**
 * Owns and wires the whole upload stack for one configuration snapshot.
 *
 * Component settings (timeouts, retry, chunking, workers) are read once at
 * construction; endpoint settings are re-read through the ConfigStore per upload.
 */
class UploadService {
public:
  UploadService(std::shared_ptr<ConfigStore> config, ServiceDependencies deps = {});
  ~UploadService();

  UploadService(const UploadService&) = delete;
  UploadService& operator=(const UploadService&) = delete;

  /**
   * Start the dispatcher workers, the notification drain and the task sweeper.
   */
  void start();

  /**
   * Stop everything, deliver pending notifications and wait for chunk cleanups.
   */
  void stop();

  ConfigStore& config() {
    return *config_;
  }
  TaskStateTracker& tracker() {
    return *tracker_;
  }
  ImageUploader& uploader() {
    return *uploader_;
  }
  UploadDispatcher& dispatcher() {
    return *dispatcher_;
  }
  ChunkedUploadEngine& engine() {
    return *engine_;
  }
  NotificationCoalescer* notifications() {
    return notifications_.get();
  }

private:
  std::shared_ptr<ConfigStore> config_;
  std::unique_ptr<TaskStateTracker> tracker_;
  std::unique_ptr<TransferPrimitive> primitive_;
  std::unique_ptr<RetryHandler> retry_;
  std::unique_ptr<SingleShotUploader> single_shot_;
  std::unique_ptr<ChunkedUploadEngine> engine_;
  std::unique_ptr<SourceResolver> resolver_;
  std::shared_ptr<NotificationCoalescer> notifications_;
  std::unique_ptr<ImageUploader> uploader_;
  std::unique_ptr<UploadDispatcher> dispatcher_;
  bool started_ = false;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_UPLOAD_SERVICE_HPP
