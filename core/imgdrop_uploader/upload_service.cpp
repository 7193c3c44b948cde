// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_service.hpp"

#include <stdexcept>

#include "beast_http_transport.hpp"
#include "network_condition.hpp"
#include "uploader_impl.hpp"

#define IMGDROP_LOG_COMPONENT "upload_service"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

UploadService::UploadService(std::shared_ptr<ConfigStore> config, ServiceDependencies deps)
    : config_(std::move(config)) {
  if (!config_) {
    throw std::invalid_argument("UploadService requires a configuration store");
  }
  const UploaderAppConfig app = config_->config();

  if (!deps.transport) {
    deps.transport = std::make_shared<BeastHttpTransport>();
  }
  if (!deps.file_system) {
    deps.file_system = std::make_shared<FileSystemImpl>();
  }
  if (!deps.connectivity) {
    deps.connectivity = std::make_shared<InterfaceConnectivityProbe>();
  }
  if (!deps.sleeper) {
    deps.sleeper = interruptibleSleep;
  }

  tracker_ = std::make_unique<TaskStateTracker>(app.tasks);
  primitive_ = std::make_unique<TransferPrimitive>(deps.transport, *tracker_, app.timeouts);
  retry_ = std::make_unique<RetryHandler>(
    app.retry, std::make_shared<NetworkConditionEstimator>(deps.connectivity)
  );
  single_shot_ =
    std::make_unique<SingleShotUploader>(*primitive_, *retry_, *tracker_, deps.sleeper);
  engine_ = std::make_unique<ChunkedUploadEngine>(
    *primitive_, *single_shot_, *retry_, *tracker_, app.chunked, deps.sleeper
  );
  resolver_ = std::make_unique<SourceResolver>(*primitive_, deps.file_system);

  if (app.notifications.enabled && deps.notification_sink) {
    notifications_ = std::make_shared<NotificationCoalescer>(
      deps.notification_sink, app.notifications.coalescer
    );
  }

  uploader_ = std::make_unique<ImageUploader>(
    *config_, *tracker_, *primitive_, *resolver_, *single_shot_, *engine_, notifications_
  );
  dispatcher_ = std::make_unique<UploadDispatcher>(*uploader_, *tracker_, app.dispatcher);
}

UploadService::~UploadService() {
  stop();
}

void UploadService::start() {
  if (started_) {
    return;
  }
  started_ = true;
  tracker_->startSweeper();
  if (notifications_) {
    notifications_->start();
  }
  dispatcher_->start();
  IMGDROP_LOG_DEBUG("Upload service started" << kv("notifications", notifications_ != nullptr));
}

void UploadService::stop() {
  if (!started_) {
    return;
  }
  started_ = false;
  dispatcher_->stop();
  engine_->waitForCleanups();
  if (notifications_) {
    notifications_->stop();
    notifications_->flush();
  }
  tracker_->stopSweeper();
  IMGDROP_LOG_DEBUG("Upload service stopped");
}

}  // namespace uploader
}  // namespace imgdrop
