// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_UPLOAD_TYPES_HPP
#define IMGDROP_UPLOAD_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "http_transport.hpp"
#include "network_condition.hpp"

namespace imgdrop {
namespace uploader {

/**
 * Bytes ready to be sent, after source resolution and compression.
 */
struct Payload {
  std::vector<uint8_t> bytes;
  std::string content_type;
  std::string filename;
};

/**
 * Where a payload goes.
 */
struct Destination {
  std::string endpoint;               // Already formatted (scheme present)
  std::string account_id;             // Sent as cloudflareId
  std::optional<std::string> folder;  // nullopt uploads to the root
};

/**
 * Result of a whole (possibly retried, possibly chunked) upload.
 */
struct UploadOutcome {
  bool success = false;
  std::string url;
  std::string path;
  std::string error;  // Composed diagnostic on failure
  std::string note;   // Non-fatal remark, e.g. recovered response
  std::optional<int> status_code;
  int retries = 0;
  bool fatal = false;
  bool chunked = false;
  NetworkCondition condition = NetworkCondition::GOOD;

  static UploadOutcome Success(const std::string& url, const std::string& path = "") {
    UploadOutcome outcome;
    outcome.success = true;
    outcome.url = url;
    outcome.path = path;
    return outcome;
  }

  static UploadOutcome Failure(const std::string& error, bool fatal = false) {
    UploadOutcome outcome;
    outcome.error = error;
    outcome.fatal = fatal;
    return outcome;
  }
};

/**
 * Result of pushing a progress update to the observing surface.
 */
enum class ProgressDelivery {
  Delivered,
  NoReceiver,  // Nothing listening right now; ignored
  SurfaceGone  // The surface was closed; the task is aborted
};

struct ProgressUpdate {
  std::string task_id;
  std::string stage;  // "fetching", "compressing", "uploading", "processing"
  std::string message;
};

using ProgressSink = std::function<ProgressDelivery(const ProgressUpdate&)>;

/**
 * Back-off wait between attempts. Must return early once the token is cancelled.
 */
using Sleeper = std::function<void(std::chrono::milliseconds, const CancellationToken&)>;

/**
 * Sleeps in short slices so cancellation is noticed within ~50 ms.
 */
void interruptibleSleep(std::chrono::milliseconds delay, const CancellationToken& token);

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_UPLOAD_TYPES_HPP
