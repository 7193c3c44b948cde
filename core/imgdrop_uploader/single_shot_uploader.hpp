// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_SINGLE_SHOT_UPLOADER_HPP
#define IMGDROP_SINGLE_SHOT_UPLOADER_HPP

#include <functional>
#include <string>

#include "retry_handler.hpp"
#include "task_state_tracker.hpp"
#include "transfer_primitive.hpp"
#include "upload_types.hpp"

namespace imgdrop {
namespace uploader {

/**
 * One-request upload wrapped in the retry policy.
 *
 * Error categories are accumulated across the attempts of one call so the
 * final network estimate reflects the whole run, not just the last failure.
 */
class SingleShotUploader {
public:
  SingleShotUploader(
    TransferPrimitive& primitive, const RetryHandler& retry, TaskStateTracker& tracker,
    Sleeper sleeper = interruptibleSleep
  );

  /**
   * Multipart upload: file, cloudflareId, optional folderName.
   */
  UploadOutcome upload(
    const Payload& payload, const Destination& destination, const std::string& task_id,
    const CancellationToken& token = {}
  );

  /**
   * JSON mode: the server fetches image_url itself. An empty folder is sent as null.
   */
  UploadOutcome uploadRemote(
    const std::string& image_url, const Destination& destination, const std::string& task_id,
    const CancellationToken& token = {}
  );

private:
  UploadOutcome runWithRetry(
    const std::function<TransferResult()>& attempt, const std::string& task_id,
    const CancellationToken& token
  );

  TransferPrimitive& primitive_;
  const RetryHandler& retry_;
  TaskStateTracker& tracker_;
  Sleeper sleeper_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_SINGLE_SHOT_UPLOADER_HPP
