// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "single_shot_uploader.hpp"

#include <nlohmann/json.hpp>

#include <thread>
#include <vector>

#define IMGDROP_LOG_COMPONENT "single_shot"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

void interruptibleSleep(std::chrono::milliseconds delay, const CancellationToken& token) {
  constexpr std::chrono::milliseconds kSlice{50};
  const auto until = std::chrono::steady_clock::now() + delay;
  while (!token.isCancelled()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= until) {
      return;
    }
    std::this_thread::sleep_for(
      std::min<std::chrono::steady_clock::duration>(kSlice, until - now)
    );
  }
}

SingleShotUploader::SingleShotUploader(
  TransferPrimitive& primitive, const RetryHandler& retry, TaskStateTracker& tracker,
  Sleeper sleeper
)
    : primitive_(primitive)
    , retry_(retry)
    , tracker_(tracker)
    , sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = interruptibleSleep;
  }
}

UploadOutcome SingleShotUploader::upload(
  const Payload& payload, const Destination& destination, const std::string& task_id,
  const CancellationToken& token
) {
  MultipartForm form;
  form.addFile(
    "file", payload.filename, payload.content_type, payload.bytes.data(), payload.bytes.size()
  );
  form.addField("cloudflareId", destination.account_id);
  if (destination.folder && !destination.folder->empty()) {
    form.addField("folderName", *destination.folder);
  }

  IMGDROP_LOG_INFO(
    "Single-shot upload" << kv("task_id", task_id) << kv("bytes", payload.bytes.size())
                         << kv("filename", payload.filename)
  );
  return runWithRetry(
    [&]() {
      return primitive_.postForm(
        destination.endpoint, form, task_id, primitive_.timeouts().upload, token
      );
    },
    task_id, token
  );
}

UploadOutcome SingleShotUploader::uploadRemote(
  const std::string& image_url, const Destination& destination, const std::string& task_id,
  const CancellationToken& token
) {
  nlohmann::json body;
  body["cloudflareId"] = destination.account_id;
  if (destination.folder && !destination.folder->empty()) {
    body["folderName"] = *destination.folder;
  } else {
    body["folderName"] = nullptr;
  }
  body["imageUrl"] = image_url;
  const std::string encoded = body.dump();

  IMGDROP_LOG_INFO("Server-side fetch upload" << kv("task_id", task_id) << kv("image_url", image_url));
  return runWithRetry(
    [&]() {
      return primitive_.postJson(destination.endpoint, encoded, task_id, token);
    },
    task_id, token
  );
}

UploadOutcome SingleShotUploader::runWithRetry(
  const std::function<TransferResult()>& attempt, const std::string& task_id,
  const CancellationToken& token
) {
  const int max_retries = retry_.maxRetries();
  std::vector<ErrorCategory> recent_categories;
  std::string last_error;
  std::string last_diagnostic;
  std::optional<int> last_status;
  bool fatal = false;
  int retry_count = 0;

  while (retry_count <= max_retries) {
    if (token.isCancelled()) {
      last_error = last_diagnostic = "Request aborted";
      break;
    }

    if (retry_count > 0) {
      const RetryDecision decision = retry_.decide(last_error, retry_count, max_retries, last_status);
      if (!decision.retry) {
        IMGDROP_LOG_WARN("Giving up" << kv("task_id", task_id) << kv("reason", decision.reason));
        break;
      }
      tracker_.updateState(
        task_id, UploadState::UPLOADING,
        "Retry #" + std::to_string(retry_count) + "... (" + decision.reason + ")"
      );
      IMGDROP_LOG_WARN(
        "Retrying upload" << kv("task_id", task_id) << kv("attempt", retry_count)
                          << kv("delay_ms", decision.delay.count()) << kv("reason", decision.reason)
      );
      sleeper_(decision.delay, token);
      if (token.isCancelled()) {
        last_error = last_diagnostic = "Request aborted";
        break;
      }
    }

    const TransferResult result = attempt();
    if (result.success) {
      UploadOutcome outcome = UploadOutcome::Success(result.response.url, result.response.path);
      outcome.note = result.response.note;
      outcome.status_code = result.status_code;
      outcome.retries = retry_count;
      IMGDROP_LOG_INFO(
        "Upload succeeded" << kv("task_id", task_id) << kv("url", outcome.url)
                           << kv("retries", retry_count)
      );
      return outcome;
    }

    last_error = result.error;
    last_diagnostic = result.diagnostic();
    last_status = result.status_code;
    const ErrorCategory category = classifyError(last_error, last_status);
    recent_categories.push_back(category);

    IMGDROP_LOG_WARN(
      "Upload attempt failed" << kv("task_id", task_id) << kv("attempt", retry_count)
                              << kv("category", errorCategoryToString(category))
                              << kv("error", last_diagnostic)
    );

    if (result.fatal || category == ErrorCategory::PERMANENT) {
      fatal = true;
      break;
    }
    if (result.cancelled) {
      break;
    }
    ++retry_count;
  }

  UploadOutcome outcome;
  outcome.condition = retry_.estimator().estimate(recent_categories);
  outcome.status_code = last_status;
  outcome.retries = retry_count;
  outcome.fatal = fatal;
  outcome.error =
    RetryHandler::composeFailureMessage(last_diagnostic, retry_count, outcome.condition, last_status);
  IMGDROP_LOG_ERROR("Upload failed" << kv("task_id", task_id) << kv("error", outcome.error));
  return outcome;
}

}  // namespace uploader
}  // namespace imgdrop
