// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_UPLOAD_TASK_HPP
#define IMGDROP_UPLOAD_TASK_HPP

#include <chrono>
#include <optional>
#include <string>

namespace imgdrop {
namespace uploader {

/**
 * Lifecycle of one upload task
 */
enum class UploadState {
  IDLE,        // Reserved, never assigned by the engine
  PENDING,     // Created, not started
  LOADING,     // Accepted by the orchestrator
  FETCHING,    // Resolving the source bytes
  UPLOADING,   // Payload or chunks in flight
  PROCESSING,  // Waiting on the server / local preprocessing
  SUCCESS,     // Terminal
  ERROR        // Terminal
};

inline std::string uploadStateToString(UploadState state) {
  switch (state) {
    case UploadState::IDLE:
      return "idle";
    case UploadState::PENDING:
      return "pending";
    case UploadState::LOADING:
      return "loading";
    case UploadState::FETCHING:
      return "fetching";
    case UploadState::UPLOADING:
      return "uploading";
    case UploadState::PROCESSING:
      return "processing";
    case UploadState::SUCCESS:
      return "success";
    case UploadState::ERROR:
      return "error";
  }
  return "unknown";
}

inline bool isTerminalState(UploadState state) {
  return state == UploadState::SUCCESS || state == UploadState::ERROR;
}

/**
 * UI surface a task was started from (tab, window, CLI invocation).
 */
struct SurfaceRef {
  int id = 0;
  std::string label;
};

/**
 * Caller-supplied origin data. Owned by the task, never touched by the engine.
 */
struct OriginContext {
  std::string source_ref;
  std::optional<SurfaceRef> surface;
};

/**
 * Task creation parameters, decided at the call site.
 */
struct CreateTaskParams {
  std::optional<SurfaceRef> surface;
  std::optional<std::string> folder;  // nullopt uploads to the root
};

struct UploadTask {
  std::string id;
  UploadState state = UploadState::PENDING;
  std::optional<std::string> target_folder;
  int retry_count = 0;
  std::optional<std::string> error_message;  // Last failure reason or progress text
  std::chrono::system_clock::time_point start_time;
  std::chrono::steady_clock::time_point updated_at;
  std::optional<std::chrono::steady_clock::time_point> finished_at;
  OriginContext origin;
};

struct RetryState {
  int retry_count = 0;
  int max_retry_count = 0;
  bool can_retry = false;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_UPLOAD_TASK_HPP
