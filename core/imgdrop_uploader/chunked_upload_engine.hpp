// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_CHUNKED_UPLOAD_ENGINE_HPP
#define IMGDROP_CHUNKED_UPLOAD_ENGINE_HPP

#include <atomic>
#include <cstddef>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "retry_handler.hpp"
#include "single_shot_uploader.hpp"
#include "task_state_tracker.hpp"
#include "transfer_primitive.hpp"
#include "upload_types.hpp"

namespace imgdrop {
namespace uploader {

struct ChunkedUploadConfig {
  size_t threshold_bytes = 2 * 1024 * 1024;  // Larger payloads go chunked
  size_t chunk_size = 1024 * 1024;
  size_t max_concurrency = 3;  // Chunks per wave
  bool cleanup_after_finalize = true;  // Only for endpoints that accept action=cleanup_chunks
};

/**
 * Contiguous slice of a payload.
 */
struct ChunkSpan {
  size_t index = 0;
  size_t offset = 0;
  size_t size = 0;
};

/**
 * ceil(total_bytes / chunk_size) spans, all chunk_size long except possibly the last.
 *
 * @throws std::invalid_argument if chunk_size is zero
 */
std::vector<ChunkSpan> splitIntoChunks(size_t total_bytes, size_t chunk_size);

struct ChunkOutcome {
  size_t index = 0;
  bool success = false;
  int attempts = 0;
  std::optional<int> status_code;
  std::string error;
  std::vector<ErrorCategory> categories;
};

/**
 * Grouping of one chunked transfer. Lives only for the duration of the call.
 */
struct ChunkSession {
  std::string session_id;
  size_t total_chunks = 0;
  size_t chunk_size = 0;
  std::vector<ChunkOutcome> outcomes;
};

/**
 * Picks single-shot or chunked transfer by payload size.
 *
 * Chunks go out in waves of max_concurrency; each chunk has its own retry
 * loop. A wave is a barrier, and any chunk that exhausts its retries aborts
 * the whole session before finalize. After a successful finalize the temporary
 * chunk storage is cleaned up in the background; the result is only logged.
 */
class ChunkedUploadEngine {
public:
  ChunkedUploadEngine(
    TransferPrimitive& primitive, SingleShotUploader& single_shot, const RetryHandler& retry,
    TaskStateTracker& tracker, const ChunkedUploadConfig& config = {},
    Sleeper sleeper = interruptibleSleep
  );
  ~ChunkedUploadEngine();

  ChunkedUploadEngine(const ChunkedUploadEngine&) = delete;
  ChunkedUploadEngine& operator=(const ChunkedUploadEngine&) = delete;

  UploadOutcome upload(
    const Payload& payload, const Destination& destination, const std::string& task_id,
    const CancellationToken& token = {}
  );

  /**
   * Chunked path regardless of size.
   */
  UploadOutcome uploadChunked(
    const Payload& payload, const Destination& destination, const std::string& task_id,
    const CancellationToken& token = {}
  );

  bool shouldChunk(size_t payload_size) const {
    return payload_size > config_.threshold_bytes;
  }

  /**
   * Block until background cleanups have finished. Used on shutdown and in tests.
   */
  void waitForCleanups();

  /**
   * False once the endpoint has rejected a cleanup request; no further cleanups are sent.
   */
  bool cleanupSupported() const {
    return cleanup_supported_.load();
  }

  /**
   * Session of the most recent chunked call, for diagnostics.
   */
  std::optional<ChunkSession> lastSession() const;

  const ChunkedUploadConfig& config() const {
    return config_;
  }

  static std::string generateSessionId();

private:
  ChunkOutcome uploadChunk(
    const Payload& payload, const ChunkSpan& span, const ChunkSession& session,
    const Destination& destination, const std::string& task_id, const CancellationToken& token
  );

  TransferResult finalize(
    const Payload& payload, const ChunkSession& session, const Destination& destination,
    const std::string& task_id, const CancellationToken& token
  );

  void scheduleCleanup(const ChunkSession& session, const Destination& destination, const std::string& task_id);

  TransferPrimitive& primitive_;
  SingleShotUploader& single_shot_;
  const RetryHandler& retry_;
  TaskStateTracker& tracker_;
  ChunkedUploadConfig config_;
  Sleeper sleeper_;

  mutable std::mutex mutex_;
  std::vector<std::future<void>> cleanups_;
  std::atomic<bool> cleanup_supported_{true};
  std::optional<ChunkSession> last_session_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_CHUNKED_UPLOAD_ENGINE_HPP
