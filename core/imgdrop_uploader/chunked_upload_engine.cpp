// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunked_upload_engine.hpp"

#include <algorithm>
#include <cstdio>
#include <random>
#include <stdexcept>

#define IMGDROP_LOG_COMPONENT "chunked_upload"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

std::vector<ChunkSpan> splitIntoChunks(size_t total_bytes, size_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be positive");
  }

  std::vector<ChunkSpan> spans;
  spans.reserve((total_bytes + chunk_size - 1) / chunk_size);
  for (size_t offset = 0, index = 0; offset < total_bytes; offset += chunk_size, ++index) {
    spans.push_back(ChunkSpan{index, offset, std::min(chunk_size, total_bytes - offset)});
  }
  return spans;
}

ChunkedUploadEngine::ChunkedUploadEngine(
  TransferPrimitive& primitive, SingleShotUploader& single_shot, const RetryHandler& retry,
  TaskStateTracker& tracker, const ChunkedUploadConfig& config, Sleeper sleeper
)
    : primitive_(primitive)
    , single_shot_(single_shot)
    , retry_(retry)
    , tracker_(tracker)
    , config_(config)
    , sleeper_(std::move(sleeper)) {
  if (config_.chunk_size == 0 || config_.max_concurrency == 0) {
    throw std::invalid_argument("chunk_size and max_concurrency must be positive");
  }
  if (!sleeper_) {
    sleeper_ = interruptibleSleep;
  }
}

ChunkedUploadEngine::~ChunkedUploadEngine() {
  waitForCleanups();
}

std::string ChunkedUploadEngine::generateSessionId() {
  thread_local std::mt19937_64 rng(std::random_device{}());
  char suffix[17];
  std::snprintf(suffix, sizeof(suffix), "%016llx", static_cast<unsigned long long>(rng()));

  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch()
  )
                        .count();
  return "chunk_" + std::to_string(now_ms) + "_" + suffix;
}

UploadOutcome ChunkedUploadEngine::upload(
  const Payload& payload, const Destination& destination, const std::string& task_id,
  const CancellationToken& token
) {
  if (!shouldChunk(payload.bytes.size())) {
    return single_shot_.upload(payload, destination, task_id, token);
  }
  return uploadChunked(payload, destination, task_id, token);
}

UploadOutcome ChunkedUploadEngine::uploadChunked(
  const Payload& payload, const Destination& destination, const std::string& task_id,
  const CancellationToken& token
) {
  const std::vector<ChunkSpan> spans = splitIntoChunks(payload.bytes.size(), config_.chunk_size);

  ChunkSession session;
  session.session_id = generateSessionId();
  session.total_chunks = spans.size();
  session.chunk_size = config_.chunk_size;

  IMGDROP_LOG_SCOPED_CONTEXT(task_id, session.session_id);
  IMGDROP_LOG_INFO(
    "Starting chunked upload" << kv("bytes", payload.bytes.size())
                              << kv("chunks", session.total_chunks)
                              << kv("concurrency", config_.max_concurrency)
  );

  const size_t total = session.total_chunks;
  tracker_.updateState(
    task_id, UploadState::UPLOADING, "Uploading chunks: 0/" + std::to_string(total) + " (0%)"
  );

  size_t completed = 0;
  for (size_t wave_start = 0; wave_start < total; wave_start += config_.max_concurrency) {
    const size_t wave_end = std::min(wave_start + config_.max_concurrency, total);

    std::vector<std::future<ChunkOutcome>> wave;
    wave.reserve(wave_end - wave_start);
    for (size_t i = wave_start; i < wave_end; ++i) {
      const ChunkSpan span = spans[i];
      wave.push_back(std::async(std::launch::async, [&, span]() {
        return uploadChunk(payload, span, session, destination, task_id, token);
      }));
    }

    // Barrier: every chunk of the wave settles before anything else happens
    std::vector<ChunkOutcome> results;
    results.reserve(wave.size());
    for (auto& future : wave) {
      results.push_back(future.get());
    }

    std::optional<ChunkOutcome> failed;
    for (const auto& result : results) {
      session.outcomes.push_back(result);
      if (result.success) {
        ++completed;
      } else if (!failed) {
        failed = result;
      }
    }

    if (failed) {
      const ChunkOutcome& failure = *failed;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        last_session_ = session;
      }
      IMGDROP_LOG_ERROR(
        "Chunked upload aborted" << kv("chunk", failure.index) << kv("completed", completed)
                                 << kv("error", failure.error)
      );

      UploadOutcome outcome = UploadOutcome::Failure(
        "Chunk " + std::to_string(failure.index + 1) + "/" + std::to_string(total) +
        " failed: " + failure.error
      );
      outcome.chunked = true;
      outcome.status_code = failure.status_code;
      outcome.retries = failure.attempts > 0 ? failure.attempts - 1 : 0;
      outcome.condition = retry_.estimator().estimate(failure.categories);
      return outcome;
    }

    const size_t percent = completed * 100 / total;
    tracker_.updateState(
      task_id, UploadState::UPLOADING,
      "Uploading chunks: " + std::to_string(completed) + "/" + std::to_string(total) + " (" +
        std::to_string(percent) + "%)"
    );
    IMGDROP_LOG_INFO("Wave complete" << kv("completed", completed) << kv("total", total));
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_session_ = session;
  }

  const TransferResult finalized = finalize(payload, session, destination, task_id, token);
  if (!finalized.success) {
    IMGDROP_LOG_ERROR("Finalize failed" << kv("error", finalized.diagnostic()));
    UploadOutcome outcome = UploadOutcome::Failure("Finalize failed: " + finalized.diagnostic(), true);
    outcome.chunked = true;
    outcome.status_code = finalized.status_code;
    return outcome;
  }

  IMGDROP_LOG_INFO("Chunked upload finalized" << kv("url", finalized.response.url));
  if (config_.cleanup_after_finalize && cleanup_supported_) {
    scheduleCleanup(session, destination, task_id);
  }

  UploadOutcome outcome = UploadOutcome::Success(finalized.response.url, finalized.response.path);
  outcome.note = finalized.response.note;
  outcome.status_code = finalized.status_code;
  outcome.chunked = true;
  return outcome;
}

ChunkOutcome ChunkedUploadEngine::uploadChunk(
  const Payload& payload, const ChunkSpan& span, const ChunkSession& session,
  const Destination& destination, const std::string& task_id, const CancellationToken& token
) {
  IMGDROP_LOG_SCOPED_CONTEXT(task_id, session.session_id);

  MultipartForm form;
  form.addField("action", "upload_chunk");
  form.addField("sessionId", session.session_id);
  form.addField("chunkIndex", std::to_string(span.index));
  form.addField("totalChunks", std::to_string(session.total_chunks));
  form.addField("cloudflareId", destination.account_id);
  if (destination.folder && !destination.folder->empty()) {
    form.addField("folderName", *destination.folder);
  }
  form.addFile(
    "file", payload.filename + ".part" + std::to_string(span.index), "application/octet-stream",
    payload.bytes.data() + span.offset, span.size
  );

  ChunkOutcome outcome;
  outcome.index = span.index;
  std::string diagnostic;

  const int max_retries = retry_.maxRetries();
  int retry_count = 0;
  while (retry_count <= max_retries) {
    if (token.isCancelled()) {
      outcome.error = diagnostic = "Request aborted";
      break;
    }
    if (retry_count > 0) {
      const RetryDecision decision =
        retry_.decide(outcome.error, retry_count, max_retries, outcome.status_code);
      if (!decision.retry) {
        break;
      }
      IMGDROP_LOG_WARN(
        "Retrying chunk" << kv("chunk", span.index) << kv("attempt", retry_count)
                         << kv("delay_ms", decision.delay.count()) << kv("reason", decision.reason)
      );
      sleeper_(decision.delay, token);
      if (token.isCancelled()) {
        outcome.error = diagnostic = "Request aborted";
        break;
      }
    }

    ++outcome.attempts;
    const TransferResult result = primitive_.postForm(
      destination.endpoint, form, task_id, primitive_.timeouts().chunk, token,
      PhaseReporting::UPLOADING_ONLY
    );
    outcome.status_code = result.status_code;

    if (result.success) {
      if (result.response.chunk_index && *result.response.chunk_index != static_cast<int>(span.index)) {
        IMGDROP_LOG_WARN(
          "Server acknowledged a different chunk" << kv("sent", span.index)
                                                  << kv("acked", *result.response.chunk_index)
        );
      }
      outcome.success = true;
      outcome.error.clear();
      IMGDROP_LOG_DEBUG("Chunk stored" << kv("chunk", span.index) << kv("bytes", span.size));
      return outcome;
    }

    outcome.error = result.error;
    diagnostic = result.diagnostic();
    const ErrorCategory category = classifyError(result.error, result.status_code);
    outcome.categories.push_back(category);
    IMGDROP_LOG_WARN(
      "Chunk attempt failed" << kv("chunk", span.index) << kv("attempt", retry_count)
                             << kv("category", errorCategoryToString(category))
                             << kv("error", diagnostic)
    );
    if (result.fatal || result.cancelled || category == ErrorCategory::PERMANENT) {
      break;
    }
    ++retry_count;
  }

  outcome.error = RetryHandler::composeFailureMessage(
    diagnostic, retry_count, retry_.estimator().estimate(outcome.categories), outcome.status_code
  );
  return outcome;
}

TransferResult ChunkedUploadEngine::finalize(
  const Payload& payload, const ChunkSession& session, const Destination& destination,
  const std::string& task_id, const CancellationToken& token
) {
  MultipartForm form;
  form.addField("action", "finalize_chunked_upload");
  form.addField("sessionId", session.session_id);
  form.addField("totalChunks", std::to_string(session.total_chunks));
  form.addField("filename", payload.filename);
  form.addField("cloudflareId", destination.account_id);
  if (destination.folder && !destination.folder->empty()) {
    form.addField("folderName", *destination.folder);
  }

  tracker_.updateState(task_id, UploadState::UPLOADING, "Finalizing upload...");
  return primitive_.postForm(
    destination.endpoint, form, task_id, primitive_.timeouts().upload, token, PhaseReporting::FULL
  );
}

void ChunkedUploadEngine::scheduleCleanup(
  const ChunkSession& session, const Destination& destination, const std::string& task_id
) {
  std::lock_guard<std::mutex> lock(mutex_);
  cleanups_.erase(
    std::remove_if(
      cleanups_.begin(), cleanups_.end(),
      [](std::future<void>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
      }
    ),
    cleanups_.end()
  );

  const std::string session_id = session.session_id;
  cleanups_.push_back(std::async(std::launch::async, [this, session_id, destination, task_id]() {
    MultipartForm form;
    form.addField("action", "cleanup_chunks");
    form.addField("sessionId", session_id);
    form.addField("cloudflareId", destination.account_id);

    const TransferResult result = primitive_.postForm(
      destination.endpoint, form, task_id, primitive_.timeouts().chunk, CancellationToken{},
      PhaseReporting::NONE
    );
    if (result.success) {
      IMGDROP_LOG_DEBUG("Chunk cleanup done" << kv("session_id", session_id));
    } else if (result.status_code && *result.status_code >= 400 && *result.status_code < 500) {
      // Endpoint without the cleanup extension; it removes chunk storage on finalize itself
      if (cleanup_supported_.exchange(false)) {
        IMGDROP_LOG_DEBUG(
          "Endpoint does not support chunk cleanup" << kv("status", *result.status_code)
        );
      }
    } else {
      IMGDROP_LOG_WARN(
        "Chunk cleanup failed" << kv("session_id", session_id) << kv("error", result.diagnostic())
      );
    }
  }));
}

void ChunkedUploadEngine::waitForCleanups() {
  std::vector<std::future<void>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending.swap(cleanups_);
  }
  for (auto& f : pending) {
    if (f.valid()) {
      f.wait();
    }
  }
}

std::optional<ChunkSession> ChunkedUploadEngine::lastSession() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_session_;
}

}  // namespace uploader
}  // namespace imgdrop
