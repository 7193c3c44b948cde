// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_UPLOADER_CONFIG_HPP
#define IMGDROP_UPLOADER_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "chunked_upload_engine.hpp"
#include "notification_coalescer.hpp"
#include "retry_handler.hpp"
#include "task_state_tracker.hpp"
#include "transfer_primitive.hpp"

namespace imgdrop {
namespace uploader {

/**
 * How a finished upload's URL is presented to the user.
 */
enum class LinkFormat { MARKDOWN, HTML, BBCODE, PLAIN };

std::string linkFormatToString(LinkFormat format);

/**
 * Accepts "markdown", "html", "bbcode", "plain" (any case).
 */
std::optional<LinkFormat> parseLinkFormat(const std::string& value);

/**
 * Render url in the given format, e.g. "![image](url)" for markdown.
 */
std::string formatLink(const std::string& url, LinkFormat format, const std::string& alt = "image");

struct EndpointConfig {
  std::string url;
  std::string account_id;
  std::vector<std::string> folders;  // Parsed from the comma-separated list
  bool hide_root = false;            // Only offer the configured folders
  double compression_quality = 0.0;  // 0 disables recompression
  LinkFormat link_format = LinkFormat::MARKDOWN;
};

struct NotificationSettings {
  bool enabled = true;
  CoalescerConfig coalescer;
};

struct DispatcherConfig {
  int num_workers = 2;
  std::chrono::milliseconds retry_interval{500};  // Task-level requeue delay
};

/**
 * Logging section as written in YAML; converted with convert_logging_config().
 */
struct LoggingSection {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/tmp/imgdrop/logs";
  std::string file_pattern = "imgdrop_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";
  size_t rotation_size_mb = 20;
  size_t max_files = 5;
  bool rotate_at_midnight = true;
};

struct UploaderAppConfig {
  EndpointConfig endpoint;
  TransferTimeouts timeouts;
  RetryConfig retry;
  ChunkedUploadConfig chunked;
  TaskTrackerConfig tasks;
  NotificationSettings notifications;
  DispatcherConfig dispatcher;
  LoggingSection logging;
};

/**
 * The subset of configuration an upload reads at call time.
 */
struct EndpointSettings {
  std::string endpoint_url;
  std::string account_id;
  std::string folder_path;  // Raw comma-separated list
  double compression_quality = 0.0;

  bool complete() const {
    return !endpoint_url.empty() && !account_id.empty();
  }
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_UPLOADER_CONFIG_HPP
