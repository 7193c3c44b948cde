// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <boost/algorithm/string.hpp>

#include <fstream>

#include <imgdrop_log_init.hpp>

#include "url_utils.hpp"

#define IMGDROP_LOG_COMPONENT "config_parser"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

// ============================================================================
// Link formats
// ============================================================================

std::string linkFormatToString(LinkFormat format) {
  switch (format) {
    case LinkFormat::MARKDOWN:
      return "markdown";
    case LinkFormat::HTML:
      return "html";
    case LinkFormat::BBCODE:
      return "bbcode";
    case LinkFormat::PLAIN:
      return "plain";
    default:
      return "plain";
  }
}

std::optional<LinkFormat> parseLinkFormat(const std::string& value) {
  const std::string lower = boost::algorithm::to_lower_copy(trim(value));
  if (lower == "markdown" || lower == "md") return LinkFormat::MARKDOWN;
  if (lower == "html") return LinkFormat::HTML;
  if (lower == "bbcode") return LinkFormat::BBCODE;
  if (lower == "plain" || lower == "url") return LinkFormat::PLAIN;
  return std::nullopt;
}

std::string formatLink(const std::string& url, LinkFormat format, const std::string& alt) {
  switch (format) {
    case LinkFormat::MARKDOWN:
      return "![" + alt + "](" + url + ")";
    case LinkFormat::HTML:
      return "<img src=\"" + url + "\" alt=\"" + alt + "\">";
    case LinkFormat::BBCODE:
      return "[img]" + url + "[/img]";
    case LinkFormat::PLAIN:
    default:
      return url;
  }
}

// ============================================================================
// Logging bridge
// ============================================================================

void convert_logging_config(
  const LoggingSection& section, ::imgdrop::logging::LoggingConfig& log_config
) {
  using ::imgdrop::logging::parse_severity_level;

  log_config.console_enabled = section.console_enabled;
  log_config.console_colors = section.console_colors;
  if (auto level = parse_severity_level(section.console_level)) {
    log_config.console_level = *level;
  }

  log_config.file_enabled = section.file_enabled;
  if (auto level = parse_severity_level(section.file_level)) {
    log_config.file_level = *level;
  }
  log_config.file_config.directory = section.file_directory;
  log_config.file_config.file_pattern = section.file_pattern;
  log_config.file_config.format_json = boost::algorithm::iequals(section.file_format, "json");
  log_config.file_config.rotation_size_mb = section.rotation_size_mb;
  log_config.file_config.max_files = static_cast<int>(section.max_files);
  log_config.file_config.rotate_at_midnight = section.rotate_at_midnight;
}

// ============================================================================
// ConfigParser
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, UploaderAppConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, UploaderAppConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (node.IsNull()) {
      return true;
    }
    if (!node.IsMap()) {
      last_error_ = "Configuration root must be a mapping";
      return false;
    }

    if (node["endpoint"] && !parse_endpoint(node["endpoint"], config.endpoint)) {
      return false;
    }
    if (node["transfer"] && !parse_transfer(node["transfer"], config)) {
      return false;
    }
    if (node["retry"] && !parse_retry(node["retry"], config.retry)) {
      return false;
    }
    if (node["chunked"] && !parse_chunked(node["chunked"], config.chunked)) {
      return false;
    }
    if (node["tasks"] && !parse_tasks(node["tasks"], config)) {
      return false;
    }
    if (node["notifications"] && !parse_notifications(node["notifications"], config.notifications)) {
      return false;
    }
    if (node["dispatcher"] && !parse_dispatcher(node["dispatcher"], config.dispatcher)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::save_to_file(const std::string& path, const UploaderAppConfig& config) {
  try {
    YAML::Node node;

    node["endpoint"]["url"] = config.endpoint.url;
    node["endpoint"]["account_id"] = config.endpoint.account_id;
    node["endpoint"]["folders"] = boost::algorithm::join(config.endpoint.folders, ",");
    node["endpoint"]["hide_root"] = config.endpoint.hide_root;
    node["endpoint"]["compression_quality"] = config.endpoint.compression_quality;
    node["endpoint"]["link_format"] = linkFormatToString(config.endpoint.link_format);

    node["transfer"]["fetch_timeout_ms"] = static_cast<int64_t>(config.timeouts.fetch.count());
    node["transfer"]["upload_timeout_ms"] = static_cast<int64_t>(config.timeouts.upload.count());
    node["transfer"]["chunk_timeout_ms"] = static_cast<int64_t>(config.timeouts.chunk.count());
    node["transfer"]["probe_timeout_ms"] = static_cast<int64_t>(config.timeouts.probe.count());
    node["transfer"]["max_retries"] = config.retry.max_retries;

    std::ofstream file(path);
    if (!file.good()) {
      last_error_ = "Cannot open config file for writing: " + path;
      return false;
    }
    file << node;
    return true;
  } catch (const std::exception& e) {
    IMGDROP_LOG_ERROR("Failed to save config" << kv("path", path) << kv("error", e.what()));
    last_error_ = e.what();
    return false;
  }
}

bool ConfigParser::parse_endpoint(const YAML::Node& node, EndpointConfig& endpoint) {
  if (!node.IsMap()) {
    last_error_ = "endpoint must be a mapping";
    return false;
  }
  if (node["url"]) {
    endpoint.url = trim(node["url"].as<std::string>());
  }
  if (node["account_id"]) {
    endpoint.account_id = trim(node["account_id"].as<std::string>());
  }
  if (node["folders"]) {
    const auto& folders = node["folders"];
    if (folders.IsSequence()) {
      endpoint.folders.clear();
      for (const auto& folder : folders) {
        const std::string name = trim(folder.as<std::string>());
        if (!name.empty()) {
          endpoint.folders.push_back(name);
        }
      }
    } else if (folders.IsScalar()) {
      endpoint.folders = parseFolderList(folders.as<std::string>());
    }
  }
  if (node["hide_root"]) {
    endpoint.hide_root = node["hide_root"].as<bool>();
  }
  if (node["compression_quality"]) {
    endpoint.compression_quality = node["compression_quality"].as<double>();
  }
  if (node["link_format"]) {
    const std::string value = node["link_format"].as<std::string>();
    auto format = parseLinkFormat(value);
    if (!format) {
      last_error_ = "Unknown link_format: " + value;
      return false;
    }
    endpoint.link_format = *format;
  }
  return true;
}

bool ConfigParser::parse_transfer(const YAML::Node& node, UploaderAppConfig& config) {
  if (node["fetch_timeout_ms"]) {
    config.timeouts.fetch = std::chrono::milliseconds(node["fetch_timeout_ms"].as<int64_t>());
  }
  if (node["upload_timeout_ms"]) {
    config.timeouts.upload = std::chrono::milliseconds(node["upload_timeout_ms"].as<int64_t>());
  }
  if (node["chunk_timeout_ms"]) {
    config.timeouts.chunk = std::chrono::milliseconds(node["chunk_timeout_ms"].as<int64_t>());
  }
  if (node["probe_timeout_ms"]) {
    config.timeouts.probe = std::chrono::milliseconds(node["probe_timeout_ms"].as<int64_t>());
  }
  if (node["max_retries"]) {
    config.retry.max_retries = node["max_retries"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_retry(const YAML::Node& node, RetryConfig& retry) {
  if (node["max_retries"]) {
    retry.max_retries = node["max_retries"].as<int>();
  }
  if (node["initial_delay_ms"]) {
    retry.initial_delay = std::chrono::milliseconds(node["initial_delay_ms"].as<int64_t>());
  }
  if (node["max_delay_ms"]) {
    retry.max_delay = std::chrono::milliseconds(node["max_delay_ms"].as<int64_t>());
  }
  if (node["exponential_base"]) {
    retry.exponential_base = node["exponential_base"].as<double>();
  }
  if (node["jitter_factor"]) {
    retry.jitter_factor = node["jitter_factor"].as<double>();
  }
  if (node["enable_jitter"]) {
    retry.jitter = node["enable_jitter"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_chunked(const YAML::Node& node, ChunkedUploadConfig& chunked) {
  if (node["threshold_bytes"]) {
    chunked.threshold_bytes = node["threshold_bytes"].as<size_t>();
  }
  if (node["chunk_size_bytes"]) {
    chunked.chunk_size = node["chunk_size_bytes"].as<size_t>();
  }
  if (node["max_concurrency"]) {
    chunked.max_concurrency = node["max_concurrency"].as<size_t>();
  }
  if (node["cleanup_after_finalize"]) {
    chunked.cleanup_after_finalize = node["cleanup_after_finalize"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_tasks(const YAML::Node& node, UploaderAppConfig& config) {
  if (node["max_retry_count"]) {
    config.tasks.max_retry_count = node["max_retry_count"].as<int>();
  }
  if (node["retry_interval_ms"]) {
    config.dispatcher.retry_interval =
      std::chrono::milliseconds(node["retry_interval_ms"].as<int64_t>());
  }
  if (node["sweep_interval_s"]) {
    config.tasks.sweep_interval = std::chrono::seconds(node["sweep_interval_s"].as<int64_t>());
  }
  if (node["retention_s"]) {
    config.tasks.retention = std::chrono::seconds(node["retention_s"].as<int64_t>());
  }
  return true;
}

bool ConfigParser::parse_notifications(
  const YAML::Node& node, NotificationSettings& notifications
) {
  auto& coalescer = notifications.coalescer;
  if (node["enabled"]) {
    notifications.enabled = node["enabled"].as<bool>();
  }
  if (node["drain_interval_ms"]) {
    coalescer.drain_interval = std::chrono::milliseconds(node["drain_interval_ms"].as<int64_t>());
  }
  if (node["min_spacing_ms"]) {
    coalescer.min_spacing = std::chrono::milliseconds(node["min_spacing_ms"].as<int64_t>());
  }
  if (node["max_queue_length"]) {
    coalescer.max_queue_length = node["max_queue_length"].as<size_t>();
  }
  if (node["processed_retention_s"]) {
    coalescer.processed_retention =
      std::chrono::seconds(node["processed_retention_s"].as<int64_t>());
  }
  if (node["cleanup_interval_s"]) {
    coalescer.cleanup_interval = std::chrono::seconds(node["cleanup_interval_s"].as<int64_t>());
  }
  return true;
}

bool ConfigParser::parse_dispatcher(const YAML::Node& node, DispatcherConfig& dispatcher) {
  if (node["num_workers"]) {
    dispatcher.num_workers = node["num_workers"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSection& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::validate(const UploaderAppConfig& config, std::string& error_msg) {
  if (config.endpoint.compression_quality < 0.0 || config.endpoint.compression_quality > 1.0) {
    error_msg = "endpoint.compression_quality must be between 0 and 1";
    return false;
  }
  if (!config.endpoint.url.empty() && !parseUrl(formatEndpointUrl(config.endpoint.url))) {
    error_msg = "endpoint.url is not a valid http(s) URL";
    return false;
  }
  if (config.retry.max_retries < 1) {
    error_msg = "max_retries must be at least 1";
    return false;
  }
  if (config.retry.exponential_base < 1.0) {
    error_msg = "retry.exponential_base must be >= 1";
    return false;
  }
  if (config.retry.jitter_factor < 0.0) {
    error_msg = "retry.jitter_factor must not be negative";
    return false;
  }
  if (config.chunked.chunk_size == 0) {
    error_msg = "chunked.chunk_size_bytes must be positive";
    return false;
  }
  if (config.chunked.max_concurrency == 0) {
    error_msg = "chunked.max_concurrency must be positive";
    return false;
  }
  if (config.tasks.max_retry_count < 0) {
    error_msg = "tasks.max_retry_count must not be negative";
    return false;
  }
  if (config.notifications.coalescer.max_queue_length == 0) {
    error_msg = "notifications.max_queue_length must be positive";
    return false;
  }
  if (config.dispatcher.num_workers < 1) {
    error_msg = "dispatcher.num_workers must be at least 1";
    return false;
  }
  return true;
}

// ============================================================================
// ConfigStore
// ============================================================================

ConfigStore::ConfigStore(std::string path, std::chrono::milliseconds ttl)
    : path_(std::move(path))
    , ttl_(ttl) {}

ConfigStore::ConfigStore(const UploaderAppConfig& config)
    : ttl_(kDefaultTtl)
    , config_(config)
    , loaded_at_(Clock::now())
    , stale_(false) {}

EndpointSettings ConfigStore::toSettings(const UploaderAppConfig& config) {
  EndpointSettings settings;
  settings.endpoint_url = config.endpoint.url;
  settings.account_id = config.endpoint.account_id;
  settings.folder_path = boost::algorithm::join(config.endpoint.folders, ",");
  settings.compression_quality = config.endpoint.compression_quality;
  return settings;
}

void ConfigStore::refreshLocked(Clock::time_point now) {
  if (path_.empty()) {
    return;
  }
  const bool expired = !loaded_at_ || now - *loaded_at_ >= ttl_;
  if (!stale_ && !expired) {
    return;
  }

  UploaderAppConfig fresh;
  ConfigParser parser;
  std::string validation_error;
  if (!parser.load_from_file(path_, fresh)) {
    last_error_ = parser.get_last_error();
  } else if (!ConfigParser::validate(fresh, validation_error)) {
    last_error_ = validation_error;
  } else {
    config_ = std::move(fresh);
    last_error_.clear();
  }

  if (!last_error_.empty()) {
    IMGDROP_LOG_WARN(
      "Config reload failed" << kv("path", path_) << kv("error", last_error_)
                             << kv("keeping_previous", config_.has_value())
    );
  }

  // A failed reload is not retried until the next TTL window
  loaded_at_ = now;
  stale_ = false;
}

EndpointSettings ConfigStore::settings(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  refreshLocked(now);
  return config_ ? toSettings(*config_) : EndpointSettings{};
}

UploaderAppConfig ConfigStore::config(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  refreshLocked(now);
  return config_ ? *config_ : UploaderAppConfig{};
}

void ConfigStore::invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  stale_ = true;
}

std::string ConfigStore::lastError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

bool ConfigStore::loaded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.has_value();
}

}  // namespace uploader
}  // namespace imgdrop
