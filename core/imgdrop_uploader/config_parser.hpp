// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_CONFIG_PARSER_HPP
#define IMGDROP_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "uploader_config.hpp"

namespace imgdrop {
namespace logging {
struct LoggingConfig;
}
}  // namespace imgdrop

namespace imgdrop {
namespace uploader {

/**
 * Convert the YAML logging section to imgdrop::logging::LoggingConfig.
 * Unknown level names keep the library defaults.
 */
void convert_logging_config(const LoggingSection& section, ::imgdrop::logging::LoggingConfig& log_config);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, UploaderAppConfig& config);

  /**
   * Load configuration from YAML string. Absent keys keep their defaults.
   */
  bool load_from_string(const std::string& yaml_content, UploaderAppConfig& config);

  /**
   * Write the endpoint and transfer sections back to a file
   */
  bool save_to_file(const std::string& path, const UploaderAppConfig& config);

  static bool validate(const UploaderAppConfig& config, std::string& error_msg);

  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_endpoint(const YAML::Node& node, EndpointConfig& endpoint);
  bool parse_transfer(const YAML::Node& node, UploaderAppConfig& config);
  bool parse_retry(const YAML::Node& node, RetryConfig& retry);
  bool parse_chunked(const YAML::Node& node, ChunkedUploadConfig& chunked);
  bool parse_tasks(const YAML::Node& node, UploaderAppConfig& config);
  bool parse_notifications(const YAML::Node& node, NotificationSettings& notifications);
  bool parse_dispatcher(const YAML::Node& node, DispatcherConfig& dispatcher);
  bool parse_logging(const YAML::Node& node, LoggingSection& logging);

  mutable std::string last_error_;
};

/**
 * Read-through cache of the endpoint settings backed by a YAML file.
 *
 * A copy older than the TTL is re-read on the next access; a reload that
 * fails keeps serving the previous settings.
 */
class ConfigStore {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr std::chrono::minutes kDefaultTtl{5};

  explicit ConfigStore(std::string path, std::chrono::milliseconds ttl = kDefaultTtl);

  /**
   * Fixed settings without a backing file. Never reloads.
   */
  explicit ConfigStore(const UploaderAppConfig& config);

  EndpointSettings settings(Clock::time_point now = Clock::now());

  /**
   * Full configuration as of the last successful load.
   */
  UploaderAppConfig config(Clock::time_point now = Clock::now());

  void invalidate();

  /**
   * Error of the most recent failed load, empty if the last load succeeded.
   */
  std::string lastError() const;

  bool loaded() const;

  static EndpointSettings toSettings(const UploaderAppConfig& config);

private:
  void refreshLocked(Clock::time_point now);

  std::string path_;
  std::chrono::milliseconds ttl_;
  mutable std::mutex mutex_;
  std::optional<UploaderAppConfig> config_;
  std::optional<Clock::time_point> loaded_at_;
  bool stale_ = true;
  std::string last_error_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_CONFIG_PARSER_HPP
