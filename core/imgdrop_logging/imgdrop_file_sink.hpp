// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_FILE_SINK_HPP
#define IMGDROP_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "imgdrop_log_severity.hpp"

namespace imgdrop {
namespace logging {

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

struct FileSinkConfig {
  std::string directory = "/tmp/imgdrop/logs";
  std::string file_pattern = "imgdrop_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 20;  // Rotate at 20MB
  bool rotate_at_midnight = true;
  int max_files = 5;
  bool format_json = true;
};

/**
 * Create the rotating file sink.
 * Falls back to /tmp when the configured directory cannot be created.
 *
 * @param config File sink configuration
 * @param min_level Minimum severity level to log
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

}  // namespace logging
}  // namespace imgdrop

#endif  // IMGDROP_FILE_SINK_HPP
