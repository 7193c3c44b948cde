// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "imgdrop_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

#include "imgdrop_log_format.hpp"

namespace imgdrop {
namespace logging {

namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

std::string prepare_directory(const std::string& directory) {
  boost::filesystem::path dir_path(directory);
  if (boost::filesystem::exists(dir_path)) {
    return directory;
  }

  boost::system::error_code ec;
  boost::filesystem::create_directories(dir_path, ec);
  if (ec) {
    // Logging is not up yet, so stderr is the only channel
    std::cerr << "[imgdrop_logging] Could not create log directory '" << directory
              << "': " << ec.message() << ". Using /tmp\n";
    return "/tmp";
  }
  return directory;
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  const std::string log_directory = prepare_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = log_directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );

  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }

  backend->set_file_collector(sinks::file::make_collector(
    keywords::target = log_directory, keywords::max_files = config.max_files
  ));
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (config.format_json) {
    sink->set_formatter(&format_json_record);
  } else {
    sink->set_formatter(
      [](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
        format_text_record(rec, strm, false);
      }
    );
  }
  return sink;
}

}  // namespace logging
}  // namespace imgdrop
