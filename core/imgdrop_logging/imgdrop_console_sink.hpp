// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_CONSOLE_SINK_HPP
#define IMGDROP_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "imgdrop_log_severity.hpp"

namespace imgdrop {
namespace logging {

/**
 * Async console sink. The bounded queue drops records on overflow so a
 * burst of retry warnings never stalls an upload worker.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Create the stderr sink.
 *
 * @param min_level Minimum severity level to log
 * @param use_colors Whether to use ANSI color codes for the level tag
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

}  // namespace logging
}  // namespace imgdrop

#endif  // IMGDROP_CONSOLE_SINK_HPP
