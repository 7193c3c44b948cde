// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_LOG_FORMAT_HPP
#define IMGDROP_LOG_FORMAT_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <string>

namespace imgdrop {
namespace logging {

/**
 * Escape a string for embedding in a JSON string literal (RFC 8259).
 */
std::string escape_json(const std::string& s);

/**
 * "[ts] [LEVEL] message | task_id=... session_id=..."
 * When use_colors is set the level tag is wrapped in ANSI colour codes.
 */
void format_text_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
);

/**
 * One JSON object per record: ts, level, msg, thread_id and the optional
 * task_id / session_id context attributes.
 */
void format_json_record(boost::log::record_view const& rec, boost::log::formatting_ostream& strm);

}  // namespace logging
}  // namespace imgdrop

#endif  // IMGDROP_LOG_FORMAT_HPP
