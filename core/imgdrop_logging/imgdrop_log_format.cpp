// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "imgdrop_log_format.hpp"

#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>

#include <cstdio>

#include "imgdrop_log_severity.hpp"

namespace imgdrop {
namespace logging {

namespace expr = boost::log::expressions;

namespace {

const char* level_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
  }
  return "";
}

constexpr const char* kResetColor = "\033[0m";

void write_timestamp(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (time_stamp) {
    strm << *time_stamp;
  }
}

}  // namespace

std::string escape_json(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\b':
        result += "\\b";
        break;
      case '\f':
        result += "\\f";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          result += buf;
        } else {
          result += static_cast<char>(c);
        }
    }
  }
  return result;
}

void format_text_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  strm << "[";
  write_timestamp(rec, strm);
  strm << "] ";

  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    if (use_colors) {
      strm << level_color(*sev) << "[" << *sev << "]" << kResetColor << " ";
    } else {
      strm << "[" << *sev << "] ";
    }
  }

  strm << rec[expr::smessage];

  auto task_id = boost::log::extract<std::string>("TaskID", rec);
  auto session_id = boost::log::extract<std::string>("SessionID", rec);
  if (task_id || session_id) {
    strm << " |";
    if (task_id) strm << " task_id=" << *task_id;
    if (session_id) strm << " session_id=" << *session_id;
  }
}

void format_json_record(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  write_timestamp(rec, strm);
  strm << "\",\"level\":\"";
  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    strm << *sev;
  }
  strm << "\",";

  auto message = rec[expr::smessage];
  strm << "\"msg\":\"" << escape_json(message ? message.get() : std::string()) << "\"";

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    strm << ",\"thread_id\":\"" << *thread_id << "\"";
  }

  auto task_id = boost::log::extract<std::string>("TaskID", rec);
  if (task_id) {
    strm << ",\"task_id\":\"" << escape_json(*task_id) << "\"";
  }
  auto session_id = boost::log::extract<std::string>("SessionID", rec);
  if (session_id) {
    strm << ",\"session_id\":\"" << escape_json(*session_id) << "\"";
  }

  strm << "}";
}

}  // namespace logging
}  // namespace imgdrop
