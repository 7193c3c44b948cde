// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_LOG_MACROS_HPP
#define IMGDROP_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/attribute_set.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/unique_identifier_name.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

#include "imgdrop_log_severity.hpp"

namespace imgdrop {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger, defined in imgdrop_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key-value field for structured log lines.
 * Usage: IMGDROP_LOG_INFO("chunk uploaded" << kv("index", i));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << (value ? value : "") << "\"";
  return oss.str();
}

/**
 * Adds TaskID/SessionID thread attributes for the lifetime of the object.
 * Empty ids are not attached; an id already set by an enclosing scope is kept.
 */
class ScopedLogContext {
public:
  ScopedLogContext(const std::string& task_id, const std::string& session_id) {
    task_ = attach("TaskID", task_id);
    session_ = attach("SessionID", session_id);
  }

  ~ScopedLogContext() {
    detach(session_);
    detach(task_);
  }

  ScopedLogContext(const ScopedLogContext&) = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

private:
  typedef std::pair<boost::log::attribute_set::iterator, bool> slot_type;

  static slot_type attach(const char* name, const std::string& value) {
    if (value.empty()) {
      return slot_type(boost::log::attribute_set::iterator(), false);
    }
    return boost::log::core::get()->add_thread_attribute(
      name, boost::log::attributes::constant<std::string>(value)
    );
  }

  static void detach(const slot_type& slot) {
    if (slot.second) {
      boost::log::core::get()->remove_thread_attribute(slot.first);
    }
  }

  slot_type task_;
  slot_type session_;
};

}  // namespace logging
}  // namespace imgdrop

// Each translation unit names itself before including this header:
//   #define IMGDROP_LOG_COMPONENT "chunked_upload"
//   #include <imgdrop_log_macros.hpp>
#ifndef IMGDROP_LOG_COMPONENT
#define IMGDROP_LOG_COMPONENT "imgdrop"
#endif

#ifdef NDEBUG
#define IMGDROP_LOG_ENABLE_DEBUG 0
#else
#define IMGDROP_LOG_ENABLE_DEBUG 1
#endif

#define IMGDROP_LOG_SEV_(level, msg)                                                       \
  do {                                                                                     \
    BOOST_LOG_SEV(::imgdrop::logging::get_logger(), ::imgdrop::logging::severity_level::level) \
      << "[" << IMGDROP_LOG_COMPONENT << "] " << msg;                                      \
  } while (0)

#define IMGDROP_LOG_DEBUG(msg)        \
  do {                                \
    if (IMGDROP_LOG_ENABLE_DEBUG) {   \
      IMGDROP_LOG_SEV_(debug, msg);   \
    }                                 \
  } while (0)

#define IMGDROP_LOG_INFO(msg) IMGDROP_LOG_SEV_(info, msg)
#define IMGDROP_LOG_WARN(msg) IMGDROP_LOG_SEV_(warn, msg)
#define IMGDROP_LOG_ERROR(msg) IMGDROP_LOG_SEV_(error, msg)
#define IMGDROP_LOG_FATAL(msg) IMGDROP_LOG_SEV_(fatal, msg)

// Attaches task and chunk-session ids to every record emitted in the enclosing scope.
#define IMGDROP_LOG_SCOPED_CONTEXT(task_id_val, session_id_val) \
  ::imgdrop::logging::ScopedLogContext BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_imgdrop_log_ctx_)( \
    task_id_val, session_id_val                                                          \
  )

// Logs the 1st, (n+1)th, (2n+1)th ... occurrence at a call site.
#define IMGDROP_LOG_EVERY_N_(level, n, msg)                       \
  do {                                                            \
    static std::atomic<uint64_t> _imgdrop_log_counter{0};         \
    if ((++_imgdrop_log_counter % (n)) == 1 || (n) == 1) {        \
      IMGDROP_LOG_##level(msg);                                   \
    }                                                             \
  } while (0)

#define IMGDROP_LOG_DEBUG_EVERY_N(n, msg) IMGDROP_LOG_EVERY_N_(DEBUG, n, msg)
#define IMGDROP_LOG_INFO_EVERY_N(n, msg) IMGDROP_LOG_EVERY_N_(INFO, n, msg)
#define IMGDROP_LOG_WARN_EVERY_N(n, msg) IMGDROP_LOG_EVERY_N_(WARN, n, msg)
#define IMGDROP_LOG_ERROR_EVERY_N(n, msg) IMGDROP_LOG_EVERY_N_(ERROR, n, msg)

// Logs at most once per interval_sec at a call site.
#define IMGDROP_LOG_THROTTLE_(level, interval_sec, msg)                                        \
  do {                                                                                         \
    static std::chrono::steady_clock::time_point _imgdrop_last_log_time{};                     \
    static std::mutex _imgdrop_throttle_mutex;                                                 \
    auto _imgdrop_now = std::chrono::steady_clock::now();                                      \
    bool _imgdrop_should_log = false;                                                          \
    {                                                                                          \
      std::lock_guard<std::mutex> _imgdrop_lock(_imgdrop_throttle_mutex);                      \
      if (_imgdrop_now - _imgdrop_last_log_time >= std::chrono::duration<double>(interval_sec)) { \
        _imgdrop_last_log_time = _imgdrop_now;                                                 \
        _imgdrop_should_log = true;                                                            \
      }                                                                                        \
    }                                                                                          \
    if (_imgdrop_should_log) {                                                                 \
      IMGDROP_LOG_##level(msg);                                                                \
    }                                                                                          \
  } while (0)

#define IMGDROP_LOG_DEBUG_THROTTLE(sec, msg) IMGDROP_LOG_THROTTLE_(DEBUG, sec, msg)
#define IMGDROP_LOG_INFO_THROTTLE(sec, msg) IMGDROP_LOG_THROTTLE_(INFO, sec, msg)
#define IMGDROP_LOG_WARN_THROTTLE(sec, msg) IMGDROP_LOG_THROTTLE_(WARN, sec, msg)
#define IMGDROP_LOG_ERROR_THROTTLE(sec, msg) IMGDROP_LOG_THROTTLE_(ERROR, sec, msg)

#endif  // IMGDROP_LOG_MACROS_HPP
