#pragma once

#include <string>

#include <applog/config.hpp>
#include <applog/facility.hpp>
#include <applog/severity.hpp>
#include <applog/sinks.hpp>

namespace applog {

// the 'root' facility of default_manager(), used by the log_* functions
// and APPLOG(n)

facility& root();

// Emit one record with `message`, verbatim, if `lev` passes the facility
// threshold. The record has been handed to the sink when the call returns.

inline void log_message(facility& fac, severity lev, const std::string& message) {
    if (!fac.enabled(lev)) return;

    sink_stream s = fac(lev);
    s << message;
}

inline void log_message(severity lev, const std::string& message) {
    log_message(root(), lev, message);
}

inline void log_debug(facility& fac, const std::string& message) { log_message(fac, severity::debug, message); }
inline void log_info(facility& fac, const std::string& message) { log_message(fac, severity::info, message); }
inline void log_warning(facility& fac, const std::string& message) { log_message(fac, severity::warning, message); }
inline void log_error(facility& fac, const std::string& message) { log_message(fac, severity::error, message); }
inline void log_critical(facility& fac, const std::string& message) { log_message(fac, severity::critical, message); }

inline void log_debug(const std::string& message) { log_debug(root(), message); }
inline void log_info(const std::string& message) { log_info(root(), message); }
inline void log_warning(const std::string& message) { log_warning(root(), message); }
inline void log_error(const std::string& message) { log_error(root(), message); }
inline void log_critical(const std::string& message) { log_critical(root(), message); }

// source location wrapper

#define APPLOG_LOC ::applog::source_location{__FILE__, __LINE__, __PRETTY_FUNCTION__}

// macro wrappers for logging facilities

#define APPLOG2(fac, n) if (auto applog_magic_reserved_temp_ = ::applog::log_test_proxy(::applog::facility(fac)(n))) ; else applog_magic_reserved_temp_.stream << APPLOG_LOC
#define APPLOG1(n) APPLOG2(::applog::root(), n)

#define APPLOG_SELECT(_0, _1, _2, ...) _2
#define APPLOG(...) APPLOG_SELECT(__VA_ARGS__, APPLOG2, APPLOG1)(__VA_ARGS__)

} // namespace applog
