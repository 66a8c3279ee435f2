#pragma once

#include <string>

#include <applog/facility.hpp>
#include <applog/severity.hpp>

namespace applog {

// one-time logger configuration

struct config {
    severity level;  // threshold: records below this level are dropped
    log_sink_t sink; // empty: stream_sink on std::cerr
    bool force;      // replace an existing configuration

    config(): level(severity::info), force(false) {}

    explicit config(severity lev, log_sink_t s = log_sink_t(), bool f = false):
        level(lev), sink(std::move(s)), force(f) {}

    // threshold given by name or number, as accepted by parse_severity
    explicit config(const std::string& lev, log_sink_t s = log_sink_t(), bool f = false):
        level(parse_severity(lev)), sink(std::move(s)), force(f) {}
};

// Installs `cfg` on `mgr` if it has not been configured before (or if
// `cfg.force` is set). Returns true if the configuration was applied.
// Only ever installs a single sink, so repeated calls cannot duplicate output.
bool basic_config(facility_manager& mgr, const config& cfg = config());

// basic_config on default_manager() with the defaults: INFO threshold,
// timestamped lines to stderr. Applied when default_manager() is first used,
// so later calls return false.
bool configure();

} // namespace applog
