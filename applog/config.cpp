#include <iostream>

#include <applog/config.hpp>
#include <applog/sinks.hpp>

namespace applog {

bool basic_config(facility_manager& mgr, const config& cfg) {
    log_sink_t sink = cfg.sink? cfg.sink: log_sink_t(stream_sink(std::cerr));
    return mgr.configure(cfg.level, std::move(sink), cfg.force);
}

bool configure() {
    return basic_config(default_manager());
}

} // namespace applog
