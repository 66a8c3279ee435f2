#include <cstdio>
#include <ctime>

#include <applog/sinks.hpp>

namespace applog {

constexpr const char* stream_sink::separator;

std::string format_timestamp(clock_type::time_point t) {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    std::time_t secs = clock_type::to_time_t(t);
    long ms = static_cast<long>(duration_cast<milliseconds>(t.time_since_epoch()).count()%1000);
    if (ms<0) ms += 1000;

    std::tm local;
    if (!localtime_r(&secs, &local)) {
        return "????-??-?? ??:??:??,???";
    }

    char date[32];
    std::strftime(date, sizeof date, "%Y-%m-%d %H:%M:%S", &local);

    char stamp[40];
    std::snprintf(stamp, sizeof stamp, "%s,%03ld", date, ms);
    return stamp;
}

void stream_sink::set(flag f) {
    switch (f) {
    case flag::flush:
        flush_ = true;
        break;
    case flag::noflush:
        flush_ = false;
        break;
    case flag::emittime:
        emittime_ = true;
        break;
    case flag::noemittime:
        emittime_ = false;
        break;
    case flag::emitlevel:
        emitlevel_ = true;
        break;
    case flag::noemitlevel:
        emitlevel_ = false;
        break;
    case flag::emitloc:
        emitloc_ = true;
        break;
    case flag::noemitloc:
        emitloc_ = false;
        break;
    case flag::emitfac:
        emitfac_ = true;
        break;
    case flag::noemitfac:
        emitfac_ = false;
        break;
    }
}

void stream_sink::operator()(const log_entry& entry) {
    bool failed;
    {
        auto guard = out_->guard();

        format_entry(*out_, entry);
        if (flush_) out_->flush();
        failed = out_->take_failure();
    }

    if (failed) {
        ++*failures_;
        report_failure(entry, "write to log stream failed");
    }
}

void stream_sink::format_entry(std::ostream& o, const log_entry& entry) {
    // emit time and level, then optional facility name and source
    // location, followed by message.

    if (emittime_) {
        format_time(o, entry.time);
    }
    if (emitlevel_) {
        format_level(o, entry.level);
    }
    if (emitfac_) {
        format_facility(o, entry.name);
    }
    if (emitloc_ && entry.location.file!=nullptr) {
        format_location(o, entry.location);
    }
    format_message(o, entry.message);
}

} // namespace applog
