#pragma once

#include <atomic>
#include <cstring>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>

#include <applog/facility.hpp>
#include <applog/locked_ostream.hpp>

namespace applog {

enum class flag {
    flush, noflush, emittime, noemittime, emitlevel, noemitlevel,
    emitloc, noemitloc, emitfac, noemitfac
};

// local time as "YYYY-MM-DD HH:MM:SS,mmm"
std::string format_timestamp(clock_type::time_point t);

// Renders each entry as one line,
//     <timestamp> - <LEVEL> - <message>
// and writes it to the buffer of the supplied stream. Write failures are
// counted and passed to `report_failure`; they never reach the caller.

class stream_sink {
public:
    explicit stream_sink(std::ostream& o):
        out_(std::make_shared<locked_ostream>(o.rdbuf())),
        failures_(std::make_shared<std::atomic<unsigned long>>(0))
    {
        out_->copyfmt(o);
        out_->exceptions(std::ios_base::goodbit);
    }

    template <typename... Flags>
    explicit stream_sink(std::ostream& o, Flags... flags): stream_sink(o) {
        flag fs[] = {flags...};
        for (auto f: fs) {
            set(f);
        }
    }

    virtual ~stream_sink() = default;

    void set(flag f);

    void operator()(const log_entry& entry);

    // number of entries that could not be written, shared between copies
    unsigned long failures() const { return *failures_; }

    static const char* basename(const char* path) {
        const char* slash = std::strrchr(path, '/');
        return slash? slash+1: path;
    }

private:
    std::shared_ptr<locked_ostream> out_;
    std::shared_ptr<std::atomic<unsigned long>> failures_;
    bool flush_ = true;

protected:
    bool emittime_ = true;
    bool emitlevel_ = true;
    bool emitloc_ = false;
    bool emitfac_ = false;

    static constexpr const char* separator = " - ";

    virtual void format_entry(std::ostream& o, const log_entry& entry);

    virtual void format_time(std::ostream& o, clock_type::time_point t) {
        o << format_timestamp(t) << separator;
    }

    virtual void format_level(std::ostream& o, severity level) {
        o << level << separator;
    }

    virtual void format_facility(std::ostream& o, const char* name) {
        o << name << separator;
    }

    virtual void format_location(std::ostream& o, source_location loc) {
        o << basename(loc.file) << ':' << loc.line << ' ' << loc.func << separator;
    }

    virtual void format_message(std::ostream& o, const std::string& msg) {
        o.write(msg.data(), static_cast<std::streamsize>(msg.size()));
        o << '\n';
    }
};

// stream_sink appending to a file; if the file cannot be opened, every
// write is reported as a failure.

class file_sink: public stream_sink {
    std::shared_ptr<std::ofstream> file_;

    template <typename... Flags>
    file_sink(std::shared_ptr<std::ofstream> file, Flags... flags):
        stream_sink(*file, flags...), file_(std::move(file))
    {}

public:
    template <typename... Flags>
    explicit file_sink(const std::string& filepath, Flags... flags):
        file_sink(std::make_shared<std::ofstream>(filepath, std::ios::out|std::ios::app), flags...)
    {}

    bool is_open() const { return file_->is_open(); }
};

} // namespace applog
