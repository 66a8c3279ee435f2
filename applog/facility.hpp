#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

#include <applog/severity.hpp>

namespace applog {

// source file location information

struct source_location {
    const char* file;
    int line;
    const char* func;
};

constexpr source_location no_source_location{nullptr, 0, nullptr};

using clock_type = std::chrono::system_clock;

// log record handed to sinks; valid only for the duration of the sink call

struct log_entry {
    const char* name;         // facility name
    severity level;           // log message level
    clock_type::time_point time; // time the record was handed to the sink
    source_location location; // source info if provided
    std::string message;      // log message, verbatim
};

using log_sink_t = std::function<void (const log_entry&)>;

// Sink failures are never propagated to the logging call site; they are
// reported through the failure handler instead. The default handler writes
// a notice and the lost message to stderr.

using failure_handler_t = std::function<void (const log_entry&, const char* reason)>;

failure_handler_t failure_handler();
void failure_handler(failure_handler_t handler);

void report_failure(const log_entry& entry, const char* reason);

// `facility_manager` maintains a collection of log facilities

struct facility_record;

class facility_manager {
private:
    mutable std::mutex mgr_mex_;

    std::unordered_map<std::string, std::unique_ptr<facility_record>> tbl_;
    std::atomic<severity> default_level_;
    log_sink_t default_sink_;
    bool configured_;

public:
    facility_manager():
        default_level_(severity::info), default_sink_([](const log_entry&) {}),
        configured_(false) {}

    explicit facility_manager(log_sink_t sink, severity level = severity::info):
        default_level_(level), default_sink_(std::move(sink)), configured_(false) {}

    facility_manager(const facility_manager&) = delete;
    facility_manager& operator=(const facility_manager&) = delete;

    // default level for new facilities
    severity level() const { return default_level_; }

    // set level (and default level) for all facilities
    void level(severity);

    // set sink (and default sink) for all facilities
    void sink(log_sink_t sink);

    // Install level and sink on all facilities, once: returns false without
    // change if already configured, unless `replace` is true.
    bool configure(severity level, log_sink_t sink, bool replace = false);

    bool configured() const;

private:
    friend class facility;

    // retrieve or create facility data
    facility_record* get(const char* name);
};


// typically there will be one facility manager used. It is created and
// given the default configuration on first use, so it is safe to log from
// static initializers in any translation unit; it is never destroyed.

facility_manager& default_manager();

// facility semantics are determined by their `facility_record` data;
// pointers to `facility_record` data provided by a `facility_manager` instance
// have the same lifetime as that instance.

struct facility_record {
    facility_manager* manager;
    std::string name;
    std::atomic<severity> level;

    mutable std::mutex sink_mex;
    log_sink_t sink;
};

// stream class for collecting log record information

class sink_stream: public std::ostream {
    const facility_record* data_;
    severity level_;
    source_location loc_;

public:
    sink_stream(const facility_record* data, severity level):
        std::ostream(new std::stringbuf),
        data_(data), level_(level), loc_(no_source_location)
    {}

    sink_stream():
        std::ostream(nullptr),
        data_(nullptr), level_(severity::info), loc_(no_source_location)
    {}

    sink_stream(sink_stream&& them):
        std::ostream(std::move(them)),
        data_(them.data_), level_(them.level_), loc_(them.loc_)
    {
        rdbuf(them.rdbuf());
        them.rdbuf(nullptr);
    }

    sink_stream(const sink_stream&) = delete;
    sink_stream& operator=(const sink_stream&) = delete;
    sink_stream& operator=(sink_stream&&) = delete;

    void set_location(source_location loc) {
        loc_ = loc;
    }

    // hands the collected record to the facility sink
    ~sink_stream();
};

// `source_location` data is handled especially by `sink_stream`

inline std::ostream& operator<<(std::ostream& out, const source_location& loc) {
    if (auto s = dynamic_cast<sink_stream*>(&out)) {
        s->set_location(loc);
    }
    else {
        // default formatting
        out << loc.file << ':' << loc.line << ' ' << loc.func;
    }
    return out;
}

// `log_test_proxy` is used by the APPLOG macro to test if a `sink_stream` is
// *not* valid

struct log_test_proxy {
    explicit log_test_proxy(sink_stream&& s): stream(std::move(s)) {}
    operator bool() const { return !stream; }
    sink_stream stream;
};

// logging facility

class facility {
    facility_record* data_;

public:
    sink_stream operator()(severity lev) {
        return enabled(lev)? sink_stream(data_, lev): sink_stream();
    }

    // log at info level
    template <typename T>
    sink_stream operator<<(T&& x) {
        sink_stream s = (*this)(severity::info);
        s << std::forward<T>(x);
        return std::move(s);
    }

    explicit facility(const char* name, facility_manager& mgr = default_manager()):
        data_(mgr.get(name)) {}

    facility(const facility&) = default;
    facility& operator=(const facility&) = default;

    const char* name() const { return data_->name.c_str(); }

    severity level() const { return data_->level; }
    void level(severity lev) { data_->level = lev; }

    bool enabled(severity lev) const { return lev>=data_->level; }

    log_sink_t sink() const {
        std::lock_guard<std::mutex> guard(data_->sink_mex);
        return data_->sink;
    }
    void sink(log_sink_t sink) const {
        std::lock_guard<std::mutex> guard(data_->sink_mex);
        data_->sink = std::move(sink);
    }
};

} // namespace applog
