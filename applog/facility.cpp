#include <cstdio>
#include <exception>

#include <applog/facility.hpp>

using mex_guard = std::lock_guard<std::mutex>;

namespace applog {

namespace {

void stderr_failure_handler(const log_entry& entry, const char* reason) {
    std::fprintf(stderr, "--- logging error: %s ---\n", reason? reason: "unknown");
    std::fprintf(stderr, "%s - ", level_name(entry.level).c_str());
    std::fwrite(entry.message.data(), 1, entry.message.size(), stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

std::mutex& failure_mex() {
    static std::mutex mex;
    return mex;
}

failure_handler_t& failure_handler_ref() {
    static failure_handler_t handler(stderr_failure_handler);
    return handler;
}

} // anonymous namespace

failure_handler_t failure_handler() {
    mex_guard guard(failure_mex());
    return failure_handler_ref();
}

void failure_handler(failure_handler_t handler) {
    mex_guard guard(failure_mex());
    failure_handler_ref() = handler? std::move(handler): failure_handler_t(stderr_failure_handler);
}

void report_failure(const log_entry& entry, const char* reason) {
    failure_handler_t handler = failure_handler();

    // a broken handler falls back to stderr
    try {
        handler(entry, reason);
    }
    catch (const std::exception& e) {
        stderr_failure_handler(entry, e.what());
    }
    catch (...) {
        stderr_failure_handler(entry, "failure handler threw a non-standard exception");
    }
}

facility_record* facility_manager::get(const char* name) {
    mex_guard guard(mgr_mex_);

    auto i = tbl_.find(name);
    if (i!=tbl_.end()) {
        return (i->second).get();
    }
    else {
        std::unique_ptr<facility_record> rec(new facility_record);
        rec->manager = this;
        rec->name = name;
        rec->level.store(default_level_);
        rec->sink = default_sink_;

        auto ptr = rec.get();
        tbl_.insert(std::make_pair(std::string(name), std::move(rec)));
        return ptr;
    }
}

void facility_manager::level(severity level) {
    mex_guard guard(mgr_mex_);

    default_level_ = level;
    for (auto& entry: tbl_) {
        entry.second->level = level;
    }
}

void facility_manager::sink(log_sink_t sink) {
    mex_guard guard(mgr_mex_);

    default_sink_ = sink;
    for (auto& entry: tbl_) {
        mex_guard sink_guard(entry.second->sink_mex);
        entry.second->sink = sink;
    }
}

bool facility_manager::configure(severity level, log_sink_t sink, bool replace) {
    {
        mex_guard guard(mgr_mex_);
        if (configured_ && !replace) return false;
        configured_ = true;
    }

    this->level(level);
    this->sink(std::move(sink));
    return true;
}

bool facility_manager::configured() const {
    mex_guard guard(mgr_mex_);
    return configured_;
}

sink_stream::~sink_stream() {
    std::stringbuf *buf = dynamic_cast<std::stringbuf*>(rdbuf());
    if (buf && data_) {
        log_sink_t sink;
        {
            mex_guard guard(data_->sink_mex);
            sink = data_->sink;
        }

        log_entry entry{data_->name.c_str(), level_, clock_type::now(), loc_, buf->str()};
        if (sink) {
            try {
                sink(entry);
            }
            catch (const std::exception& e) {
                report_failure(entry, e.what());
            }
            catch (...) {
                report_failure(entry, "sink threw a non-standard exception");
            }
        }
    }
    delete buf;
}

} // namespace applog
