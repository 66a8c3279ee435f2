#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace applog {

// An ostream over a shared stream buffer. All `locked_ostream` objects
// wrapping the same buffer share one mutex, so lines written under
// `guard()` do not interleave across sinks or threads.

struct locked_ostream: std::ostream {
    explicit locked_ostream(std::streambuf *b): std::ostream(b) {
        mex = register_sbuf(b);
    }

    ~locked_ostream() {
        mex.reset();
        deregister_sbuf(rdbuf());
    }

    std::unique_lock<std::mutex> guard() {
        return std::unique_lock<std::mutex>(*mex);
    }

    // clear any error state left by the last write; true if there was one
    bool take_failure() {
        bool failed = !good();
        clear();
        return failed;
    }

    std::shared_ptr<std::mutex> mex;

private:
    using tbl_type = std::unordered_map<std::streambuf*, std::weak_ptr<std::mutex>>;
    static tbl_type& mex_tbl() {
        static tbl_type tbl;
        return tbl;
    }

    static std::mutex& mex_tbl_mex() {
        static std::mutex mex;
        return mex;
    }

    static std::shared_ptr<std::mutex> register_sbuf(std::streambuf* b) {
        std::lock_guard<std::mutex> g(mex_tbl_mex());
        auto& wptr = mex_tbl()[b];
        auto mex = wptr.lock();
        if (!mex) {
            mex = std::make_shared<std::mutex>();
            wptr = mex;
        }
        return mex;
    }

    static void deregister_sbuf(std::streambuf* b) {
        std::lock_guard<std::mutex> g(mex_tbl_mex());
        auto i = mex_tbl().find(b);
        if (i!=mex_tbl().end() && i->second.expired()) {
            mex_tbl().erase(i);
        }
    }
};

} // namespace applog
