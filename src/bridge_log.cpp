#include "bridge_log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

#if defined(__has_include)
    #if __has_include(<syncstream>)
        #include <syncstream>
        #if defined(__cpp_lib_syncbuf) && (__cpp_lib_syncbuf >= 201803L)
            #define RBRIDGE_HAVE_SYNCBUF 1
        #endif
    #endif
#endif

#include <unistd.h>

namespace redis_bridge {
namespace {

struct Sink {
    template <class F>
    void write(F &&f) noexcept {
#if defined(RBRIDGE_HAVE_SYNCBUF)
        std::osyncstream out(std::clog);
        f(out);
#else
        static std::mutex m;
        std::lock_guard<std::mutex> lk(m);
        f(std::clog);
        std::clog.flush();
#endif
    }
};

constexpr std::string_view level_name(Logger::Level l) noexcept {
    switch (l) {
    case Logger::Level::trace:
        return "trace";
    case Logger::Level::debug:
        return "debug";
    case Logger::Level::info:
        return "info";
    case Logger::Level::warn:
        return "warn";
    case Logger::Level::err:
        return "err";
    case Logger::Level::critical:
        return "critical";
    case Logger::Level::off:
        return "off";
    }
    return "unknown";
}

struct NullLogger final : Logger {
    void log(Level, std::string_view) noexcept override {}
    bool should_log(Level) const noexcept override { return false; }
};

struct ClogLogger final : Logger {
    ClogLogger(Level min, std::string name)
        : min_(min), name_(std::move(name)), color_(should_colorize()) {}

    void log(Level lvl, std::string_view msg) noexcept override {
        if (lvl < min_.load(std::memory_order_relaxed))
            return;
        sink_.write([&](std::ostream &out) {
            if (color_) {
                out << '[' << name_ << "] " << color_open(lvl) << '[' << level_name(lvl) << ']'
                    << "\x1b[0m " << msg << '\n';
            } else {
                out << '[' << name_ << "] [" << level_name(lvl) << "] " << msg << '\n';
            }
        });
    }

    bool should_log(Level lvl) const noexcept override {
        return lvl >= min_.load(std::memory_order_relaxed);
    }

    static bool should_colorize() noexcept {
#ifdef RBRIDGE_LOG_FORCE_COLOR
        return true;
#endif
#ifdef RBRIDGE_LOG_DISABLE_COLOR
        return false;
#endif
        if (std::getenv("NO_COLOR"))
            return false;
        const char *term = std::getenv("TERM");
        if (term && std::string_view(term) == "dumb")
            return false;
        return isatty(fileno(stderr)) || isatty(fileno(stdout));
    }

    static constexpr const char *color_open(Level lvl) noexcept {
        switch (lvl) {
        case Level::trace:
            return "\x1b[2m";
        case Level::debug:
            return "\x1b[36m";
        case Level::info:
            return "\x1b[32m";
        case Level::warn:
            return "\x1b[33m";
        case Level::err:
            return "\x1b[31m";
        case Level::critical:
            return "\x1b[1;31m";
        case Level::off:
            break;
        }
        return "";
    }

    Sink sink_;
    std::atomic<Level> min_;
    std::string name_;
    bool color_;
};

struct ChildLogger final : Logger {
    ChildLogger(std::shared_ptr<Logger> parent, std::string component)
        : parent_(std::move(parent)), component_(std::move(component)) {}

    void log(Level lvl, std::string_view msg) noexcept override {
        try {
            std::string line;
            line.reserve(component_.size() + 2 + msg.size());
            line.append(component_).append(": ").append(msg);
            parent_->log(lvl, line);
        } catch (const std::bad_alloc &) {
            parent_->log(lvl, msg);
        }
    }

    bool should_log(Level lvl) const noexcept override { return parent_->should_log(lvl); }

    std::shared_ptr<Logger> parent_;
    std::string component_;
};

} // namespace

std::shared_ptr<Logger> make_null_logger() {
    static auto s = std::make_shared<NullLogger>();
    return s;
}

std::shared_ptr<Logger> make_clog_logger(Logger::Level min_level, std::string name) {
    return std::make_shared<ClogLogger>(min_level, std::move(name));
}

std::shared_ptr<Logger> make_child_logger(std::shared_ptr<Logger> parent, std::string component) {
    if (!parent)
        return make_null_logger();
    return std::make_shared<ChildLogger>(std::move(parent), std::move(component));
}

Logger::Level parse_level(std::string_view name, Logger::Level fallback) noexcept {
    if (name == "trace")
        return Logger::Level::trace;
    if (name == "debug")
        return Logger::Level::debug;
    if (name == "info")
        return Logger::Level::info;
    if (name == "warn" || name == "warning")
        return Logger::Level::warn;
    if (name == "err" || name == "error")
        return Logger::Level::err;
    if (name == "critical")
        return Logger::Level::critical;
    if (name == "off")
        return Logger::Level::off;
    return fallback;
}

} // namespace redis_bridge
