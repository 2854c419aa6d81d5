#pragma once
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

// =============================================================
// bridge_log.hpp
//
// Pluggable logger used by every bridge component.
//  - std::format formatting, only paid for when the level is enabled
//  - file:line prefix for WARN and above (runtime-format macros)
//  - compile-time stripping of low levels via RBRIDGE_LOG_MIN_LEVEL_I
//  - child loggers that prefix a component name ("poll#3", "lifecycle")
//
// Configuration macros (define before including):
//   RBRIDGE_LOG_MIN_LEVEL_I
//       0=trace,1=debug,2=info,3=warn,4=err,5=critical,6=off. Defaults to 0.
//       Macros below this level expand to ((void)0) and do not evaluate args.
//   RBRIDGE_LOG_LOC_MIN_LEVEL_I
//       Lowest level that gets a file:line prefix. Defaults to 3 (warn).
//   RBRIDGE_LOG_DISABLE_MACROS
//       All RBRIDGE_* log macros become no-ops.
// =============================================================

namespace redis_bridge {

struct Logger {
    // spdlog's level names/order.
    enum class Level { trace,
                       debug,
                       info,
                       warn,
                       err,
                       critical,
                       off };
    virtual ~Logger() = default;
    virtual void log(Level lvl, std::string_view msg) noexcept = 0;
    virtual bool should_log(Level lvl) const noexcept { return lvl != Level::off; }
};

std::shared_ptr<Logger> make_null_logger();
std::shared_ptr<Logger> make_clog_logger(Logger::Level min_level = Logger::Level::info,
                                         std::string name = "redis_bridge");
// Forwards to `parent`, prefixing every line with "<component>: ".
std::shared_ptr<Logger> make_child_logger(std::shared_ptr<Logger> parent, std::string component);

// Parses "trace", "debug", "info", "warn", "err"/"error", "critical", "off".
// Unknown names yield `fallback`.
Logger::Level parse_level(std::string_view name, Logger::Level fallback) noexcept;

#ifndef RBRIDGE_LOG_MIN_LEVEL_I
    #define RBRIDGE_LOG_MIN_LEVEL_I 0 /* trace */
#endif

#ifndef RBRIDGE_LOG_LOC_MIN_LEVEL_I
    #define RBRIDGE_LOG_LOC_MIN_LEVEL_I 3 /* warn */
#endif

#define RBRIDGE_LOG_LVL_TRACE 0
#define RBRIDGE_LOG_LVL_DEBUG 1
#define RBRIDGE_LOG_LVL_INFO 2
#define RBRIDGE_LOG_LVL_WARN 3
#define RBRIDGE_LOG_LVL_ERR 4
#define RBRIDGE_LOG_LVL_CRITICAL 5
#define RBRIDGE_LOG_LVL_OFF 6

static_assert(static_cast<int>(Logger::Level::trace) == RBRIDGE_LOG_LVL_TRACE);
static_assert(static_cast<int>(Logger::Level::warn) == RBRIDGE_LOG_LVL_WARN);
static_assert(static_cast<int>(Logger::Level::off) == RBRIDGE_LOG_LVL_OFF);

inline Logger *to_ptr(Logger *p) noexcept { return p; }
inline Logger *to_ptr(const std::shared_ptr<Logger> &sp) noexcept { return sp.get(); }

namespace detail {

inline std::string prefix_location(std::string msg,
                                   Logger::Level lvl,
                                   const std::source_location &loc) {
    if (static_cast<int>(lvl) < RBRIDGE_LOG_LOC_MIN_LEVEL_I)
        return msg;
    std::string_view file = loc.file_name();
    if (auto slash = file.find_last_of('/'); slash != std::string_view::npos)
        file.remove_prefix(slash + 1);
    return std::format("{}:{}: {}", file, loc.line(), msg);
}

// Arguments are bound as lvalues in a tuple so rvalues survive until vformat().
template <class LoggerHolder, class... Args>
inline void logf_rt_pack(LoggerHolder &&holder,
                         Logger::Level lvl,
                         std::string_view fmt,
                         const std::source_location &loc,
                         Args &&...args) noexcept {
    Logger *lg = to_ptr(holder);
    if (!lg || !lg->should_log(lvl))
        return;
    try {
        auto tup = std::forward_as_tuple(std::forward<Args>(args)...);
        std::string msg;
        std::apply([&](auto &...elems) {
            msg = std::vformat(fmt, std::make_format_args(elems...));
        },
                   tup);
        lg->log(lvl, prefix_location(std::move(msg), lvl, loc));
    } catch (const std::exception &e) {
        // Report the broken format string instead of the message itself.
        lg->log(Logger::Level::err, e.what());
    }
}

} // namespace detail

template <class LoggerHolder, class... Args>
inline void logf_rt(LoggerHolder &&holder,
                    Logger::Level lvl,
                    std::string_view fmt,
                    const std::source_location &loc,
                    Args &&...args) noexcept {
    detail::logf_rt_pack(std::forward<LoggerHolder>(holder), lvl, fmt, loc,
                         std::forward<Args>(args)...);
}

#define RBRIDGE_LOG_NOOP_(...) ((void)0)

#ifdef RBRIDGE_LOG_DISABLE_MACROS
    #define RBRIDGE_LOGF_RT(logger, lvl, fmt_sv, ...) ((void)0)
    #define RBRIDGE_TRACE_RT(logger, fmt_sv, ...) ((void)0)
    #define RBRIDGE_DEBUG_RT(logger, fmt_sv, ...) ((void)0)
    #define RBRIDGE_INFO_RT(logger, fmt_sv, ...) ((void)0)
    #define RBRIDGE_WARN_RT(logger, fmt_sv, ...) ((void)0)
    #define RBRIDGE_ERROR_RT(logger, fmt_sv, ...) ((void)0)
    #define RBRIDGE_CRITICAL_RT(logger, fmt_sv, ...) ((void)0)
#else
    #define RBRIDGE_LOGF_RT(logger, lvl, fmt_sv, ...) \
        ::redis_bridge::logf_rt((logger), (lvl), (fmt_sv), std::source_location::current() __VA_OPT__(, __VA_ARGS__))

    #define RBRIDGE_LEVEL_RT_(lvl, logger, fmt_sv, ...) \
        ::redis_bridge::logf_rt((logger), ::redis_bridge::Logger::Level::lvl, (fmt_sv), std::source_location::current() __VA_OPT__(, __VA_ARGS__))

    #if RBRIDGE_LOG_LVL_TRACE >= RBRIDGE_LOG_MIN_LEVEL_I
        #define RBRIDGE_TRACE_RT(logger, fmt_sv, ...) RBRIDGE_LEVEL_RT_(trace, logger, fmt_sv __VA_OPT__(, __VA_ARGS__))
    #else
        #define RBRIDGE_TRACE_RT(logger, fmt_sv, ...) ((void)0)
    #endif

    #if RBRIDGE_LOG_LVL_DEBUG >= RBRIDGE_LOG_MIN_LEVEL_I
        #define RBRIDGE_DEBUG_RT(logger, fmt_sv, ...) RBRIDGE_LEVEL_RT_(debug, logger, fmt_sv __VA_OPT__(, __VA_ARGS__))
    #else
        #define RBRIDGE_DEBUG_RT(logger, fmt_sv, ...) ((void)0)
    #endif

    #if RBRIDGE_LOG_LVL_INFO >= RBRIDGE_LOG_MIN_LEVEL_I
        #define RBRIDGE_INFO_RT(logger, fmt_sv, ...) RBRIDGE_LEVEL_RT_(info, logger, fmt_sv __VA_OPT__(, __VA_ARGS__))
    #else
        #define RBRIDGE_INFO_RT(logger, fmt_sv, ...) ((void)0)
    #endif

    #if RBRIDGE_LOG_LVL_WARN >= RBRIDGE_LOG_MIN_LEVEL_I
        #define RBRIDGE_WARN_RT(logger, fmt_sv, ...) RBRIDGE_LEVEL_RT_(warn, logger, fmt_sv __VA_OPT__(, __VA_ARGS__))
    #else
        #define RBRIDGE_WARN_RT(logger, fmt_sv, ...) ((void)0)
    #endif

    #if RBRIDGE_LOG_LVL_ERR >= RBRIDGE_LOG_MIN_LEVEL_I
        #define RBRIDGE_ERROR_RT(logger, fmt_sv, ...) RBRIDGE_LEVEL_RT_(err, logger, fmt_sv __VA_OPT__(, __VA_ARGS__))
    #else
        #define RBRIDGE_ERROR_RT(logger, fmt_sv, ...) ((void)0)
    #endif

    #if RBRIDGE_LOG_LVL_CRITICAL >= RBRIDGE_LOG_MIN_LEVEL_I
        #define RBRIDGE_CRITICAL_RT(logger, fmt_sv, ...) RBRIDGE_LEVEL_RT_(critical, logger, fmt_sv __VA_OPT__(, __VA_ARGS__))
    #else
        #define RBRIDGE_CRITICAL_RT(logger, fmt_sv, ...) ((void)0)
    #endif
#endif // RBRIDGE_LOG_DISABLE_MACROS

} // namespace redis_bridge
