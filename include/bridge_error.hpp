#pragma once
/**
 * @file bridge_error.hpp
 * @brief Error category for connection-level failures and the per-command
 *        error carried inside pipeline/transaction results.
 */

#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace redis_bridge {

enum class errc {
    ok = 0,
    not_connected = 1,
    connect_failed = 2,
    ssl_error = 3,
    protocol_error = 4,
    invalid_argument = 5,
    exec_in_progress = 6,
    subscriber_mode = 7,
    connection_lost = 8,
    internal_error = 9,
    backlog_overflow = 10,
    stopped = 125
};

class error_category : public std::error_category {
  public:
    const char *name() const noexcept override { return "redis_bridge"; }
    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
        case errc::ok:
            return "ok";
        case errc::not_connected:
            return "not connected";
        case errc::connect_failed:
            return "connect failed";
        case errc::ssl_error:
            return "TLS/SSL error";
        case errc::protocol_error:
            return "protocol error";
        case errc::invalid_argument:
            return "invalid argument";
        case errc::exec_in_progress:
            return "exec already in progress on this queue";
        case errc::subscriber_mode:
            return "only (P)SUBSCRIBE / (P)UNSUBSCRIBE / PING / QUIT allowed in this context";
        case errc::connection_lost:
            return "connection lost";
        case errc::internal_error:
            return "internal error";
        case errc::backlog_overflow:
            return "push backlog full, messages dropped";
        case errc::stopped:
            return "operation aborted";
        }
        return "unknown";
    }
};

inline const std::error_category &category() {
    static error_category cat;
    return cat;
}
inline std::error_code make_error(errc e) { return {static_cast<int>(e), category()}; }
inline std::error_code make_error_code(errc e) { return make_error(e); }
inline std::error_code protocol_error() { return make_error(errc::protocol_error); }

/**
 * CommandError
 *
 * Failure of a single command inside a batch. `code` is the leading word of
 * the server's error reply (WRONGTYPE, ERR, EXECABORT, ...), `message` the
 * full text.
 */
struct CommandError {
    std::string code;
    std::string message;

    static CommandError from_reply(std::string_view text) {
        CommandError e;
        e.message = std::string(text);
        auto sp = text.find(' ');
        e.code = std::string(text.substr(0, sp));
        return e;
    }

    bool operator==(const CommandError &) const = default;
};

} // namespace redis_bridge

template <>
struct std::is_error_code_enum<redis_bridge::errc> : std::true_type {};
