#pragma once
/**
 * @file bridge_config.hpp
 * @brief Option structs for connections and for the bridge runtime.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace redis_bridge {

/**
 * TLSOptions
 *
 * Configuration options for TLS connections. All file-path entries are optional.
 */
struct TLSOptions {
    bool use_tls{false};
    std::string ca_file;   // PEM bundle filename
    std::string ca_path;   // CA directory
    std::string cert_file; // client cert
    std::string key_file;  // client key
    bool verify_peer{true};
};

/**
 * ConnectOptions
 *
 * How a single server connection connects, authenticates and reconnects.
 */
struct ConnectOptions {
    std::string host{"127.0.0.1"};
    uint16_t port{6379};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds reconnect_initial{std::chrono::milliseconds(200)};
    std::chrono::milliseconds reconnect_max{std::chrono::seconds(10)};
    std::chrono::milliseconds keepalive_period{std::chrono::seconds(60)};
    std::chrono::milliseconds keepalive_jitter{std::chrono::seconds(15)};
    TLSOptions tls{};
    std::optional<std::string> username;    // if only password is present -> AUTH default <pwd>
    std::optional<std::string> password;
    std::optional<std::string> client_name; // sent via HELLO SETNAME
    std::size_t max_backlog{1024};          // buffered pushes per connection
};

enum class DispatchMode {
    attributed, // server sends one push per matching subscription, pattern pushes are tagged
    fan_out     // one push per publish, matched locally against every subscription
};

/**
 * PollOptions
 *
 * Tuning for the per-connection poll loop.
 */
struct PollOptions {
    std::chrono::milliseconds poll_timeout{100};
    std::size_t failure_threshold{3};
    std::chrono::milliseconds retry_initial{100};
    std::chrono::milliseconds retry_max{std::chrono::seconds(2)};
};

struct BridgeOptions {
    ConnectOptions connection{};
    PollOptions poll{};
    // Upper bound on waiting for a retired worker before its connection is closed anyway.
    std::chrono::milliseconds retire_timeout{std::chrono::seconds(2)};
    // Delay between attempts when a lost subscription connection cannot be rebuilt.
    std::chrono::milliseconds rebuild_backoff_initial{std::chrono::milliseconds(200)};
    std::chrono::milliseconds rebuild_backoff_max{std::chrono::seconds(10)};
    DispatchMode dispatch_mode{DispatchMode::attributed};
    bool strict_subscriber_mode{false};
    // Appended to connection.client_name for the two connection roles.
    std::string subscriber_name_suffix{"-sub"};
    std::string publisher_name_suffix{"-pub"};
};

std::string_view to_string(DispatchMode m) noexcept;
std::optional<DispatchMode> parse_dispatch_mode(std::string_view s) noexcept;

// REDIS_HOST, REDIS_PORT, REDIS_USER, REDIS_PASS, REDIS_NAME, REDIS_TLS,
// REDIS_TLS_VERIFY, REDIS_CAFILE, REDIS_CAPATH, REDIS_CERT, REDIS_KEY.
ConnectOptions connect_options_from_env();

// connect_options_from_env() plus RBRIDGE_POLL_TIMEOUT_MS and RBRIDGE_DISPATCH_MODE.
BridgeOptions bridge_options_from_env();

} // namespace redis_bridge
