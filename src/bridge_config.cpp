#include "bridge_config.hpp"

#include <charconv>
#include <cstdlib>

namespace redis_bridge {
namespace {

template <class T>
std::optional<T> env_number(const char *name) {
    const char *v = std::getenv(name);
    if (!v || !*v)
        return std::nullopt;
    std::string_view sv(v);
    T out{};
    auto [p, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    if (ec != std::errc{} || p != sv.data() + sv.size())
        return std::nullopt;
    return out;
}

} // namespace

std::string_view to_string(DispatchMode m) noexcept {
    switch (m) {
    case DispatchMode::attributed:
        return "attributed";
    case DispatchMode::fan_out:
        return "fan_out";
    }
    return "unknown";
}

std::optional<DispatchMode> parse_dispatch_mode(std::string_view s) noexcept {
    if (s == "attributed")
        return DispatchMode::attributed;
    if (s == "fan_out" || s == "fanout" || s == "fan-out")
        return DispatchMode::fan_out;
    return std::nullopt;
}

ConnectOptions connect_options_from_env() {
    ConnectOptions o;
    if (const char *h = std::getenv("REDIS_HOST"))
        o.host = h;
    if (auto p = env_number<uint16_t>("REDIS_PORT"))
        o.port = *p;
    if (const char *u = std::getenv("REDIS_USER"))
        o.username = std::string(u);
    if (const char *pw = std::getenv("REDIS_PASS"))
        o.password = std::string(pw);
    if (const char *nm = std::getenv("REDIS_NAME"))
        o.client_name = std::string(nm);
    if (const char *t = std::getenv("REDIS_TLS"))
        o.tls.use_tls = (*t == '1');
    if (const char *vf = std::getenv("REDIS_TLS_VERIFY"))
        o.tls.verify_peer = (*vf != '0');
    if (const char *ca = std::getenv("REDIS_CAFILE"))
        o.tls.ca_file = ca;
    if (const char *cp = std::getenv("REDIS_CAPATH"))
        o.tls.ca_path = cp;
    if (const char *cf = std::getenv("REDIS_CERT"))
        o.tls.cert_file = cf;
    if (const char *kf = std::getenv("REDIS_KEY"))
        o.tls.key_file = kf;
    return o;
}

BridgeOptions bridge_options_from_env() {
    BridgeOptions b;
    b.connection = connect_options_from_env();
    if (auto ms = env_number<long long>("RBRIDGE_POLL_TIMEOUT_MS"); ms && *ms > 0)
        b.poll.poll_timeout = std::chrono::milliseconds(*ms);
    if (const char *m = std::getenv("RBRIDGE_DISPATCH_MODE")) {
        if (auto mode = parse_dispatch_mode(m))
            b.dispatch_mode = *mode;
    }
    return b;
}

} // namespace redis_bridge
