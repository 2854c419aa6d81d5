#pragma once
/**
 * @file kv_client.hpp
 * @brief Boundary to the underlying key-value client: one connection with a
 *        subscription set fixed at creation, request/response execution,
 *        a pull-style pub/sub receive and a batched-command primitive.
 */

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

#include "redis_value.hpp"

namespace redis_bridge {

enum class SubscriptionKind { exact,
                              pattern };

/**
 * Subscription
 *
 * Exact(channel) or Pattern(glob).
 */
struct Subscription {
    SubscriptionKind kind{SubscriptionKind::exact};
    std::string name;

    static Subscription exact(std::string channel) { return {SubscriptionKind::exact, std::move(channel)}; }
    static Subscription pattern(std::string glob) { return {SubscriptionKind::pattern, std::move(glob)}; }

    bool operator==(const Subscription &) const = default;
};

struct Subscriptions {
    std::set<std::string> channels;
    std::set<std::string> patterns;

    bool empty() const noexcept { return channels.empty() && patterns.empty(); }
    std::size_t size() const noexcept { return channels.size() + patterns.size(); }
    bool operator==(const Subscriptions &) const = default;
};

/**
 * PublishMessage
 *
 * A pub/sub message delivered from the server. For pattern-based deliveries
 * `pattern` names the subscription that matched.
 */
struct PublishMessage {
    std::string channel;
    std::string payload;
    std::optional<std::string> pattern;

    bool operator==(const PublishMessage &) const = default;
};

struct QueuedCommand {
    std::string name;
    std::vector<std::string> args;

    std::vector<std::string> argv() const {
        std::vector<std::string> out;
        out.reserve(args.size() + 1);
        out.push_back(name);
        out.insert(out.end(), args.begin(), args.end());
        return out;
    }
};

// Key -> opaque token captured at WATCH time.
using WatchToken = std::uint64_t;
using WatchSet = std::map<std::string, WatchToken>;

struct BatchRequest {
    std::vector<QueuedCommand> commands;
    bool atomic{false}; // MULTI/EXEC
    WatchSet watched;   // only consulted when atomic
};

// One raw reply per command (error replies included), or nullopt when an
// atomic batch was aborted by a watched key.
using BatchReply = std::optional<std::vector<RedisValue>>;

/**
 * KvClient
 *
 * Coroutine interface of one underlying connection. Operations may be awaited
 * from any executor; completions resume on the awaiting coroutine's executor.
 */
class KvClient {
  public:
    virtual ~KvClient() = default;

    // Resolves once the connection is usable and every fixed subscription is acknowledged.
    virtual boost::asio::awaitable<std::error_code> connect() = 0;
    virtual void close() noexcept = 0;
    virtual bool is_connected() const noexcept = 0;
    virtual const Subscriptions &subscriptions() const noexcept = 0;

    virtual boost::asio::awaitable<std::tuple<std::error_code, RedisValue>>
    execute(std::vector<std::string> argv) = 0;

    virtual boost::asio::awaitable<std::tuple<std::error_code, BatchReply>>
    execute_batch(BatchRequest request) = 0;

    // nullopt with a clear error_code means the timeout elapsed.
    virtual boost::asio::awaitable<std::tuple<std::error_code, std::optional<PublishMessage>>>
    next_message(std::chrono::milliseconds timeout) = 0;

    virtual boost::asio::awaitable<std::tuple<std::error_code, WatchSet>>
    watch(std::vector<std::string> keys) = 0;

    virtual boost::asio::awaitable<std::error_code> unwatch() = 0;

    // False when any watched key is known to have changed since its token was taken.
    virtual bool watch_intact(const WatchSet &watched) const noexcept = 0;

    // Pushes discarded so far because the receive backlog was full.
    virtual std::uint64_t dropped() const noexcept = 0;
};

class KvClientFactory {
  public:
    virtual ~KvClientFactory() = default;
    virtual std::shared_ptr<KvClient> create(Subscriptions subscriptions) = 0;
};

} // namespace redis_bridge
