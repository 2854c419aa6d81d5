#pragma once
/**
 * @file redis_bridge.hpp
 * @brief Push-style pub/sub events, pipelines and transactions on top of a
 *        client with pull-based subscriptions and fixed-set connections.
 */

#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

#include "bridge_async.hpp"
#include "bridge_config.hpp"
#include "bridge_error.hpp"
#include "bridge_log.hpp"
#include "command_queue.hpp"
#include "connection_lifecycle.hpp"
#include "event_dispatcher.hpp"
#include "kv_client.hpp"
#include "listener_list.hpp"
#include "redis_value.hpp"
#include "subscription_registry.hpp"
#include "transaction.hpp"

namespace redis_bridge {
namespace asio = boost::asio;

/**
 * RedisBridge
 *
 * Client facade. Subscribing changes the registry and reconciles the
 * subscription connection; messages reach `message` / `pmessage` listeners.
 * Commands, publishes, pipelines and transactions use a separate lazily
 * connected publisher connection.
 *
 * Subscriptions are reference counted: N subscribe(ch) need N
 * unsubscribe(ch); unsubscribe() with no names drops every channel. Counts
 * reported to callers and listeners are distinct entries of that kind.
 *
 * Public methods may be called from any thread. Listeners run on the
 * bridge's strand and must not block it. Call async_cleanup() (or
 * async_disconnect()) before dropping the last reference so the poll worker
 * and connections are torn down.
 */
class RedisBridge : public std::enable_shared_from_this<RedisBridge> {
  public:
    using executor_type = asio::any_io_executor;
    using SubscriptionListener = std::function<void(const std::string &name, std::size_t count)>;
    using ErrorListener = std::function<void(std::error_code ec, std::string_view context)>;
    using LifecycleListener = std::function<void()>;

    enum class Status { wait,
                        connecting,
                        ready,
                        disconnecting,
                        end };

    struct StatusReport {
        Status status;
        std::vector<std::string> channels;
        std::vector<std::string> patterns;
        std::vector<ConnectionLifecycleManager::WorkerStatus> workers;
        bool publisher;
        std::uint64_t generation;
        std::uint64_t dispatched;
        // Messages with no active subscription left to receive them.
        std::uint64_t dropped;
        // Pushes lost to a full connection backlog.
        std::uint64_t dropped_pushes;
    };

    static std::shared_ptr<RedisBridge> create(executor_type exec,
                                               std::shared_ptr<KvClientFactory> factory,
                                               BridgeOptions opts = {},
                                               std::shared_ptr<Logger> logger = make_null_logger());

    // Backed by HiredisClient connections built from opts.connection.
    static std::shared_ptr<RedisBridge> create(executor_type exec,
                                               BridgeOptions opts,
                                               std::shared_ptr<Logger> logger = make_null_logger());

    executor_type get_executor() const noexcept { return strand_; }
    const BridgeOptions &options() const noexcept { return opts_; }

    // ---- events ----
    ListenerId on_message(EventDispatcher::MessageListener fn);
    ListenerId on_message_async(EventDispatcher::AsyncMessageListener fn);
    ListenerId on_pmessage(EventDispatcher::PatternListener fn);
    ListenerId on_pmessage_async(EventDispatcher::AsyncPatternListener fn);
    ListenerId on_subscribe(SubscriptionListener fn);
    ListenerId on_unsubscribe(SubscriptionListener fn);
    ListenerId on_psubscribe(SubscriptionListener fn);
    ListenerId on_punsubscribe(SubscriptionListener fn);
    ListenerId on_error(ErrorListener fn);
    ListenerId on_ready(LifecycleListener fn);
    ListenerId on_reconnecting(LifecycleListener fn);
    ListenerId on_end(LifecycleListener fn);
    bool remove_listener(ListenerId id);
    void remove_all_listeners();

    // ---- lifecycle ----

    /**
     * Connect the publisher connection. Completion signature: void(std::error_code).
     * Emits `ready` on success.
     */
    template <typename CompletionToken>
    auto async_connect(CompletionToken &&token);

    /**
     * Stop the poll worker, close every connection and forget all
     * subscriptions. Emits `end` once; repeated calls complete immediately.
     * Completion signature: void(std::error_code).
     */
    template <typename CompletionToken>
    auto async_disconnect(CompletionToken &&token);

    // Sends QUIT on the publisher when it is up, then disconnects.
    template <typename CompletionToken>
    auto async_quit(CompletionToken &&token);

    // async_disconnect() plus removal of every listener.
    template <typename CompletionToken>
    auto async_cleanup(CompletionToken &&token);

    // ---- pub/sub ----

    /**
     * Completion signature: void(std::error_code, std::size_t channel_count).
     * An empty list fails with errc::invalid_argument. If the subscription
     * connection cannot be rebuilt the registry is rolled back.
     */
    template <typename CompletionToken>
    auto async_subscribe(std::vector<std::string> channels, CompletionToken &&token);

    // An empty list unsubscribes from every channel.
    template <typename CompletionToken>
    auto async_unsubscribe(std::vector<std::string> channels, CompletionToken &&token);

    template <typename CompletionToken>
    auto async_psubscribe(std::vector<std::string> patterns, CompletionToken &&token);

    template <typename CompletionToken>
    auto async_punsubscribe(std::vector<std::string> patterns, CompletionToken &&token);

    /**
     * PUBLISH on the publisher connection.
     * Completion signature: void(std::error_code, long long receivers).
     */
    template <typename CompletionToken>
    auto async_publish(std::string channel, std::string payload, CompletionToken &&token);

    // ---- commands ----

    /**
     * Completion signature: void(std::error_code, RedisValue). Server error
     * replies are returned as values.
     */
    template <typename CompletionToken>
    auto async_command(std::vector<std::string> argv, CompletionToken &&token);

    /**
     * WATCH keys for the next multi(). Completion signature: void(std::error_code).
     */
    template <typename CompletionToken>
    auto async_watch(std::vector<std::string> keys, CompletionToken &&token);

    template <typename CompletionToken>
    auto async_unwatch(CompletionToken &&token);

    std::shared_ptr<CommandQueue> pipeline();
    // Adopts the keys watched through async_watch() since the last multi().
    std::shared_ptr<TransactionCoordinator> multi();

    // ---- introspection ----
    std::vector<std::string> subscribed_channels() const;
    std::vector<std::string> subscribed_patterns() const;
    std::size_t subscription_count() const;
    bool in_subscriber_mode() const { return subscription_count() > 0; }
    Status status() const noexcept { return status_.load(std::memory_order_relaxed); }
    // Worker and generation fields are only consistent when read on get_executor().
    StatusReport status_report() const;

  private:
    RedisBridge(executor_type exec,
                std::shared_ptr<KvClientFactory> factory,
                BridgeOptions opts,
                std::shared_ptr<Logger> log);
    void wire();

    using Result = std::tuple<std::error_code>;
    using CountResult = std::tuple<std::error_code, std::size_t>;

    template <class... Ts, class CompletionToken, class MakeOp>
    auto launch(CompletionToken &&token, MakeOp make_op);

    asio::awaitable<Result> run_connect();
    asio::awaitable<Result> run_disconnect(bool quit);
    asio::awaitable<Result> run_cleanup();
    asio::awaitable<CountResult> run_subscribe(SubscriptionKind kind, std::vector<std::string> names);
    asio::awaitable<CountResult> run_unsubscribe(SubscriptionKind kind, std::vector<std::string> names);
    asio::awaitable<std::tuple<std::error_code, long long>> run_publish(std::string channel, std::string payload);
    asio::awaitable<std::tuple<std::error_code, RedisValue>> run_command(std::vector<std::string> argv);
    asio::awaitable<Result> run_watch(std::vector<std::string> keys);
    asio::awaitable<Result> run_unwatch();

    // Publisher connection, subject to the strict subscriber-mode check.
    asio::awaitable<std::tuple<std::error_code, std::shared_ptr<KvClient>>> command_client();
    static asio::awaitable<std::tuple<std::error_code, std::shared_ptr<KvClient>>>
    provide(std::weak_ptr<RedisBridge> w);
    ClientProvider provider();

    bool command_allowed(std::string_view name) const;
    void sync_dispatcher();
    void on_lifecycle(ConnectionLifecycleManager::Event ev);
    void report(std::error_code ec, std::string_view context);

    template <class Fn, class... Args>
    void emit(const ListenerList<Fn> &list, std::string_view event, const Args &...args);

    executor_type strand_;
    BridgeOptions opts_;
    std::shared_ptr<Logger> log_;
    SubscriptionRegistry registry_;
    std::shared_ptr<EventDispatcher> dispatcher_;
    std::shared_ptr<ConnectionLifecycleManager> lifecycle_;

    std::atomic<Status> status_{Status::wait};
    bool swap_pending_{false};

    mutable std::mutex watch_mtx_;
    WatchSet pending_watch_;

    ListenerList<SubscriptionListener> subscribe_listeners_;
    ListenerList<SubscriptionListener> unsubscribe_listeners_;
    ListenerList<SubscriptionListener> psubscribe_listeners_;
    ListenerList<SubscriptionListener> punsubscribe_listeners_;
    ListenerList<ErrorListener> error_listeners_;
    ListenerList<LifecycleListener> ready_listeners_;
    ListenerList<LifecycleListener> reconnecting_listeners_;
    ListenerList<LifecycleListener> end_listeners_;
};

std::string_view to_string(RedisBridge::Status s) noexcept;

#include "redis_bridge_impl.ipp"

} // namespace redis_bridge
