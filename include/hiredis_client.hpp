#pragma once
/**
 * @file hiredis_client.hpp
 * @brief KvClient over a hiredis async context driven by Boost.Asio: RESP3
 *        handshake, TLS, reconnect with backoff, keepalive, fixed subscriptions
 *        and pipelined / MULTI-EXEC batches.
 */

#include <boost/asio.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <hiredis/async.h>
#include <hiredis/hiredis.h>
#include <hiredis/hiredis_ssl.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "bridge_async.hpp"
#include "bridge_config.hpp"
#include "bridge_error.hpp"
#include "bridge_log.hpp"
#include "kv_client.hpp"
#include "redis_value.hpp"

namespace redis_bridge {
namespace asio = boost::asio;

class HiredisAsioAdapter;

/**
 * HiredisClient
 *
 * One server connection whose subscription set is fixed at creation. The
 * connection counts as ready once HELLO succeeded and every SUBSCRIBE /
 * PSUBSCRIBE of that set has been acknowledged; after a reconnect the set is
 * issued again. Pushes are buffered in a bounded channel drained by
 * next_message(); when it is full the push is dropped and counted.
 *
 * Thread-affine: internal state lives on a strand created from the executor
 * passed to create(). Public operations may be started from any thread and
 * complete on the handler's associated executor.
 *
 * A stopped client stays stopped; build a new one to connect again.
 */
class HiredisClient final : public KvClient, public std::enable_shared_from_this<HiredisClient> {
  public:
    using executor_type = asio::any_io_executor;

    static std::shared_ptr<HiredisClient> create(executor_type exec,
                                                 ConnectOptions opts,
                                                 Subscriptions subscriptions = {},
                                                 std::shared_ptr<Logger> logger = make_null_logger());

    ~HiredisClient() noexcept override { shutdown_from_dtor_(); }

    executor_type get_executor() const noexcept { return strand_.get_inner_executor(); }

    /**
     * Start connecting, or complete at once when already connected.
     * Completion signature: void(std::error_code, bool already_connected).
     * Retries with backoff until ready, stopped or cancelled.
     */
    template <typename CompletionToken>
    auto async_connect(CompletionToken &&token);

    /**
     * Wait until the connection is ready. Completion signature: void(std::error_code).
     */
    template <typename CompletionToken>
    auto async_wait_connected(CompletionToken &&token);

    /**
     * Execute one command. Completion signature: void(std::error_code, RedisValue).
     * Server error replies are values, not error codes.
     */
    template <typename CompletionToken>
    auto async_command(std::vector<std::string> argv, CompletionToken &&token);

    /**
     * Send every command of `request` back to back, wrapped in MULTI/EXEC when
     * atomic. Completion signature: void(std::error_code, BatchReply).
     */
    template <typename CompletionToken>
    auto async_batch(BatchRequest request, CompletionToken &&token);

    // Cancels waiters, reconnects and keepalive, then disconnects. Safe from any thread.
    void stop();

    // e.g. "redis 7.2.4 proto=3 role=master". Empty before the first handshake.
    std::string hello_summary() const;

    enum class Health { healthy,
                        suspect,
                        unhealthy };
    Health health() const noexcept { return health_.load(std::memory_order_relaxed); }

    std::uint64_t dropped() const noexcept override { return dropped_.load(std::memory_order_relaxed); }
    std::size_t connect_waiters() const noexcept { return connect_waiters_.size(); }
    const ConnectOptions &options() const noexcept { return opts_; }

    static void initOpenSSL() {
        static std::once_flag once;
        std::call_once(once, [] { redisInitOpenSSL(); });
    }

    // KvClient
    asio::awaitable<std::error_code> connect() override;
    void close() noexcept override { stop(); }
    bool is_connected() const noexcept override { return connected_.load(std::memory_order_relaxed); }
    const Subscriptions &subscriptions() const noexcept override { return subs_; }
    asio::awaitable<std::tuple<std::error_code, RedisValue>> execute(std::vector<std::string> argv) override;
    asio::awaitable<std::tuple<std::error_code, BatchReply>> execute_batch(BatchRequest request) override;
    asio::awaitable<std::tuple<std::error_code, std::optional<PublishMessage>>>
    next_message(std::chrono::milliseconds timeout) override;
    asio::awaitable<std::tuple<std::error_code, WatchSet>> watch(std::vector<std::string> keys) override;
    asio::awaitable<std::error_code> unwatch() override;
    bool watch_intact(const WatchSet &watched) const noexcept override;

  private:
    using Waiter = asio::any_completion_handler<void(std::error_code)>;
    using BatchHandler = asio::any_completion_handler<void(std::error_code, BatchReply)>;

    // Lives in subs_batons_ for the lifetime of one context; hiredis calls
    // back with it for the ack and for every message of that subject.
    struct SubBaton {
        std::weak_ptr<HiredisClient> w;
        std::string subject;
        bool is_pattern{false};
        bool acked{false};
    };
    // One per batch; every submitted frame holds a reference to it.
    struct BatchCtx {
        BatchHandler handler;
        bool atomic{false};
        std::vector<RedisValue> replies; // [MULTI] frames... [EXEC]
        std::size_t remaining{0};
        bool lost{false};
    };

    HiredisClient(executor_type exec, ConnectOptions opts, Subscriptions subs, std::shared_ptr<Logger> log);

    void shutdown_from_dtor_() noexcept;
    void do_connect();
    void schedule_reconnect();
    void on_connected();
    void on_disconnected(int status, std::string errstr);
    void fail_connect(std::error_code ec);
    void mark_ready();
    void force_reconnect(std::string_view why);

    static void handle_connect(const redisAsyncContext *c, int status);
    static void handle_disconnect(const redisAsyncContext *c, int status);
    static void handle_sub_reply(redisAsyncContext *c, void *r, void *priv);
    static void handle_batch_reply(redisAsyncContext *c, void *r, void *priv);
    static void finish_batch(BatchCtx &batch);

    // HELLO 3 [AUTH user pass] [SETNAME name] in one round trip.
    void send_handshake_hello();
    void issue_subscriptions();
    void issue_sub(const char *verb, const std::string &subject);
    void on_sub_ack(const SubBaton &baton);
    void on_sub_error(const SubBaton &baton, std::string_view text);
    void enqueue(PublishMessage pm);

    int submit_argv(const std::vector<std::string> &argv, redisCallbackFn *fn, void *priv);
    void submit_batch(BatchRequest request, BatchHandler handler);

    std::uint64_t add_connect_waiter(Waiter h) {
        const auto id = next_waiter_id_++;
        connect_waiters_.emplace(id, std::move(h));
        return id;
    }

    // Returns the waiter if it was still registered, else empty.
    Waiter take_connect_waiter(std::uint64_t id) {
        auto it = connect_waiters_.find(id);
        if (it == connect_waiters_.end())
            return {};
        auto fn = std::move(it->second);
        connect_waiters_.erase(it);
        return fn;
    }

    template <class Slot>
    void bind_connect_cancellation(Slot &slot, std::uint64_t id);

    void start_keepalive();
    void schedule_next_ping();

#ifdef RBRIDGE_TEST_ACCESS
    friend struct HiredisClientTestAccess;
#endif

    asio::strand<executor_type> strand_;
    asio::steady_timer reconnect_timer_;
    asio::steady_timer ping_timer_;
    asio::experimental::concurrent_channel<void(boost::system::error_code, PublishMessage)> pub_channel_;

    const ConnectOptions opts_;
    const Subscriptions subs_;
    std::shared_ptr<Logger> log_;
    std::shared_ptr<HiredisAsioAdapter> adapter_;
    redisAsyncContext *ctx_{nullptr};
    redisSSLContext *sslctx_{nullptr};

    std::atomic<bool> connected_{false};
    // Incremented by every successful handshake; doubles as the WATCH token.
    std::atomic<std::uint64_t> epoch_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<Health> health_{Health::healthy};

    std::unordered_map<std::string, std::unique_ptr<SubBaton>> ch_batons_;
    std::unordered_map<std::string, std::unique_ptr<SubBaton>> pch_batons_;
    std::size_t pending_acks_{0};

    std::chrono::milliseconds backoff_{};
    bool stopping_{false};
    bool connect_inflight_{false};
    bool reconnect_on_close_{false};

    std::unordered_map<std::uint64_t, Waiter> connect_waiters_;
    std::uint64_t next_waiter_id_{0};

    mutable std::mutex hello_mtx_;
    std::string hello_summary_;
    int ping_failures_{0};
};

/**
 * HiredisClientFactory
 *
 * Builds HiredisClients for the bridge. The client name, when configured, is
 * suffixed by connection role.
 */
class HiredisClientFactory final : public KvClientFactory {
  public:
    HiredisClientFactory(asio::any_io_executor exec,
                         ConnectOptions opts,
                         std::string subscriber_suffix = "-sub",
                         std::string publisher_suffix = "-pub",
                         std::shared_ptr<Logger> log = make_null_logger());

    std::shared_ptr<KvClient> create(Subscriptions subscriptions) override;

    std::uint64_t created() const noexcept { return created_.load(std::memory_order_relaxed); }

  private:
    asio::any_io_executor exec_;
    ConnectOptions opts_;
    std::string subscriber_suffix_;
    std::string publisher_suffix_;
    std::shared_ptr<Logger> log_;
    std::atomic<std::uint64_t> created_{0};
};

#include "hiredis_client_impl.ipp"

} // namespace redis_bridge
