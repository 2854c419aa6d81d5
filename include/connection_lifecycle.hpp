#pragma once
/**
 * @file connection_lifecycle.hpp
 * @brief Owns the publishing connection and the current subscription
 *        connection with its PollWorker.
 */

#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

#include "bridge_async.hpp"
#include "bridge_config.hpp"
#include "bridge_log.hpp"
#include "event_dispatcher.hpp"
#include "kv_client.hpp"
#include "poll_worker.hpp"

namespace redis_bridge {

/**
 * ConnectionLifecycleManager
 *
 * The underlying client fixes a connection's subscriptions when it is
 * created, so a changed subscription set is applied by building a
 * replacement: the new connection is made ready, swapped in as current, and
 * only then is the previous worker stopped and its connection closed. The
 * new worker starts after that, so at most one worker polls at a time; pushes
 * that arrive meanwhile wait in the new connection's backlog.
 *
 * reconcile(), rebuild() and cleanup() are serialized by one gate. All
 * methods must be called on the strand given at construction.
 */
class ConnectionLifecycleManager : public std::enable_shared_from_this<ConnectionLifecycleManager> {
  public:
    enum class Event { reconnecting,
                       ready,
                       retired };

    using EventHandler = std::function<void(Event ev, const Subscriptions &live)>;
    using ErrorHandler = std::function<void(std::error_code ec, std::string_view context)>;

    struct WorkerStatus {
        std::uint64_t id;
        PollWorker::State state;
        std::uint64_t delivered;
    };

    ConnectionLifecycleManager(boost::asio::any_io_executor strand,
                               std::shared_ptr<KvClientFactory> factory,
                               std::shared_ptr<EventDispatcher> dispatcher,
                               BridgeOptions opts,
                               std::shared_ptr<Logger> log = make_null_logger());

    void set_event_handler(EventHandler fn) { on_event_ = std::move(fn); }
    void set_error_handler(ErrorHandler fn) { on_error_ = std::move(fn); }

    // Makes the live subscription set equal to `desired`. On failure the
    // previous connection stays current.
    boost::asio::awaitable<std::error_code> reconcile(Subscriptions desired);

    // Replaces the current subscription connection with a fresh one for the
    // same set. A non-zero `worker_id` limits this to the connection that
    // worker polls; once it has been replaced or retired nothing happens.
    boost::asio::awaitable<std::error_code> rebuild(std::uint64_t worker_id = 0);

    // Lazily connected publishing/command connection.
    boost::asio::awaitable<std::tuple<std::error_code, std::shared_ptr<KvClient>>> publisher();

    // Tears down the worker, the subscription connection and the publisher.
    boost::asio::awaitable<void> cleanup();

    Subscriptions live() const;
    bool has_subscriber() const noexcept { return static_cast<bool>(current_.conn); }
    bool has_publisher() const noexcept { return static_cast<bool>(publisher_); }
    std::uint64_t generation() const noexcept { return generation_; }
    // Pushes dropped on full backlogs, over every subscription connection so far.
    std::uint64_t dropped_pushes() const noexcept;
    std::vector<WorkerStatus> workers() const;

  private:
    struct Slot {
        std::shared_ptr<KvClient> conn;
        std::shared_ptr<PollWorker> worker;
    };

    boost::asio::awaitable<std::tuple<std::error_code, Slot>> provision(Subscriptions desired);
    boost::asio::awaitable<void> retire(Slot slot);
    void activate(Slot &slot);
    boost::asio::awaitable<std::error_code> replace_locked(Subscriptions desired);
    void on_worker_lost(std::uint64_t worker_id);
    boost::asio::awaitable<void> rebuild_after_loss(std::uint64_t worker_id);
    void emit(Event ev, const Subscriptions &live);
    void report(std::error_code ec, std::string_view context);

    boost::asio::any_io_executor strand_;
    std::shared_ptr<KvClientFactory> factory_;
    std::shared_ptr<EventDispatcher> dispatcher_;
    BridgeOptions opts_;
    std::shared_ptr<Logger> log_;

    detail::AsyncGate gate_;
    detail::AsyncGate publisher_gate_;
    boost::asio::steady_timer rebuild_timer_;

    Slot current_;
    std::shared_ptr<KvClient> publisher_;
    std::uint64_t generation_{0};
    std::uint64_t next_worker_id_{0};
    std::uint64_t retired_dropped_{0};
    // Bumped by cleanup(); a rebuild started under an older epoch gives up.
    std::uint64_t epoch_{0};

    EventHandler on_event_;
    ErrorHandler on_error_;
};

} // namespace redis_bridge
