#pragma once
/**
 * @file poll_worker.hpp
 * @brief Pull loop that turns one connection's bounded "next message" wait
 *        into pushes through the EventDispatcher.
 */

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <system_error>

#include "bridge_config.hpp"
#include "bridge_log.hpp"
#include "event_dispatcher.hpp"
#include "kv_client.hpp"

namespace redis_bridge {

/**
 * PollWorker
 *
 * Idle -> Polling -> (Dispatching -> Polling)* -> Stopped.
 *
 * One message is dispatched before the next poll is issued. A timeout loops
 * silently. Poll errors are retried with exponential backoff; every
 * `failure_threshold` consecutive failures the failure handler is invoked and
 * the loop keeps going. A "stopped" error while still active means the
 * connection is gone: the lost handler is invoked and the worker stops.
 * When the connection starts dropping pushes the overflow handler is invoked
 * once; it fires again only after a poll that saw no new drops.
 *
 * All methods must be called on the strand given at construction.
 */
class PollWorker : public std::enable_shared_from_this<PollWorker> {
  public:
    enum class State { idle,
                       polling,
                       dispatching,
                       stopped };

    using FailureHandler = std::function<void(std::error_code ec, std::size_t consecutive)>;
    using LostHandler = std::function<void(std::uint64_t worker_id, std::error_code ec)>;
    using OverflowHandler = std::function<void(std::uint64_t newly_dropped, std::uint64_t total)>;

    PollWorker(boost::asio::any_io_executor strand,
               std::uint64_t id,
               std::shared_ptr<KvClient> connection,
               std::shared_ptr<EventDispatcher> dispatcher,
               PollOptions opts,
               std::shared_ptr<Logger> log = make_null_logger());

    void set_failure_handler(FailureHandler fn) { on_failure_ = std::move(fn); }
    void set_lost_handler(LostHandler fn) { on_lost_ = std::move(fn); }
    void set_overflow_handler(OverflowHandler fn) { on_overflow_ = std::move(fn); }

    // Spawns the loop. No-op unless idle.
    void start();

    // Clears the active flag; the loop exits once its current await resolves.
    void request_stop() noexcept;

    // request_stop() and wait until the loop has exited.
    boost::asio::awaitable<void> stop();

    State state() const noexcept { return state_; }
    bool active() const noexcept { return active_.load(std::memory_order_relaxed); }
    std::uint64_t id() const noexcept { return id_; }
    const std::shared_ptr<KvClient> &connection() const noexcept { return conn_; }
    std::uint64_t delivered() const noexcept { return delivered_; }
    std::size_t consecutive_failures() const noexcept { return failures_; }

  private:
    boost::asio::awaitable<void> run();
    std::chrono::milliseconds next_backoff() noexcept;
    void finish() noexcept;
    void check_dropped();

    boost::asio::any_io_executor strand_;
    std::uint64_t id_;
    std::shared_ptr<KvClient> conn_;
    std::shared_ptr<EventDispatcher> dispatcher_;
    PollOptions opts_;
    std::shared_ptr<Logger> log_;

    std::atomic<bool> active_{false};
    State state_{State::idle};
    boost::asio::steady_timer backoff_timer_;
    // Never expires on its own; cancelled when the loop exits to wake stop().
    boost::asio::steady_timer stopped_signal_;
    std::chrono::milliseconds backoff_{};
    std::size_t failures_{0};
    std::uint64_t delivered_{0};
    std::uint64_t seen_dropped_{0};
    bool overflowing_{false};

    FailureHandler on_failure_;
    LostHandler on_lost_;
    OverflowHandler on_overflow_;
};

std::string_view to_string(PollWorker::State s) noexcept;

} // namespace redis_bridge
