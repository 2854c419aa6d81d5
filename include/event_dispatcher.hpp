#pragma once
/**
 * @file event_dispatcher.hpp
 * @brief Routes received pub/sub messages to `message` / `pmessage` listeners.
 */

#include <boost/asio/awaitable.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "bridge_config.hpp"
#include "bridge_log.hpp"
#include "kv_client.hpp"
#include "listener_list.hpp"

namespace redis_bridge {

/**
 * EventDispatcher
 *
 * Holds the ordered sets of active channels and patterns and the
 * message/pmessage listeners. A message is delivered once per matching
 * active subscription: exact matches reach `message` listeners, pattern
 * matches reach `pmessage` listeners, never the other way round.
 *
 * In DispatchMode::attributed a pattern-tagged message is only offered to its
 * own pattern and an untagged one only to exact subscriptions. In
 * DispatchMode::fan_out every message is matched against all of them.
 *
 * Asynchronous listeners are awaited in registration order. A listener that
 * throws is logged and reported to the error handler; delivery continues.
 */
class EventDispatcher {
  public:
    using MessageListener = std::function<void(const std::string &channel, const std::string &payload)>;
    using PatternListener = std::function<void(const std::string &pattern, const std::string &channel, const std::string &payload)>;
    using AsyncMessageListener = std::function<boost::asio::awaitable<void>(std::string channel, std::string payload)>;
    using AsyncPatternListener = std::function<boost::asio::awaitable<void>(std::string pattern, std::string channel, std::string payload)>;
    using ListenerErrorHandler = std::function<void(std::string_view what)>;

    // nullopt pattern = exact delivery
    struct Delivery {
        std::optional<std::string> pattern;
        bool operator==(const Delivery &) const = default;
    };

    explicit EventDispatcher(DispatchMode mode = DispatchMode::attributed,
                             std::shared_ptr<Logger> log = make_null_logger());

    ListenerId on_message(MessageListener fn);
    ListenerId on_message_async(AsyncMessageListener fn);
    ListenerId on_pmessage(PatternListener fn);
    ListenerId on_pmessage_async(AsyncPatternListener fn);
    bool remove_listener(ListenerId id);
    void remove_all_listeners();
    std::size_t listener_count() const;

    // Ids shared with every other listener list of the owning bridge.
    ListenerId next_listener_id() noexcept { return ++last_id_; }

    void set_active(Subscriptions active);
    Subscriptions active() const;

    std::vector<Delivery> resolve(const PublishMessage &msg) const;

    // Returns the number of listener invocations.
    boost::asio::awaitable<std::size_t> dispatch(PublishMessage msg);

    DispatchMode mode() const noexcept { return mode_; }
    void set_error_handler(ListenerErrorHandler fn) { on_listener_error_ = std::move(fn); }

    std::uint64_t dispatched() const noexcept { return dispatched_.load(std::memory_order_relaxed); }
    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

  private:
    using MessageEntry = std::variant<MessageListener, AsyncMessageListener>;
    using PatternEntry = std::variant<PatternListener, AsyncPatternListener>;

    void report_listener_failure(std::string_view what);

    DispatchMode mode_;
    std::shared_ptr<Logger> log_;

    mutable std::mutex active_mtx_;
    Subscriptions active_;

    ListenerList<MessageEntry> messages_;
    ListenerList<PatternEntry> pmessages_;
    std::atomic<ListenerId> last_id_{0};

    ListenerErrorHandler on_listener_error_;
    std::atomic<std::uint64_t> dispatched_{0};
    std::atomic<std::uint64_t> dropped_{0};
};

} // namespace redis_bridge
