#include "redis_bridge.hpp"

#include <algorithm>
#include <cctype>
#include <format>

#include "hiredis_client.hpp"

namespace redis_bridge {

std::string_view to_string(RedisBridge::Status s) noexcept {
    switch (s) {
    case RedisBridge::Status::wait:
        return "wait";
    case RedisBridge::Status::connecting:
        return "connecting";
    case RedisBridge::Status::ready:
        return "ready";
    case RedisBridge::Status::disconnecting:
        return "disconnecting";
    case RedisBridge::Status::end:
        return "end";
    }
    return "unknown";
}

namespace {
std::string_view kind_name(SubscriptionKind k) {
    return k == SubscriptionKind::exact ? "channel" : "pattern";
}
} // namespace

std::shared_ptr<RedisBridge> RedisBridge::create(executor_type exec,
                                                 std::shared_ptr<KvClientFactory> factory,
                                                 BridgeOptions opts,
                                                 std::shared_ptr<Logger> logger) {
    auto bridge = std::shared_ptr<RedisBridge>(new RedisBridge(exec, std::move(factory), std::move(opts), std::move(logger)));
    bridge->wire();
    return bridge;
}

std::shared_ptr<RedisBridge> RedisBridge::create(executor_type exec, BridgeOptions opts, std::shared_ptr<Logger> logger) {
    auto log = logger ? logger : make_null_logger();
    auto factory = std::make_shared<HiredisClientFactory>(exec, opts.connection, opts.subscriber_name_suffix,
                                                          opts.publisher_name_suffix, log);
    return create(exec, std::move(factory), std::move(opts), std::move(log));
}

RedisBridge::RedisBridge(executor_type exec,
                         std::shared_ptr<KvClientFactory> factory,
                         BridgeOptions opts,
                         std::shared_ptr<Logger> log)
    : strand_(asio::make_strand(exec)),
      opts_(std::move(opts)),
      log_(log ? std::move(log) : make_null_logger()),
      dispatcher_(std::make_shared<EventDispatcher>(opts_.dispatch_mode, make_child_logger(log_, "dispatch"))),
      lifecycle_(std::make_shared<ConnectionLifecycleManager>(strand_, std::move(factory), dispatcher_, opts_,
                                                              make_child_logger(log_, "lifecycle"))) {}

void RedisBridge::wire() {
    std::weak_ptr<RedisBridge> w = weak_from_this();
    lifecycle_->set_event_handler([w](ConnectionLifecycleManager::Event ev, const Subscriptions &) {
        if (auto self = w.lock())
            self->on_lifecycle(ev);
    });
    lifecycle_->set_error_handler([w](std::error_code ec, std::string_view context) {
        if (auto self = w.lock())
            self->emit(self->error_listeners_, "error", ec, context);
    });
    dispatcher_->set_error_handler([w](std::string_view what) {
        if (auto self = w.lock())
            self->emit(self->error_listeners_, "error", make_error(errc::internal_error),
                       std::string_view{std::format("message listener failed: {}", what)});
    });
}

// ---- listeners ----

ListenerId RedisBridge::on_message(EventDispatcher::MessageListener fn) { return dispatcher_->on_message(std::move(fn)); }
ListenerId RedisBridge::on_message_async(EventDispatcher::AsyncMessageListener fn) { return dispatcher_->on_message_async(std::move(fn)); }
ListenerId RedisBridge::on_pmessage(EventDispatcher::PatternListener fn) { return dispatcher_->on_pmessage(std::move(fn)); }
ListenerId RedisBridge::on_pmessage_async(EventDispatcher::AsyncPatternListener fn) { return dispatcher_->on_pmessage_async(std::move(fn)); }

namespace {
template <class Fn>
ListenerId add_to(ListenerList<Fn> &list, EventDispatcher &ids, Fn fn) {
    const auto id = ids.next_listener_id();
    list.add(id, std::move(fn));
    return id;
}
} // namespace

ListenerId RedisBridge::on_subscribe(SubscriptionListener fn) { return add_to(subscribe_listeners_, *dispatcher_, std::move(fn)); }
ListenerId RedisBridge::on_unsubscribe(SubscriptionListener fn) { return add_to(unsubscribe_listeners_, *dispatcher_, std::move(fn)); }
ListenerId RedisBridge::on_psubscribe(SubscriptionListener fn) { return add_to(psubscribe_listeners_, *dispatcher_, std::move(fn)); }
ListenerId RedisBridge::on_punsubscribe(SubscriptionListener fn) { return add_to(punsubscribe_listeners_, *dispatcher_, std::move(fn)); }
ListenerId RedisBridge::on_error(ErrorListener fn) { return add_to(error_listeners_, *dispatcher_, std::move(fn)); }
ListenerId RedisBridge::on_ready(LifecycleListener fn) { return add_to(ready_listeners_, *dispatcher_, std::move(fn)); }
ListenerId RedisBridge::on_reconnecting(LifecycleListener fn) { return add_to(reconnecting_listeners_, *dispatcher_, std::move(fn)); }
ListenerId RedisBridge::on_end(LifecycleListener fn) { return add_to(end_listeners_, *dispatcher_, std::move(fn)); }

bool RedisBridge::remove_listener(ListenerId id) {
    return dispatcher_->remove_listener(id) ||
           subscribe_listeners_.remove(id) || unsubscribe_listeners_.remove(id) ||
           psubscribe_listeners_.remove(id) || punsubscribe_listeners_.remove(id) ||
           error_listeners_.remove(id) || ready_listeners_.remove(id) ||
           reconnecting_listeners_.remove(id) || end_listeners_.remove(id);
}

void RedisBridge::remove_all_listeners() {
    dispatcher_->remove_all_listeners();
    subscribe_listeners_.clear();
    unsubscribe_listeners_.clear();
    psubscribe_listeners_.clear();
    punsubscribe_listeners_.clear();
    error_listeners_.clear();
    ready_listeners_.clear();
    reconnecting_listeners_.clear();
    end_listeners_.clear();
}

void RedisBridge::on_lifecycle(ConnectionLifecycleManager::Event ev) {
    using Event = ConnectionLifecycleManager::Event;
    switch (ev) {
    case Event::reconnecting:
        swap_pending_ = true;
        emit(reconnecting_listeners_, "reconnecting");
        break;
    case Event::ready:
        // The first subscription connection is not a reconnect.
        if (std::exchange(swap_pending_, false))
            emit(ready_listeners_, "ready");
        break;
    case Event::retired:
        swap_pending_ = false;
        break;
    }
}

void RedisBridge::report(std::error_code ec, std::string_view context) {
    RBRIDGE_WARN_RT(log_, "{}: {}", context, ec.message());
    emit(error_listeners_, "error", ec, context);
}

void RedisBridge::sync_dispatcher() {
    dispatcher_->set_active(registry_.list_active());
}

// ---- lifecycle ----

asio::awaitable<RedisBridge::Result> RedisBridge::run_connect() {
    auto self = shared_from_this();
    if (status() == Status::ready)
        co_return Result{};
    status_.store(Status::connecting, std::memory_order_relaxed);
    auto [ec, client] = co_await lifecycle_->publisher();
    if (ec) {
        status_.store(Status::wait, std::memory_order_relaxed);
        report(ec, "connect failed");
        co_return Result{ec};
    }
    status_.store(Status::ready, std::memory_order_relaxed);
    RBRIDGE_INFO_RT(log_, "ready");
    emit(ready_listeners_, "ready");
    co_return Result{};
}

asio::awaitable<RedisBridge::Result> RedisBridge::run_disconnect(bool quit) {
    auto self = shared_from_this();
    const auto prev = status();
    if (prev == Status::end || prev == Status::disconnecting)
        co_return Result{};
    status_.store(Status::disconnecting, std::memory_order_relaxed);

    if (quit && lifecycle_->has_publisher()) {
        auto [ec, client] = co_await lifecycle_->publisher();
        if (!ec) {
            auto [qec, reply] = co_await client->execute({"QUIT"});
            if (qec)
                RBRIDGE_DEBUG_RT(log_, "QUIT not acknowledged: {}", qec.message());
        }
    }

    {
        std::scoped_lock lk(watch_mtx_);
        pending_watch_.clear();
    }
    registry_.clear();
    sync_dispatcher();
    co_await lifecycle_->cleanup();
    status_.store(Status::end, std::memory_order_relaxed);
    RBRIDGE_INFO_RT(log_, "{}", quit ? "quit" : "disconnected");
    emit(end_listeners_, "end");
    co_return Result{};
}

asio::awaitable<RedisBridge::Result> RedisBridge::run_cleanup() {
    auto self = shared_from_this();
    auto r = co_await run_disconnect(false);
    remove_all_listeners();
    co_return r;
}

// ---- pub/sub ----

asio::awaitable<RedisBridge::CountResult> RedisBridge::run_subscribe(SubscriptionKind kind, std::vector<std::string> names) {
    auto self = shared_from_this();
    if (names.empty())
        co_return CountResult{make_error(errc::invalid_argument), registry_.count(kind)};

    for (auto &n : names)
        registry_.add({kind, n});
    sync_dispatcher();

    if (auto ec = co_await lifecycle_->reconcile(registry_.list_active())) {
        for (auto &n : names)
            registry_.remove({kind, n});
        sync_dispatcher();
        report(ec, std::format("subscribe to {} {}(s) failed", names.size(), kind_name(kind)));
        co_return CountResult{ec, registry_.count(kind)};
    }

    const auto count = registry_.count(kind);
    RBRIDGE_DEBUG_RT(log_, "subscribed to {} {}(s), {} active", names.size(), kind_name(kind), count);
    auto &listeners = kind == SubscriptionKind::exact ? subscribe_listeners_ : psubscribe_listeners_;
    for (auto &n : names)
        emit(listeners, kind == SubscriptionKind::exact ? "subscribe" : "psubscribe", n, count);
    co_return CountResult{std::error_code{}, count};
}

asio::awaitable<RedisBridge::CountResult> RedisBridge::run_unsubscribe(SubscriptionKind kind, std::vector<std::string> names) {
    auto self = shared_from_this();
    if (names.empty()) {
        names = registry_.remove_all(kind);
    } else {
        for (auto &n : names)
            registry_.remove({kind, n});
    }
    // Deliveries for dropped entries stop here, before the connection is replaced.
    sync_dispatcher();

    std::error_code ec = co_await lifecycle_->reconcile(registry_.list_active());
    if (ec)
        report(ec, std::format("unsubscribe from {} {}(s) could not rebuild the connection", names.size(), kind_name(kind)));

    const auto count = registry_.count(kind);
    auto &listeners = kind == SubscriptionKind::exact ? unsubscribe_listeners_ : punsubscribe_listeners_;
    for (auto &n : names)
        emit(listeners, kind == SubscriptionKind::exact ? "unsubscribe" : "punsubscribe", n, count);
    co_return CountResult{ec, count};
}

asio::awaitable<std::tuple<std::error_code, long long>> RedisBridge::run_publish(std::string channel, std::string payload) {
    auto self = shared_from_this();
    auto [ec, client] = co_await command_client();
    if (ec)
        co_return std::make_tuple(ec, 0LL);
    auto [pec, reply] = co_await client->execute({"PUBLISH", std::move(channel), std::move(payload)});
    if (pec)
        co_return std::make_tuple(pec, 0LL);
    if (reply.is_error()) {
        RBRIDGE_WARN_RT(log_, "PUBLISH rejected: {}", reply.error_message());
        co_return std::make_tuple(protocol_error(), 0LL);
    }
    auto receivers = as_integer(reply);
    if (!receivers)
        co_return std::make_tuple(receivers.error(), 0LL);
    co_return std::make_tuple(std::error_code{}, *receivers);
}

// ---- commands ----

bool RedisBridge::command_allowed(std::string_view name) const {
    if (!opts_.strict_subscriber_mode || !in_subscriber_mode())
        return true;
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper == "SUBSCRIBE" || upper == "UNSUBSCRIBE" || upper == "PSUBSCRIBE" ||
           upper == "PUNSUBSCRIBE" || upper == "PING" || upper == "QUIT";
}

asio::awaitable<std::tuple<std::error_code, std::shared_ptr<KvClient>>> RedisBridge::command_client() {
    if (!command_allowed(""))
        co_return std::make_tuple(make_error(errc::subscriber_mode), std::shared_ptr<KvClient>{});
    co_return co_await lifecycle_->publisher();
}

asio::awaitable<std::tuple<std::error_code, RedisValue>> RedisBridge::run_command(std::vector<std::string> argv) {
    auto self = shared_from_this();
    if (argv.empty())
        co_return std::make_tuple(make_error(errc::invalid_argument), RedisValue{});
    if (!command_allowed(argv.front()))
        co_return std::make_tuple(make_error(errc::subscriber_mode), RedisValue{});
    auto [ec, client] = co_await lifecycle_->publisher();
    if (ec)
        co_return std::make_tuple(ec, RedisValue{});
    co_return co_await client->execute(std::move(argv));
}

asio::awaitable<RedisBridge::Result> RedisBridge::run_watch(std::vector<std::string> keys) {
    auto self = shared_from_this();
    if (keys.empty())
        co_return Result{make_error(errc::invalid_argument)};
    auto [ec, client] = co_await command_client();
    if (ec)
        co_return Result{ec};
    auto [wec, tokens] = co_await client->watch(std::move(keys));
    if (wec)
        co_return Result{wec};
    std::scoped_lock lk(watch_mtx_);
    for (auto &[key, token] : tokens)
        pending_watch_.try_emplace(key, token);
    co_return Result{};
}

asio::awaitable<RedisBridge::Result> RedisBridge::run_unwatch() {
    auto self = shared_from_this();
    {
        std::scoped_lock lk(watch_mtx_);
        pending_watch_.clear();
    }
    if (!lifecycle_->has_publisher())
        co_return Result{};
    auto [ec, client] = co_await lifecycle_->publisher();
    if (ec)
        co_return Result{ec};
    co_return Result{co_await client->unwatch()};
}

asio::awaitable<std::tuple<std::error_code, std::shared_ptr<KvClient>>>
RedisBridge::provide(std::weak_ptr<RedisBridge> w) {
    auto self = w.lock();
    if (!self)
        co_return std::make_tuple(make_error(errc::stopped), std::shared_ptr<KvClient>{});
    co_return co_await self->command_client();
}

ClientProvider RedisBridge::provider() {
    return [w = weak_from_this()] { return provide(w); };
}

std::shared_ptr<CommandQueue> RedisBridge::pipeline() {
    return std::make_shared<CommandQueue>(strand_, provider(), make_child_logger(log_, "pipeline"));
}

std::shared_ptr<TransactionCoordinator> RedisBridge::multi() {
    WatchSet watched;
    {
        std::scoped_lock lk(watch_mtx_);
        watched = std::exchange(pending_watch_, {});
    }
    return std::make_shared<TransactionCoordinator>(strand_, provider(), std::move(watched), make_child_logger(log_, "multi"));
}

// ---- introspection ----

std::vector<std::string> RedisBridge::subscribed_channels() const {
    auto active = registry_.list_active();
    return {active.channels.begin(), active.channels.end()};
}

std::vector<std::string> RedisBridge::subscribed_patterns() const {
    auto active = registry_.list_active();
    return {active.patterns.begin(), active.patterns.end()};
}

std::size_t RedisBridge::subscription_count() const {
    return registry_.total();
}

RedisBridge::StatusReport RedisBridge::status_report() const {
    auto active = registry_.list_active();
    return StatusReport{
        status(),
        {active.channels.begin(), active.channels.end()},
        {active.patterns.begin(), active.patterns.end()},
        lifecycle_->workers(),
        lifecycle_->has_publisher(),
        lifecycle_->generation(),
        dispatcher_->dispatched(),
        dispatcher_->dropped(),
        lifecycle_->dropped_pushes(),
    };
}

} // namespace redis_bridge
