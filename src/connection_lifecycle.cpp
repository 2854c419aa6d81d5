#include "connection_lifecycle.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>

#include <format>

#include "backoff.hpp"
#include "bridge_error.hpp"

namespace redis_bridge {

namespace asio = boost::asio;

ConnectionLifecycleManager::ConnectionLifecycleManager(asio::any_io_executor strand,
                                                       std::shared_ptr<KvClientFactory> factory,
                                                       std::shared_ptr<EventDispatcher> dispatcher,
                                                       BridgeOptions opts,
                                                       std::shared_ptr<Logger> log)
    : strand_(std::move(strand)),
      factory_(std::move(factory)),
      dispatcher_(std::move(dispatcher)),
      opts_(std::move(opts)),
      log_(log ? std::move(log) : make_null_logger()),
      gate_(strand_),
      publisher_gate_(strand_),
      rebuild_timer_(strand_) {}

Subscriptions ConnectionLifecycleManager::live() const {
    return current_.conn ? current_.conn->subscriptions() : Subscriptions{};
}

std::vector<ConnectionLifecycleManager::WorkerStatus> ConnectionLifecycleManager::workers() const {
    std::vector<WorkerStatus> out;
    if (current_.worker)
        out.push_back({current_.worker->id(), current_.worker->state(), current_.worker->delivered()});
    return out;
}

asio::awaitable<std::error_code> ConnectionLifecycleManager::reconcile(Subscriptions desired) {
    auto self = shared_from_this();
    auto guard = co_await gate_.acquire();
    if (!guard)
        co_return make_error(errc::stopped);
    if (desired == live())
        co_return std::error_code{};
    co_return co_await replace_locked(std::move(desired));
}

asio::awaitable<std::error_code> ConnectionLifecycleManager::rebuild(std::uint64_t worker_id) {
    auto self = shared_from_this();
    const auto epoch = epoch_;
    auto guard = co_await gate_.acquire();
    if (!guard)
        co_return make_error(errc::stopped);
    // Torn down, replaced or retired in the meantime.
    if (epoch != epoch_ || !current_.conn || (worker_id != 0 && (!current_.worker || current_.worker->id() != worker_id)))
        co_return std::error_code{};
    co_return co_await replace_locked(live());
}

std::uint64_t ConnectionLifecycleManager::dropped_pushes() const noexcept {
    return retired_dropped_ + (current_.conn ? current_.conn->dropped() : 0);
}

asio::awaitable<std::error_code> ConnectionLifecycleManager::replace_locked(Subscriptions desired) {
    if (desired.empty()) {
        if (current_.conn) {
            auto old = std::exchange(current_, Slot{});
            ++generation_;
            RBRIDGE_DEBUG_RT(log_, "no subscriptions left, retiring connection");
            co_await retire(std::move(old));
            emit(Event::retired, {});
        }
        co_return std::error_code{};
    }

    if (current_.conn)
        emit(Event::reconnecting, current_.conn->subscriptions());

    auto [ec, next] = co_await provision(desired);
    if (ec) {
        RBRIDGE_WARN_RT(log_, "could not provision subscription connection ({} channels, {} patterns): {}",
                        desired.channels.size(), desired.patterns.size(), ec.message());
        co_return ec;
    }

    auto old = std::exchange(current_, std::move(next));
    ++generation_;
    if (old.conn)
        co_await retire(std::move(old));
    activate(current_);
    RBRIDGE_INFO_RT(log_, "subscription connection generation {} ready ({} channels, {} patterns)",
                    generation_, desired.channels.size(), desired.patterns.size());
    emit(Event::ready, desired);
    co_return std::error_code{};
}

asio::awaitable<std::tuple<std::error_code, ConnectionLifecycleManager::Slot>>
ConnectionLifecycleManager::provision(Subscriptions desired) {
    auto conn = factory_->create(std::move(desired));
    if (!conn)
        co_return std::make_tuple(make_error(errc::internal_error), Slot{});

    if (auto ec = co_await conn->connect()) {
        conn->close();
        co_return std::make_tuple(ec, Slot{});
    }

    const auto id = ++next_worker_id_;
    auto worker = std::make_shared<PollWorker>(strand_, id, conn, dispatcher_, opts_.poll,
                                               make_child_logger(log_, std::format("poll#{}", id)));
    std::weak_ptr<ConnectionLifecycleManager> w = weak_from_this();
    worker->set_lost_handler([w](std::uint64_t worker_id, std::error_code) {
        if (auto self = w.lock())
            self->on_worker_lost(worker_id);
    });
    worker->set_failure_handler([w](std::error_code ec, std::size_t consecutive) {
        if (auto self = w.lock())
            self->report(ec, std::format("subscription poll failed {} times in a row", consecutive));
    });
    worker->set_overflow_handler([w](std::uint64_t fresh, std::uint64_t total) {
        if (auto self = w.lock())
            self->report(make_error(errc::backlog_overflow),
                         std::format("subscription connection dropped {} message(s), {} in total", fresh, total));
    });
    co_return std::make_tuple(std::error_code{}, Slot{std::move(conn), std::move(worker)});
}

void ConnectionLifecycleManager::activate(Slot &slot) {
    if (slot.worker)
        slot.worker->start();
}

asio::awaitable<void> ConnectionLifecycleManager::retire(Slot slot) {
    using namespace asio::experimental::awaitable_operators;
    if (slot.worker) {
        asio::steady_timer limit(strand_, opts_.retire_timeout);
        auto which = co_await (slot.worker->stop() || limit.async_wait(asio::as_tuple(asio::use_awaitable)));
        if (which.index() == 1)
            RBRIDGE_WARN_RT(log_, "worker {} still running after {} ms, closing its connection anyway",
                            slot.worker->id(), opts_.retire_timeout.count());
    }
    if (slot.conn) {
        slot.conn->close();
        retired_dropped_ += slot.conn->dropped();
    }
}

void ConnectionLifecycleManager::on_worker_lost(std::uint64_t worker_id) {
    asio::co_spawn(strand_, rebuild_after_loss(worker_id), [self = shared_from_this()](std::exception_ptr ep) {
        if (!ep)
            return;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception &e) {
            RBRIDGE_ERROR_RT(self->log_, "rebuild terminated by exception: {}", e.what());
        }
    });
}

asio::awaitable<void> ConnectionLifecycleManager::rebuild_after_loss(std::uint64_t worker_id) {
    auto self = shared_from_this();
    const auto epoch = epoch_;
    std::chrono::milliseconds delay{};
    for (;;) {
        auto ec = co_await rebuild(worker_id);
        if (!ec || ec == errc::stopped || epoch != epoch_)
            co_return;
        report(ec, "rebuild of lost subscription connection failed");
        delay = detail::next_backoff(delay, opts_.rebuild_backoff_initial, opts_.rebuild_backoff_max);
        rebuild_timer_.expires_after(delay);
        auto [tec] = co_await rebuild_timer_.async_wait(asio::as_tuple(asio::use_awaitable));
        if (tec || epoch != epoch_)
            co_return;
    }
}

asio::awaitable<std::tuple<std::error_code, std::shared_ptr<KvClient>>> ConnectionLifecycleManager::publisher() {
    auto self = shared_from_this();
    if (publisher_)
        co_return std::make_tuple(std::error_code{}, publisher_);

    auto guard = co_await publisher_gate_.acquire();
    if (!guard)
        co_return std::make_tuple(make_error(errc::stopped), std::shared_ptr<KvClient>{});
    if (publisher_)
        co_return std::make_tuple(std::error_code{}, publisher_);

    auto conn = factory_->create({});
    if (!conn)
        co_return std::make_tuple(make_error(errc::internal_error), std::shared_ptr<KvClient>{});
    if (auto ec = co_await conn->connect()) {
        conn->close();
        RBRIDGE_WARN_RT(log_, "publisher connection failed: {}", ec.message());
        co_return std::make_tuple(ec, std::shared_ptr<KvClient>{});
    }
    publisher_ = conn;
    RBRIDGE_DEBUG_RT(log_, "publisher connection ready");
    co_return std::make_tuple(std::error_code{}, std::move(conn));
}

asio::awaitable<void> ConnectionLifecycleManager::cleanup() {
    auto self = shared_from_this();
    ++epoch_;
    rebuild_timer_.cancel();
    {
        auto guard = co_await gate_.acquire();
        if (current_.conn) {
            auto old = std::exchange(current_, Slot{});
            ++generation_;
            co_await retire(std::move(old));
            emit(Event::retired, {});
        }
    }
    {
        auto guard = co_await publisher_gate_.acquire();
        if (auto p = std::exchange(publisher_, nullptr))
            p->close();
    }
}

void ConnectionLifecycleManager::emit(Event ev, const Subscriptions &live) {
    if (on_event_)
        on_event_(ev, live);
}

void ConnectionLifecycleManager::report(std::error_code ec, std::string_view context) {
    RBRIDGE_ERROR_RT(log_, "{}: {}", context, ec.message());
    if (on_error_)
        on_error_(ec, context);
}

} // namespace redis_bridge
