#pragma once
/**
 * @file bridge_async.hpp
 * @brief Completion helpers shared by the bridge, its queues and the hiredis client.
 */

#include <boost/asio.hpp>
#include <boost/asio/experimental/channel.hpp>

#include <exception>
#include <memory>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>

#include "bridge_error.hpp"
#include "bridge_log.hpp"

namespace redis_bridge {
namespace asio = boost::asio;

namespace detail {

// Adapt completion handlers to either (args...) or single std::tuple<args...>
template <class H, class... Args>
inline void complete(H &h, Args &&...args) {
    if constexpr (std::is_invocable_v<H &, Args...>) {
        h(std::forward<Args>(args)...);
    } else {
        h(std::make_tuple(std::forward<Args>(args)...));
    }
}

// Route completion to the handler's associated executor.
// Arguments are decay-copied so nothing dangles across the dispatch.
template <class H, class FallbackExecutor, class... Args>
inline void complete_on_associated(H &&h, const FallbackExecutor &fallback, Args &&...args) {
    using Handler = std::decay_t<H>;
    Handler h2 = std::forward<H>(h);

    auto ex = asio::get_associated_executor(h2, fallback);
    auto alloc = asio::get_associated_allocator(h2);

    auto tup = std::make_tuple(std::decay_t<Args>(std::forward<Args>(args))...);
    auto thunk = [h3 = std::move(h2), tup = std::move(tup)]() mutable {
        std::apply([&](auto &&...as) { complete(h3, std::forward<decltype(as)>(as)...); }, tup);
    };
    asio::dispatch(asio::bind_executor(ex, asio::bind_allocator(alloc, std::move(thunk))));
}

/**
 * Run `op` on `strand` and hand its result tuple to `handler`.
 *
 * `keep_alive` is held until the coroutine finishes. An exception escaping
 * the coroutine is logged and reported as errc::internal_error with
 * default-constructed values.
 */
template <class Handler, class Executor, class KeepAlive, class... Ts>
void spawn_complete(const Executor &strand,
                    KeepAlive keep_alive,
                    std::shared_ptr<Logger> log,
                    asio::awaitable<std::tuple<std::error_code, Ts...>> op,
                    Handler &&handler) {
    asio::co_spawn(
        strand, std::move(op),
        [h = std::forward<Handler>(handler), strand, keep_alive = std::move(keep_alive), log = std::move(log)](
            std::exception_ptr ep, std::tuple<std::error_code, Ts...> result) mutable {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception &e) {
                    RBRIDGE_ERROR_RT(log, "operation failed with exception: {}", e.what());
                }
                result = std::tuple<std::error_code, Ts...>{};
                std::get<0>(result) = make_error(errc::internal_error);
            }
            std::apply([&](auto &&...xs) { complete_on_associated(std::move(h), strand, std::move(xs)...); },
                       std::move(result));
        });
}

/**
 * AsyncGate
 *
 * Coroutine mutex over a one-slot channel. Holding the slot means holding the
 * gate. Must only be used from a single strand.
 */
class AsyncGate {
  public:
    explicit AsyncGate(asio::any_io_executor ex) : ch_(std::move(ex), 1) {}

    class Guard {
      public:
        Guard() = default;
        explicit Guard(AsyncGate *g) : g_(g) {}
        Guard(Guard &&o) noexcept : g_(std::exchange(o.g_, nullptr)) {}
        Guard &operator=(Guard &&o) noexcept {
            if (this != &o) {
                release();
                g_ = std::exchange(o.g_, nullptr);
            }
            return *this;
        }
        ~Guard() { release(); }
        explicit operator bool() const noexcept { return g_ != nullptr; }
        void release() noexcept {
            if (g_)
                g_->unlock();
            g_ = nullptr;
        }

      private:
        AsyncGate *g_{nullptr};
    };

    // Resolves to an empty guard once the gate has been closed.
    asio::awaitable<Guard> acquire() {
        auto [ec] = co_await ch_.async_send(boost::system::error_code{}, asio::as_tuple(asio::use_awaitable));
        if (ec)
            co_return Guard{};
        co_return Guard{this};
    }

    bool busy() const noexcept { return ch_.ready(); }

    void close() { ch_.close(); }

  private:
    void unlock() noexcept {
        ch_.try_receive([](boost::system::error_code) {});
    }

    asio::experimental::channel<void(boost::system::error_code)> ch_;
};

} // namespace detail
} // namespace redis_bridge
