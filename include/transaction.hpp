#pragma once
/**
 * @file transaction.hpp
 * @brief MULTI/EXEC builder with optimistic locking on watched keys.
 */

#include <boost/asio.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <variant>
#include <vector>

#include "command_queue.hpp"

namespace redis_bridge {

/**
 * TransactionCoordinator
 *
 * Unwatched -> Watching (watch) -> Queuing (first append) -> Committed | Aborted.
 *
 * exec() first checks the watch tokens locally; a stale token aborts without
 * sending anything. Otherwise the queue runs as MULTI ... EXEC and a
 * server-side watch violation aborts as well. An aborted transaction
 * completes with an empty optional, never with an error. exec(), discard()
 * and unwatch() clear the watch set.
 *
 * Created through std::make_shared.
 */
class TransactionCoordinator : public CommandBuilder<TransactionCoordinator>,
                               public std::enable_shared_from_this<TransactionCoordinator> {
  public:
    enum class State { unwatched,
                       watching,
                       queuing };

    struct Committed {
        std::vector<CommandResult> results;
    };
    struct Aborted {};
    using Outcome = std::variant<Committed, Aborted>;

    TransactionCoordinator(boost::asio::any_io_executor strand,
                           ClientProvider provider,
                           WatchSet watched = {},
                           std::shared_ptr<Logger> log = make_null_logger());

    /**
     * WATCH `keys` on the command connection and remember their tokens.
     * Completion signature: void(std::error_code).
     */
    template <typename CompletionToken>
    auto async_watch(std::vector<std::string> keys, CompletionToken &&token);

    /**
     * Forget every watched key (UNWATCH). Completion signature: void(std::error_code).
     */
    template <typename CompletionToken>
    auto async_unwatch(CompletionToken &&token);

    /**
     * Run the transaction.
     * Completion signature: void(std::error_code, std::optional<std::vector<CommandResult>>);
     * nullopt means aborted by a watched key.
     */
    template <typename CompletionToken>
    auto async_exec(CompletionToken &&token);

    // Clears the queue and the watch set; UNWATCH is sent in the background.
    TransactionCoordinator &discard();

    State state() const noexcept;
    const WatchSet &watched() const noexcept { return watched_; }
    bool executing() const noexcept { return executing_.load(std::memory_order_relaxed); }

    static std::optional<std::vector<CommandResult>> collapse(Outcome outcome);

  private:
    boost::asio::awaitable<std::tuple<std::error_code>> run_watch(std::vector<std::string> keys);
    boost::asio::awaitable<std::tuple<std::error_code>> run_unwatch();
    boost::asio::awaitable<std::tuple<std::error_code, Outcome>>
    run_transaction(std::vector<QueuedCommand> commands, WatchSet watched);
    boost::asio::awaitable<std::tuple<std::error_code, std::optional<std::vector<CommandResult>>>>
    run_exec(std::vector<QueuedCommand> commands, WatchSet watched);

    boost::asio::any_io_executor strand_;
    ClientProvider provider_;
    WatchSet watched_;
    std::shared_ptr<Logger> log_;
    std::atomic<bool> executing_{false};
};

std::string_view to_string(TransactionCoordinator::State s) noexcept;

template <typename CompletionToken>
auto TransactionCoordinator::async_watch(std::vector<std::string> keys, CompletionToken &&token) {
    return boost::asio::async_initiate<CompletionToken, void(std::error_code)>(
        [self = shared_from_this(), keys = std::move(keys)](auto handler) mutable {
            if (keys.empty()) {
                detail::complete_on_associated(std::move(handler), self->strand_, make_error(errc::invalid_argument));
                return;
            }
            auto op = self->run_watch(std::move(keys));
            detail::spawn_complete(self->strand_, self, self->log_, std::move(op), std::move(handler));
        },
        token);
}

template <typename CompletionToken>
auto TransactionCoordinator::async_unwatch(CompletionToken &&token) {
    return boost::asio::async_initiate<CompletionToken, void(std::error_code)>(
        [self = shared_from_this()](auto handler) mutable {
            auto op = self->run_unwatch();
            detail::spawn_complete(self->strand_, self, self->log_, std::move(op), std::move(handler));
        },
        token);
}

template <typename CompletionToken>
auto TransactionCoordinator::async_exec(CompletionToken &&token) {
    using Sig = void(std::error_code, std::optional<std::vector<CommandResult>>);
    return boost::asio::async_initiate<CompletionToken, Sig>(
        [self = shared_from_this()](auto handler) mutable {
            if (self->executing_.exchange(true)) {
                detail::complete_on_associated(std::move(handler), self->strand_,
                                               make_error(errc::exec_in_progress),
                                               std::optional<std::vector<CommandResult>>{});
                return;
            }
            auto op = self->run_exec(self->take_queue(), std::exchange(self->watched_, {}));
            detail::spawn_complete(self->strand_, self, self->log_, std::move(op), std::move(handler));
        },
        token);
}

} // namespace redis_bridge
