#include "transaction.hpp"

namespace redis_bridge {

namespace asio = boost::asio;

std::string_view to_string(TransactionCoordinator::State s) noexcept {
    switch (s) {
    case TransactionCoordinator::State::unwatched:
        return "unwatched";
    case TransactionCoordinator::State::watching:
        return "watching";
    case TransactionCoordinator::State::queuing:
        return "queuing";
    }
    return "unknown";
}

TransactionCoordinator::TransactionCoordinator(asio::any_io_executor strand,
                                               ClientProvider provider,
                                               WatchSet watched,
                                               std::shared_ptr<Logger> log)
    : strand_(std::move(strand)),
      provider_(std::move(provider)),
      watched_(std::move(watched)),
      log_(log ? std::move(log) : make_null_logger()) {}

TransactionCoordinator::State TransactionCoordinator::state() const noexcept {
    if (!empty())
        return State::queuing;
    if (!watched_.empty())
        return State::watching;
    return State::unwatched;
}

std::optional<std::vector<CommandResult>> TransactionCoordinator::collapse(Outcome outcome) {
    if (auto *c = std::get_if<Committed>(&outcome))
        return std::move(c->results);
    return std::nullopt;
}

TransactionCoordinator &TransactionCoordinator::discard() {
    clear_queue();
    if (watched_.empty())
        return *this;
    watched_.clear();
    asio::co_spawn(strand_, run_unwatch(), [self = shared_from_this()](std::exception_ptr ep, std::tuple<std::error_code> r) {
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception &e) {
                RBRIDGE_WARN_RT(self->log_, "UNWATCH after discard threw: {}", e.what());
            }
            return;
        }
        if (auto ec = std::get<0>(r))
            RBRIDGE_WARN_RT(self->log_, "UNWATCH after discard failed: {}", ec.message());
    });
    return *this;
}

asio::awaitable<std::tuple<std::error_code>> TransactionCoordinator::run_watch(std::vector<std::string> keys) {
    auto [ec, client] = co_await provider_();
    if (ec)
        co_return std::make_tuple(ec);
    auto [wec, tokens] = co_await client->watch(std::move(keys));
    if (wec)
        co_return std::make_tuple(wec);
    // Keep the first token per key; a later WATCH of the same key does not refresh it.
    for (auto &[key, token] : tokens)
        watched_.try_emplace(key, token);
    co_return std::make_tuple(std::error_code{});
}

asio::awaitable<std::tuple<std::error_code>> TransactionCoordinator::run_unwatch() {
    watched_.clear();
    auto [ec, client] = co_await provider_();
    if (ec)
        co_return std::make_tuple(ec);
    co_return std::make_tuple(co_await client->unwatch());
}

asio::awaitable<std::tuple<std::error_code, TransactionCoordinator::Outcome>>
TransactionCoordinator::run_transaction(std::vector<QueuedCommand> commands, WatchSet watched) {
    if (commands.empty() && watched.empty())
        co_return std::make_tuple(std::error_code{}, Outcome{Committed{}});

    auto [ec, client] = co_await provider_();
    if (ec)
        co_return std::make_tuple(ec, Outcome{Aborted{}});

    if (commands.empty()) {
        if (auto uec = co_await client->unwatch())
            RBRIDGE_WARN_RT(log_, "UNWATCH failed: {}", uec.message());
        co_return std::make_tuple(std::error_code{}, Outcome{Committed{}});
    }

    if (!watched.empty() && !client->watch_intact(watched)) {
        RBRIDGE_DEBUG_RT(log_, "transaction aborted before sending: {} watched keys, at least one changed", watched.size());
        if (auto uec = co_await client->unwatch())
            RBRIDGE_WARN_RT(log_, "UNWATCH failed: {}", uec.message());
        co_return std::make_tuple(std::error_code{}, Outcome{Aborted{}});
    }

    const auto n = commands.size();
    auto [bec, reply] = co_await client->execute_batch(BatchRequest{std::move(commands), true, std::move(watched)});
    if (bec) {
        RBRIDGE_WARN_RT(log_, "transaction of {} commands failed: {}", n, bec.message());
        co_return std::make_tuple(bec, Outcome{Aborted{}});
    }
    if (!reply) {
        RBRIDGE_DEBUG_RT(log_, "transaction aborted by server: watched key changed");
        co_return std::make_tuple(std::error_code{}, Outcome{Aborted{}});
    }
    co_return std::make_tuple(std::error_code{}, Outcome{Committed{pack_results(n, std::move(*reply))}});
}

asio::awaitable<std::tuple<std::error_code, std::optional<std::vector<CommandResult>>>>
TransactionCoordinator::run_exec(std::vector<QueuedCommand> commands, WatchSet watched) {
    struct Release {
        std::atomic<bool> &flag;
        ~Release() { flag.store(false, std::memory_order_relaxed); }
    } release{executing_};

    auto [ec, outcome] = co_await run_transaction(std::move(commands), std::move(watched));
    if (ec)
        co_return std::make_tuple(ec, std::optional<std::vector<CommandResult>>{});
    co_return std::make_tuple(std::error_code{}, collapse(std::move(outcome)));
}

} // namespace redis_bridge
