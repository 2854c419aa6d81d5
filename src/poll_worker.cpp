#include "poll_worker.hpp"

#include <utility>

#include "backoff.hpp"
#include "bridge_error.hpp"

namespace redis_bridge {

namespace asio = boost::asio;

std::string_view to_string(PollWorker::State s) noexcept {
    switch (s) {
    case PollWorker::State::idle:
        return "idle";
    case PollWorker::State::polling:
        return "polling";
    case PollWorker::State::dispatching:
        return "dispatching";
    case PollWorker::State::stopped:
        return "stopped";
    }
    return "unknown";
}

PollWorker::PollWorker(asio::any_io_executor strand,
                       std::uint64_t id,
                       std::shared_ptr<KvClient> connection,
                       std::shared_ptr<EventDispatcher> dispatcher,
                       PollOptions opts,
                       std::shared_ptr<Logger> log)
    : strand_(std::move(strand)),
      id_(id),
      conn_(std::move(connection)),
      dispatcher_(std::move(dispatcher)),
      opts_(opts),
      log_(log ? std::move(log) : make_null_logger()),
      backoff_timer_(strand_),
      stopped_signal_(strand_, asio::steady_timer::time_point::max()) {}

void PollWorker::start() {
    if (state_ != State::idle)
        return;
    active_.store(true, std::memory_order_relaxed);
    state_ = State::polling;
    RBRIDGE_DEBUG_RT(log_, "worker {} started", id_);
    asio::co_spawn(strand_, run(), [self = shared_from_this()](std::exception_ptr ep) {
        if (!ep)
            return;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception &e) {
            RBRIDGE_ERROR_RT(self->log_, "worker {} terminated by exception: {}", self->id_, e.what());
        }
        self->finish();
    });
}

void PollWorker::request_stop() noexcept {
    active_.store(false, std::memory_order_relaxed);
    backoff_timer_.cancel();
}

asio::awaitable<void> PollWorker::stop() {
    request_stop();
    if (state_ == State::idle) {
        state_ = State::stopped;
        co_return;
    }
    if (state_ == State::stopped)
        co_return;
    auto self = shared_from_this();
    co_await stopped_signal_.async_wait(asio::as_tuple(asio::use_awaitable));
}

std::chrono::milliseconds PollWorker::next_backoff() noexcept {
    backoff_ = detail::next_backoff(backoff_, opts_.retry_initial, opts_.retry_max);
    return backoff_;
}

void PollWorker::check_dropped() {
    const auto total = conn_->dropped();
    if (total == seen_dropped_) {
        overflowing_ = false;
        return;
    }
    const auto fresh = total - seen_dropped_;
    seen_dropped_ = total;
    if (std::exchange(overflowing_, true))
        return;
    RBRIDGE_WARN_RT(log_, "worker {} connection dropped {} push(es), {} in total", id_, fresh, total);
    if (on_overflow_)
        on_overflow_(fresh, total);
}

void PollWorker::finish() noexcept {
    active_.store(false, std::memory_order_relaxed);
    state_ = State::stopped;
    stopped_signal_.cancel();
}

asio::awaitable<void> PollWorker::run() {
    auto self = shared_from_this();
    while (active_.load(std::memory_order_relaxed)) {
        state_ = State::polling;
        auto [ec, msg] = co_await conn_->next_message(opts_.poll_timeout);
        check_dropped();

        if (ec) {
            if (ec == errc::stopped || ec == errc::connection_lost) {
                if (active_.load(std::memory_order_relaxed)) {
                    RBRIDGE_WARN_RT(log_, "worker {} lost its connection: {}", id_, ec.message());
                    if (on_lost_)
                        on_lost_(id_, ec);
                }
                break;
            }
            ++failures_;
            const auto delay = next_backoff();
            RBRIDGE_WARN_RT(log_, "worker {} poll failed ({} in a row): {}; retry in {} ms",
                            id_, failures_, ec.message(), delay.count());
            if (opts_.failure_threshold > 0 && failures_ % opts_.failure_threshold == 0 && on_failure_)
                on_failure_(ec, failures_);
            if (!active_.load(std::memory_order_relaxed))
                break;
            backoff_timer_.expires_after(delay);
            co_await backoff_timer_.async_wait(asio::as_tuple(asio::use_awaitable));
            continue;
        }

        failures_ = 0;
        backoff_ = {};
        if (!msg)
            continue;

        // A message already pulled is still delivered; the dispatcher drops it
        // if its subscription is no longer active.
        state_ = State::dispatching;
        co_await dispatcher_->dispatch(std::move(*msg));
        ++delivered_;
    }
    RBRIDGE_DEBUG_RT(log_, "worker {} stopped after {} messages", id_, delivered_);
    finish();
}

} // namespace redis_bridge
