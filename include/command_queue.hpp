#pragma once
/**
 * @file command_queue.hpp
 * @brief Fluent command builder and the pipeline executor that turns one
 *        batched call into ordered per-command results.
 */

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include "bridge_async.hpp"
#include "bridge_error.hpp"
#include "bridge_log.hpp"
#include "kv_client.hpp"
#include "redis_value.hpp"

namespace redis_bridge {

/**
 * CommandResult
 *
 * Outcome of one queued command: `error` is empty on success, otherwise
 * `value` is nil.
 */
struct CommandResult {
    std::optional<CommandError> error;
    RedisValue value;

    bool ok() const noexcept { return !error; }
    bool operator==(const CommandResult &) const = default;
};

// One result per command, in order. Error replies become CommandError; a
// missing reply is reported as a PROTOCOL error for that command only.
std::vector<CommandResult> pack_results(std::size_t command_count, std::vector<RedisValue> replies);

// Supplies the connection commands are sent on.
using ClientProvider =
    std::function<boost::asio::awaitable<std::tuple<std::error_code, std::shared_ptr<KvClient>>>()>;

/**
 * CommandBuilder
 *
 * Appends QueuedCommands and returns the derived queue for chaining.
 */
template <class Derived>
class CommandBuilder {
  public:
    Derived &command(std::string name, std::vector<std::string> args = {}) {
        queue_.push_back({std::move(name), std::move(args)});
        return static_cast<Derived &>(*this);
    }

    Derived &ping() { return command("PING"); }
    Derived &get(std::string key) { return command("GET", {std::move(key)}); }
    Derived &set(std::string key, std::string value) {
        return command("SET", {std::move(key), std::move(value)});
    }
    Derived &set(std::string key, std::string value, std::chrono::milliseconds ttl) {
        return command("SET", {std::move(key), std::move(value), "PX", std::to_string(ttl.count())});
    }
    Derived &setnx(std::string key, std::string value) {
        return command("SETNX", {std::move(key), std::move(value)});
    }
    Derived &getset(std::string key, std::string value) {
        return command("GETSET", {std::move(key), std::move(value)});
    }
    Derived &append(std::string key, std::string value) {
        return command("APPEND", {std::move(key), std::move(value)});
    }
    Derived &strlen(std::string key) { return command("STRLEN", {std::move(key)}); }
    Derived &mget(std::vector<std::string> keys) { return command("MGET", std::move(keys)); }
    Derived &mset(std::vector<std::pair<std::string, std::string>> kvs) {
        std::vector<std::string> args;
        args.reserve(kvs.size() * 2);
        for (auto &[k, v] : kvs) {
            args.push_back(std::move(k));
            args.push_back(std::move(v));
        }
        return command("MSET", std::move(args));
    }
    Derived &del(std::string key) { return command("DEL", {std::move(key)}); }
    Derived &exists(std::string key) { return command("EXISTS", {std::move(key)}); }
    Derived &incr(std::string key) { return command("INCR", {std::move(key)}); }
    Derived &decr(std::string key) { return command("DECR", {std::move(key)}); }
    Derived &incrby(std::string key, long long by) {
        return command("INCRBY", {std::move(key), std::to_string(by)});
    }
    Derived &decrby(std::string key, long long by) {
        return command("DECRBY", {std::move(key), std::to_string(by)});
    }
    Derived &expire(std::string key, std::chrono::seconds ttl) {
        return command("EXPIRE", {std::move(key), std::to_string(ttl.count())});
    }
    Derived &ttl(std::string key) { return command("TTL", {std::move(key)}); }

    Derived &hset(std::string key, std::string field, std::string value) {
        return command("HSET", {std::move(key), std::move(field), std::move(value)});
    }
    Derived &hget(std::string key, std::string field) {
        return command("HGET", {std::move(key), std::move(field)});
    }
    Derived &hdel(std::string key, std::string field) {
        return command("HDEL", {std::move(key), std::move(field)});
    }
    Derived &hgetall(std::string key) { return command("HGETALL", {std::move(key)}); }

    Derived &lpush(std::string key, std::string value) {
        return command("LPUSH", {std::move(key), std::move(value)});
    }
    Derived &rpush(std::string key, std::string value) {
        return command("RPUSH", {std::move(key), std::move(value)});
    }
    Derived &lpop(std::string key) { return command("LPOP", {std::move(key)}); }
    Derived &rpop(std::string key) { return command("RPOP", {std::move(key)}); }
    Derived &llen(std::string key) { return command("LLEN", {std::move(key)}); }
    Derived &lrange(std::string key, long long start, long long stop) {
        return command("LRANGE", {std::move(key), std::to_string(start), std::to_string(stop)});
    }

    Derived &sadd(std::string key, std::string member) {
        return command("SADD", {std::move(key), std::move(member)});
    }
    Derived &srem(std::string key, std::string member) {
        return command("SREM", {std::move(key), std::move(member)});
    }
    Derived &smembers(std::string key) { return command("SMEMBERS", {std::move(key)}); }
    Derived &sismember(std::string key, std::string member) {
        return command("SISMEMBER", {std::move(key), std::move(member)});
    }

    Derived &publish(std::string channel, std::string payload) {
        return command("PUBLISH", {std::move(channel), std::move(payload)});
    }

    std::size_t size() const noexcept { return queue_.size(); }
    bool empty() const noexcept { return queue_.empty(); }
    const std::vector<QueuedCommand> &commands() const noexcept { return queue_; }

  protected:
    std::vector<QueuedCommand> take_queue() { return std::exchange(queue_, {}); }
    void clear_queue() noexcept { queue_.clear(); }

  private:
    std::vector<QueuedCommand> queue_;
};

/**
 * CommandQueue
 *
 * Pipeline: the queue is sent as one non-atomic batch. A failing command
 * never affects its siblings. Created through std::make_shared.
 */
class CommandQueue : public CommandBuilder<CommandQueue>,
                     public std::enable_shared_from_this<CommandQueue> {
  public:
    CommandQueue(boost::asio::any_io_executor strand,
                 ClientProvider provider,
                 std::shared_ptr<Logger> log = make_null_logger());

    // Drops every queued command; a later exec() yields an empty result and sends nothing.
    CommandQueue &discard() noexcept {
        clear_queue();
        return *this;
    }

    /**
     * Send the queue as one batch.
     * Completion signature: void(std::error_code, std::vector<CommandResult>).
     *
     * The queue is taken when the operation is initiated. A second exec()
     * while one is running completes with errc::exec_in_progress.
     */
    template <typename CompletionToken>
    auto async_exec(CompletionToken &&token);

    bool executing() const noexcept { return executing_.load(std::memory_order_relaxed); }

  private:
    boost::asio::awaitable<std::tuple<std::error_code, std::vector<CommandResult>>>
    run_exec(std::vector<QueuedCommand> commands);

    boost::asio::any_io_executor strand_;
    ClientProvider provider_;
    std::shared_ptr<Logger> log_;
    std::atomic<bool> executing_{false};
};

template <typename CompletionToken>
auto CommandQueue::async_exec(CompletionToken &&token) {
    using Sig = void(std::error_code, std::vector<CommandResult>);
    return boost::asio::async_initiate<CompletionToken, Sig>(
        [self = shared_from_this()](auto handler) mutable {
            if (self->executing_.exchange(true)) {
                detail::complete_on_associated(std::move(handler), self->strand_,
                                               make_error(errc::exec_in_progress), std::vector<CommandResult>{});
                return;
            }
            auto op = self->run_exec(self->take_queue());
            detail::spawn_complete(self->strand_, self, self->log_, std::move(op), std::move(handler));
        },
        token);
}

} // namespace redis_bridge
