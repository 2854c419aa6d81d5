#pragma once
/**
 * @file fake_kv_server.hpp
 * @brief In-memory stand-in for a Redis server and its connections, for unit
 *        tests that must run without a live server.
 */

#include <boost/asio.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/experimental/parallel_group.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <deque>
#include <fnmatch.h>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "bridge_config.hpp"
#include "bridge_error.hpp"
#include "command_queue.hpp"
#include "kv_client.hpp"
#include "redis_value.hpp"

namespace redis_bridge::test {

namespace asio = boost::asio;

class FakeKvClient;

/**
 * FakeKvServer
 *
 * Strings, lists and hashes keyed by name, each key with a version bumped on
 * every write (the WATCH token). PUBLISH fans out to the connected clients
 * according to their fixed subscription sets.
 *
 * Single-threaded: drive it from one io_context thread.
 */
class FakeKvServer {
  public:
    struct Entry {
        enum class Kind { string,
                          list,
                          hash } kind{Kind::string};
        std::string str;
        std::deque<std::string> list;
        std::map<std::string, std::string> hash;
        std::optional<long long> ttl;
    };

    // attributed: one push per matching subscription, tagged with its pattern.
    // fan_out: one untagged push per subscribed client.
    DispatchMode delivery{DispatchMode::attributed};
    // When false, clients report every watch as intact and the server-side EXEC check decides.
    bool local_watch_check{true};

    // Capacity of each client's push inbox; pushes beyond it are dropped.
    std::size_t max_backlog{1024};
    // Runs once a connection is established, before connect() returns.
    std::function<void(FakeKvClient &)> on_connect;

    // ---- failure injection ----
    int fail_connects{0};
    int poll_errors{0};
    std::chrono::milliseconds connect_delay{0};

    // ---- counters ----
    int connects{0};
    int connecting{0};
    int max_connecting{0};
    int batches{0};
    int commands{0};
    int unwatches{0};

    RedisValue execute(const std::vector<std::string> &argv);
    long long publish(const std::string &channel, const std::string &payload);

    std::uint64_t version(const std::string &key) const {
        auto it = versions_.find(key);
        return it == versions_.end() ? 0 : it->second;
    }
    bool exists(const std::string &key) const { return data_.contains(key); }

    void attach(const std::shared_ptr<FakeKvClient> &c) { clients_.push_back(c); }

    // Live connections; with `subscribers_only`, only those holding subscriptions.
    std::vector<std::shared_ptr<FakeKvClient>> connected(bool subscribers_only = false) const;

    // Simulates the server dropping every connection that holds subscriptions.
    void drop_subscribers();

  private:
    void touch(const std::string &key) { ++versions_[key]; }
    Entry *lookup(const std::string &key) {
        auto it = data_.find(key);
        return it == data_.end() ? nullptr : &it->second;
    }
    RedisValue incr_by(const std::string &key, long long by);

    std::map<std::string, Entry> data_;
    std::map<std::string, std::uint64_t> versions_;
    std::vector<std::weak_ptr<FakeKvClient>> clients_;
};

/**
 * FakeKvClient
 *
 * One connection to a FakeKvServer. Pushes are buffered in a channel drained
 * by next_message().
 */
class FakeKvClient final : public KvClient, public std::enable_shared_from_this<FakeKvClient> {
  public:
    FakeKvClient(asio::any_io_executor exec, FakeKvServer &server, Subscriptions subs)
        : exec_(std::move(exec)), server_(server), subs_(std::move(subs)), inbox_(exec_, server.max_backlog) {}

    asio::awaitable<std::error_code> connect() override {
        auto self = shared_from_this();
        server_.max_connecting = std::max(server_.max_connecting, ++server_.connecting);
        auto ec = co_await establish();
        --server_.connecting;
        if (!ec && server_.on_connect)
            server_.on_connect(*this);
        co_return ec;
    }

    void close() noexcept override {
        closed_ = true;
        connected_ = false;
        inbox_.close();
    }

    bool is_connected() const noexcept override { return connected_; }
    bool closed() const noexcept { return closed_; }
    const Subscriptions &subscriptions() const noexcept override { return subs_; }

    asio::awaitable<std::tuple<std::error_code, RedisValue>> execute(std::vector<std::string> argv) override {
        if (!connected_)
            co_return std::make_tuple(make_error(errc::not_connected), RedisValue{});
        if (argv.empty())
            co_return std::make_tuple(make_error(errc::invalid_argument), RedisValue{});
        co_return std::make_tuple(std::error_code{}, server_.execute(argv));
    }

    asio::awaitable<std::tuple<std::error_code, BatchReply>> execute_batch(BatchRequest request) override {
        ++server_.batches;
        if (!connected_)
            co_return std::make_tuple(make_error(errc::not_connected), BatchReply{});
        if (request.atomic) {
            for (auto &[key, token] : request.watched)
                if (server_.version(key) != token)
                    co_return std::make_tuple(std::error_code{}, BatchReply{});
        }
        std::vector<RedisValue> replies;
        replies.reserve(request.commands.size());
        for (auto &c : request.commands)
            replies.push_back(server_.execute(c.argv()));
        co_return std::make_tuple(std::error_code{}, BatchReply{std::move(replies)});
    }

    asio::awaitable<std::tuple<std::error_code, std::optional<PublishMessage>>>
    next_message(std::chrono::milliseconds timeout) override {
        auto self = shared_from_this();
        if (server_.poll_errors > 0) {
            --server_.poll_errors;
            co_return std::make_tuple(protocol_error(), std::optional<PublishMessage>{});
        }
        asio::steady_timer t(co_await asio::this_coro::executor, timeout);
        auto [order, ec, msg, timer_ec] =
            co_await asio::experimental::make_parallel_group(inbox_.async_receive(asio::deferred),
                                                             t.async_wait(asio::deferred))
                .async_wait(asio::experimental::wait_for_one(), asio::use_awaitable);
        // A receive that finished after the timer still holds its message.
        if (!ec)
            co_return std::make_tuple(std::error_code{}, std::optional<PublishMessage>{std::move(msg)});
        if (order[0] == 1)
            co_return std::make_tuple(std::error_code{}, std::optional<PublishMessage>{});
        co_return std::make_tuple(make_error(errc::stopped), std::optional<PublishMessage>{});
    }

    asio::awaitable<std::tuple<std::error_code, WatchSet>> watch(std::vector<std::string> keys) override {
        if (!connected_)
            co_return std::make_tuple(make_error(errc::not_connected), WatchSet{});
        WatchSet out;
        for (auto &k : keys)
            out.emplace(k, server_.version(k));
        co_return std::make_tuple(std::error_code{}, std::move(out));
    }

    asio::awaitable<std::error_code> unwatch() override {
        if (!connected_)
            co_return make_error(errc::not_connected);
        ++server_.unwatches;
        co_return std::error_code{};
    }

    bool watch_intact(const WatchSet &watched) const noexcept override {
        if (!server_.local_watch_check)
            return true;
        for (auto &[key, token] : watched)
            if (server_.version(key) != token)
                return false;
        return true;
    }

    std::uint64_t dropped() const noexcept override { return dropped_; }

    // Called by the server.
    void push(PublishMessage pm) {
        if (connected_ && !inbox_.try_send(boost::system::error_code{}, std::move(pm)))
            ++dropped_;
    }

    // The server went away: pending and future polls fail with `stopped`.
    void lose() {
        connected_ = false;
        inbox_.close();
    }

  private:
    asio::awaitable<std::error_code> establish() {
        if (server_.connect_delay.count() > 0) {
            asio::steady_timer t(co_await asio::this_coro::executor, server_.connect_delay);
            co_await t.async_wait(asio::as_tuple(asio::use_awaitable));
        }
        if (closed_)
            co_return make_error(errc::stopped);
        if (server_.fail_connects > 0) {
            --server_.fail_connects;
            co_return make_error(errc::connect_failed);
        }
        ++server_.connects;
        connected_ = true;
        server_.attach(shared_from_this());
        co_return std::error_code{};
    }

    asio::any_io_executor exec_;
    FakeKvServer &server_;
    const Subscriptions subs_;
    asio::experimental::channel<void(boost::system::error_code, PublishMessage)> inbox_;
    bool connected_{false};
    bool closed_{false};
    std::uint64_t dropped_{0};
};

/**
 * FakeKvFactory
 *
 * Records every connection it hands out.
 */
class FakeKvFactory final : public KvClientFactory {
  public:
    FakeKvFactory(asio::any_io_executor exec, FakeKvServer &server) : exec_(std::move(exec)), server_(server) {}

    std::shared_ptr<KvClient> create(Subscriptions subscriptions) override {
        auto c = std::make_shared<FakeKvClient>(exec_, server_, std::move(subscriptions));
        created.push_back(c);
        return c;
    }

    std::size_t subscriber_connections() const {
        return std::count_if(created.begin(), created.end(), [](auto &c) { return !c->subscriptions().empty(); });
    }

    std::vector<std::shared_ptr<FakeKvClient>> created;

  private:
    asio::any_io_executor exec_;
    FakeKvServer &server_;
};

// ---- FakeKvServer ----

inline std::vector<std::shared_ptr<FakeKvClient>> FakeKvServer::connected(bool subscribers_only) const {
    std::vector<std::shared_ptr<FakeKvClient>> out;
    for (auto &w : clients_) {
        auto c = w.lock();
        if (!c || !c->is_connected())
            continue;
        if (subscribers_only && c->subscriptions().empty())
            continue;
        out.push_back(std::move(c));
    }
    return out;
}

inline void FakeKvServer::drop_subscribers() {
    for (auto &c : connected(true))
        c->lose();
}

inline long long FakeKvServer::publish(const std::string &channel, const std::string &payload) {
    long long receivers = 0;
    for (auto &c : connected(true)) {
        const auto &subs = c->subscriptions();
        if (delivery == DispatchMode::fan_out) {
            bool match = subs.channels.contains(channel);
            for (auto &p : subs.patterns)
                match = match || ::fnmatch(p.c_str(), channel.c_str(), 0) == 0;
            if (match) {
                c->push({channel, payload, std::nullopt});
                ++receivers;
            }
            continue;
        }
        if (subs.channels.contains(channel)) {
            c->push({channel, payload, std::nullopt});
            ++receivers;
        }
        for (auto &p : subs.patterns) {
            if (::fnmatch(p.c_str(), channel.c_str(), 0) == 0) {
                c->push({channel, payload, p});
                ++receivers;
            }
        }
    }
    return receivers;
}

inline RedisValue FakeKvServer::incr_by(const std::string &key, long long by) {
    auto *e = lookup(key);
    long long current = 0;
    if (e) {
        if (e->kind != Entry::Kind::string)
            return RedisValue::error("WRONGTYPE Operation against a key holding the wrong kind of value");
        try {
            std::size_t used = 0;
            current = std::stoll(e->str, &used);
            if (used != e->str.size())
                return RedisValue::error("ERR value is not an integer or out of range");
        } catch (const std::exception &) {
            return RedisValue::error("ERR value is not an integer or out of range");
        }
    }
    current += by;
    auto &slot = data_[key];
    slot.kind = Entry::Kind::string;
    slot.str = std::to_string(current);
    touch(key);
    return RedisValue::integer(current);
}

inline RedisValue FakeKvServer::execute(const std::vector<std::string> &argv) {
    ++commands;
    std::string cmd = argv.front();
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    const auto argc = argv.size();
    auto arity = [&](std::size_t n) { return argc == n; };
    auto wrong_arity = [&] {
        std::string lower = cmd;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return RedisValue::error("ERR wrong number of arguments for '" + lower + "' command");
    };
    auto wrongtype = [] { return RedisValue::error("WRONGTYPE Operation against a key holding the wrong kind of value"); };

    if (cmd == "PING")
        return argc > 1 ? RedisValue::string(argv[1]) : RedisValue::status("PONG");
    if (cmd == "ECHO")
        return arity(2) ? RedisValue::string(argv[1]) : wrong_arity();
    if (cmd == "QUIT" || cmd == "UNWATCH")
        return RedisValue::status("OK");
    if (cmd == "WATCH")
        return argc >= 2 ? RedisValue::status("OK") : wrong_arity();

    if (cmd == "SET") {
        if (argc != 3 && argc != 5)
            return wrong_arity();
        auto &e = data_[argv[1]];
        e = Entry{};
        e.str = argv[2];
        touch(argv[1]);
        return RedisValue::status("OK");
    }
    if (cmd == "GET") {
        if (!arity(2))
            return wrong_arity();
        auto *e = lookup(argv[1]);
        if (!e)
            return RedisValue::nil();
        return e->kind == Entry::Kind::string ? RedisValue::string(e->str) : wrongtype();
    }
    if (cmd == "DEL" || cmd == "EXISTS") {
        if (argc < 2)
            return wrong_arity();
        long long n = 0;
        for (std::size_t i = 1; i < argc; ++i) {
            if (!data_.contains(argv[i]))
                continue;
            ++n;
            if (cmd == "DEL") {
                data_.erase(argv[i]);
                touch(argv[i]);
            }
        }
        return RedisValue::integer(n);
    }
    if (cmd == "INCR" || cmd == "DECR") {
        if (!arity(2))
            return wrong_arity();
        return incr_by(argv[1], cmd == "INCR" ? 1 : -1);
    }
    if (cmd == "INCRBY" || cmd == "DECRBY") {
        if (!arity(3))
            return wrong_arity();
        long long by = 0;
        try {
            by = std::stoll(argv[2]);
        } catch (const std::exception &) {
            return RedisValue::error("ERR value is not an integer or out of range");
        }
        return incr_by(argv[1], cmd == "INCRBY" ? by : -by);
    }
    if (cmd == "LPUSH" || cmd == "RPUSH") {
        if (argc < 3)
            return wrong_arity();
        auto *e = lookup(argv[1]);
        if (e && e->kind != Entry::Kind::list)
            return wrongtype();
        auto &slot = data_[argv[1]];
        slot.kind = Entry::Kind::list;
        for (std::size_t i = 2; i < argc; ++i) {
            if (cmd == "LPUSH")
                slot.list.push_front(argv[i]);
            else
                slot.list.push_back(argv[i]);
        }
        touch(argv[1]);
        return RedisValue::integer(static_cast<long long>(slot.list.size()));
    }
    if (cmd == "LLEN" || cmd == "LPOP") {
        if (!arity(2))
            return wrong_arity();
        auto *e = lookup(argv[1]);
        if (!e)
            return cmd == "LLEN" ? RedisValue::integer(0) : RedisValue::nil();
        if (e->kind != Entry::Kind::list)
            return wrongtype();
        if (cmd == "LLEN")
            return RedisValue::integer(static_cast<long long>(e->list.size()));
        auto v = e->list.front();
        e->list.pop_front();
        if (e->list.empty())
            data_.erase(argv[1]);
        touch(argv[1]);
        return RedisValue::string(std::move(v));
    }
    if (cmd == "HSET") {
        if (argc < 4 || argc % 2 != 0)
            return wrong_arity();
        auto *e = lookup(argv[1]);
        if (e && e->kind != Entry::Kind::hash)
            return wrongtype();
        auto &slot = data_[argv[1]];
        slot.kind = Entry::Kind::hash;
        long long added = 0;
        for (std::size_t i = 2; i + 1 < argc; i += 2)
            added += slot.hash.insert_or_assign(argv[i], argv[i + 1]).second ? 1 : 0;
        touch(argv[1]);
        return RedisValue::integer(added);
    }
    if (cmd == "HGET") {
        if (!arity(3))
            return wrong_arity();
        auto *e = lookup(argv[1]);
        if (!e)
            return RedisValue::nil();
        if (e->kind != Entry::Kind::hash)
            return wrongtype();
        auto it = e->hash.find(argv[2]);
        return it == e->hash.end() ? RedisValue::nil() : RedisValue::string(it->second);
    }
    if (cmd == "EXPIRE") {
        if (!arity(3))
            return wrong_arity();
        auto *e = lookup(argv[1]);
        if (!e)
            return RedisValue::integer(0);
        try {
            e->ttl = std::stoll(argv[2]);
        } catch (const std::exception &) {
            return RedisValue::error("ERR value is not an integer or out of range");
        }
        touch(argv[1]);
        return RedisValue::integer(1);
    }
    if (cmd == "TTL") {
        if (!arity(2))
            return wrong_arity();
        auto *e = lookup(argv[1]);
        if (!e)
            return RedisValue::integer(-2);
        return RedisValue::integer(e->ttl ? *e->ttl : -1);
    }
    if (cmd == "PUBLISH")
        return arity(3) ? RedisValue::integer(publish(argv[1], argv[2])) : wrong_arity();

    return RedisValue::error("ERR unknown command '" + argv.front() + "'");
}

// ---- helpers for coroutine-driven tests ----

inline asio::awaitable<std::tuple<std::error_code, std::shared_ptr<KvClient>>>
provide_fixed(std::shared_ptr<KvClient> client) {
    if (!client)
        co_return std::make_tuple(make_error(errc::not_connected), std::shared_ptr<KvClient>{});
    co_return std::make_tuple(std::error_code{}, std::move(client));
}

// Always hands out `client`.
inline ClientProvider fixed_provider(std::shared_ptr<KvClient> client) {
    return [client] { return provide_fixed(client); };
}

inline asio::awaitable<void> sleep_for(std::chrono::milliseconds d) {
    asio::steady_timer t(co_await asio::this_coro::executor, d);
    co_await t.async_wait(asio::as_tuple(asio::use_awaitable));
}

// Polls `pred` every few milliseconds; false when `limit` elapsed first.
inline asio::awaitable<bool> wait_until(std::function<bool()> pred,
                                        std::chrono::milliseconds limit = std::chrono::seconds(2)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline)
            co_return false;
        co_await sleep_for(std::chrono::milliseconds(5));
    }
    co_return true;
}

/**
 * Runs the coroutine returned by `make` on `ioc` and stops the context once it
 * finishes. Exceptions escaping the coroutine propagate out of this call.
 * Returns false when `limit` elapsed before the coroutine finished.
 */
template <class Make>
bool run_test(asio::io_context &ioc, Make &&make, std::chrono::milliseconds limit = std::chrono::seconds(10)) {
    bool done = false;
    asio::co_spawn(ioc, std::forward<Make>(make)(), [&](std::exception_ptr ep) {
        done = true;
        ioc.stop();
        if (ep)
            std::rethrow_exception(ep);
    });
    ioc.run_for(limit);
    return done;
}

} // namespace redis_bridge::test
