#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "support/fake_kv_server.hpp"
#include "transaction.hpp"

namespace asio = boost::asio;
using namespace std::chrono_literals;
using namespace redis_bridge;
using namespace redis_bridge::test;
using State = TransactionCoordinator::State;
using Results = std::optional<std::vector<CommandResult>>;

namespace {

struct TxRig {
    FakeKvServer server;
    asio::io_context ioc;
    std::shared_ptr<FakeKvClient> conn = std::make_shared<FakeKvClient>(ioc.get_executor(), server, Subscriptions{});
    std::shared_ptr<FakeKvClient> other = std::make_shared<FakeKvClient>(ioc.get_executor(), server, Subscriptions{});
    std::shared_ptr<TransactionCoordinator> tx =
        std::make_shared<TransactionCoordinator>(ioc.get_executor(), fixed_provider(conn));

    asio::awaitable<void> connect_both() {
        auto a = co_await conn->connect();
        EXPECT_FALSE(a);
        auto b = co_await other->connect();
        EXPECT_FALSE(b);
    }

    // Direct read on the second connection.
    asio::awaitable<RedisValue> read(std::string key) {
        auto [ec, v] = co_await other->execute({"GET", std::move(key)});
        EXPECT_FALSE(ec);
        co_return v;
    }
};

std::vector<RedisValue> values(const std::vector<CommandResult> &rs) {
    std::vector<RedisValue> out;
    for (auto &r : rs) {
        EXPECT_TRUE(r.ok());
        out.push_back(r.value);
    }
    return out;
}

} // namespace

TEST(Transaction, CounterWithoutConflictReturnsPipelineShape) {
    TxRig rig;
    Results results;
    bool ok = run_test(rig.ioc, [&]() -> asio::awaitable<void> {
        co_await rig.connect_both();
        rig.tx->set("counter", "0").incr("counter").incr("counter").get("counter");
        auto [ec, r] = co_await rig.tx->async_exec(asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(ec);
        results = std::move(r);
    });
    ASSERT_TRUE(ok);
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(values(*results), (std::vector<RedisValue>{RedisValue::status("OK"), RedisValue::integer(1),
                                                         RedisValue::integer(2), RedisValue::string("2")}));
    EXPECT_EQ(rig.server.batches, 1);
}

TEST(Transaction, WatchedKeyChangedElsewhereAbortsWithoutEffect) {
    TxRig rig;
    Results results{std::vector<CommandResult>{}};
    RedisValue after;
    bool ok = run_test(rig.ioc, [&]() -> asio::awaitable<void> {
        co_await rig.connect_both();
        auto [sec, sv] = co_await rig.other->execute({"SET", "balance", "10"});
        EXPECT_FALSE(sec);

        auto wec = co_await rig.tx->async_watch({"balance"}, asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(std::get<0>(wec));
        EXPECT_EQ(rig.tx->state(), State::watching);

        auto [cec, cv] = co_await rig.other->execute({"SET", "balance", "99"});
        EXPECT_FALSE(cec);

        rig.tx->set("balance", "0").set("audit", "spent");
        auto [ec, r] = co_await rig.tx->async_exec(asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(ec);
        results = std::move(r);
        after = co_await rig.read("balance");
    });
    ASSERT_TRUE(ok);
    EXPECT_FALSE(results.has_value());
    EXPECT_EQ(after, RedisValue::string("99"));
    EXPECT_FALSE(rig.server.exists("audit"));
    // Aborted locally: nothing sent, the watch released.
    EXPECT_EQ(rig.server.batches, 0);
    EXPECT_EQ(rig.server.unwatches, 1);
    EXPECT_EQ(rig.tx->state(), State::unwatched);
}

TEST(Transaction, ServerSideWatchViolationAlsoAborts) {
    TxRig rig;
    rig.server.local_watch_check = false;
    Results results{std::vector<CommandResult>{}};
    bool ok = run_test(rig.ioc, [&]() -> asio::awaitable<void> {
        co_await rig.connect_both();
        auto wec = co_await rig.tx->async_watch({"k"}, asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(std::get<0>(wec));
        auto [cec, cv] = co_await rig.other->execute({"INCR", "k"});
        EXPECT_FALSE(cec);
        rig.tx->set("k", "mine");
        auto [ec, r] = co_await rig.tx->async_exec(asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(ec);
        results = std::move(r);
    });
    ASSERT_TRUE(ok);
    EXPECT_FALSE(results.has_value());
    EXPECT_EQ(rig.server.batches, 1);
    EXPECT_EQ(rig.server.execute({"GET", "k"}), RedisValue::string("1"));
}

TEST(Transaction, UnchangedWatchCommits) {
    TxRig rig;
    Results results;
    bool ok = run_test(rig.ioc, [&]() -> asio::awaitable<void> {
        co_await rig.connect_both();
        auto wec = co_await rig.tx->async_watch({"a", "b"}, asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(std::get<0>(wec));
        EXPECT_EQ(rig.tx->watched().size(), 2u);
        // Writes to unrelated keys do not disturb the watch.
        auto [cec, cv] = co_await rig.other->execute({"SET", "c", "x"});
        EXPECT_FALSE(cec);
        rig.tx->set("a", "1").get("a");
        EXPECT_EQ(rig.tx->state(), State::queuing);
        auto [ec, r] = co_await rig.tx->async_exec(asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(ec);
        results = std::move(r);
    });
    ASSERT_TRUE(ok);
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(values(*results), (std::vector<RedisValue>{RedisValue::status("OK"), RedisValue::string("1")}));
    EXPECT_TRUE(rig.tx->watched().empty());
}

TEST(Transaction, CommandErrorInsideTransactionDoesNotAbortOthers) {
    TxRig rig;
    Results results;
    bool ok = run_test(rig.ioc, [&]() -> asio::awaitable<void> {
        co_await rig.connect_both();
        rig.tx->rpush("list", "x").incr("list").set("after", "yes");
        auto [ec, r] = co_await rig.tx->async_exec(asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(ec);
        results = std::move(r);
    });
    ASSERT_TRUE(ok);
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 3u);
    EXPECT_TRUE((*results)[0].ok());
    ASSERT_FALSE((*results)[1].ok());
    EXPECT_EQ((*results)[1].error->code, "WRONGTYPE");
    EXPECT_TRUE((*results)[1].value.is_nil());
    EXPECT_TRUE((*results)[2].ok());
    EXPECT_TRUE(rig.server.exists("after"));
}

TEST(Transaction, WatchWithNoKeysIsInvalid) {
    TxRig rig;
    std::error_code got;
    bool ok = run_test(rig.ioc, [&]() -> asio::awaitable<void> {
        co_await rig.connect_both();
        auto [ec] = co_await rig.tx->async_watch({}, asio::as_tuple(asio::use_awaitable));
        got = ec;
    });
    ASSERT_TRUE(ok);
    EXPECT_EQ(got, errc::invalid_argument);
    EXPECT_EQ(rig.tx->state(), State::unwatched);
}

TEST(Transaction, RepeatedWatchKeepsFirstToken) {
    TxRig rig;
    Results results{std::vector<CommandResult>{}};
    bool ok = run_test(rig.ioc, [&]() -> asio::awaitable<void> {
        co_await rig.connect_both();
        auto first = co_await rig.tx->async_watch({"k"}, asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(std::get<0>(first));
        auto [cec, cv] = co_await rig.other->execute({"SET", "k", "changed"});
        EXPECT_FALSE(cec);
        auto again = co_await rig.tx->async_watch({"k"}, asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(std::get<0>(again));
        rig.tx->get("k");
        auto [ec, r] = co_await rig.tx->async_exec(asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(ec);
        results = std::move(r);
    });
    ASSERT_TRUE(ok);
    EXPECT_FALSE(results.has_value());
}

TEST(Transaction, DiscardClearsQueueAndReleasesWatch) {
    TxRig rig;
    Results results;
    bool ok = run_test(rig.ioc, [&]() -> asio::awaitable<void> {
        co_await rig.connect_both();
        auto wec = co_await rig.tx->async_watch({"k"}, asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(std::get<0>(wec));
        rig.tx->set("k", "1").set("j", "2");
        rig.tx->discard();
        EXPECT_EQ(rig.tx->state(), State::unwatched);
        auto released = co_await wait_until([&] { return rig.server.unwatches == 1; });
        EXPECT_TRUE(released);
        auto [ec, r] = co_await rig.tx->async_exec(asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(ec);
        results = std::move(r);
    });
    ASSERT_TRUE(ok);
    ASSERT_TRUE(results.has_value());
    EXPECT_TRUE(results->empty());
    EXPECT_FALSE(rig.server.exists("k"));
    EXPECT_FALSE(rig.server.exists("j"));
    EXPECT_EQ(rig.server.batches, 0);
}

TEST(Transaction, ExecWithOnlyWatchSendsUnwatch) {
    TxRig rig;
    Results results;
    bool ok = run_test(rig.ioc, [&]() -> asio::awaitable<void> {
        co_await rig.connect_both();
        auto wec = co_await rig.tx->async_watch({"k"}, asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(std::get<0>(wec));
        auto [ec, r] = co_await rig.tx->async_exec(asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(ec);
        results = std::move(r);
    });
    ASSERT_TRUE(ok);
    ASSERT_TRUE(results.has_value());
    EXPECT_TRUE(results->empty());
    EXPECT_EQ(rig.server.unwatches, 1);
    EXPECT_EQ(rig.server.batches, 0);
}

TEST(Transaction, UnwatchForgetsKeys) {
    TxRig rig;
    Results results;
    bool ok = run_test(rig.ioc, [&]() -> asio::awaitable<void> {
        co_await rig.connect_both();
        auto wec = co_await rig.tx->async_watch({"k"}, asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(std::get<0>(wec));
        auto uec = co_await rig.tx->async_unwatch(asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(std::get<0>(uec));
        auto [cec, cv] = co_await rig.other->execute({"SET", "k", "changed"});
        EXPECT_FALSE(cec);
        rig.tx->set("k", "mine");
        auto [ec, r] = co_await rig.tx->async_exec(asio::as_tuple(asio::use_awaitable));
        EXPECT_FALSE(ec);
        results = std::move(r);
    });
    ASSERT_TRUE(ok);
    ASSERT_TRUE(results.has_value());
    EXPECT_EQ(rig.server.execute({"GET", "k"}), RedisValue::string("mine"));
}

TEST(Transaction, ProviderFailureIsAnErrorNotAnAbort) {
    asio::io_context ioc;
    auto tx = std::make_shared<TransactionCoordinator>(ioc.get_executor(), fixed_provider(nullptr));
    std::error_code got;
    bool ok = run_test(ioc, [&]() -> asio::awaitable<void> {
        tx->ping();
        auto [ec, r] = co_await tx->async_exec(asio::as_tuple(asio::use_awaitable));
        got = ec;
        EXPECT_FALSE(r.has_value());
    });
    ASSERT_TRUE(ok);
    EXPECT_EQ(got, errc::not_connected);
    EXPECT_FALSE(tx->executing());
}

TEST(Transaction, CollapseMapsOutcomes) {
    using TC = TransactionCoordinator;
    auto committed = TC::collapse(TC::Committed{{CommandResult{std::nullopt, RedisValue::integer(1)}}});
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->size(), 1u);
    EXPECT_FALSE(TC::collapse(TC::Aborted{}).has_value());
}

TEST(Transaction, StateNames) {
    EXPECT_EQ(to_string(State::unwatched), "unwatched");
    EXPECT_EQ(to_string(State::watching), "watching");
    EXPECT_EQ(to_string(State::queuing), "queuing");
}
