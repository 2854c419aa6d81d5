#include <boost/asio.hpp>

#include "bridge_config.hpp"
#include "bridge_log.hpp"
#include "hiredis_client.hpp"
#include "redis_bridge.hpp"

#include <atomic>
#include <format>
#include <memory>

using namespace std::chrono_literals;
namespace asio = boost::asio;
namespace rb = redis_bridge;

static asio::awaitable<void> run_demo(std::shared_ptr<rb::RedisBridge> bridge, std::shared_ptr<rb::Logger> log) {
    using boost::asio::as_tuple;

    auto [ec] = co_await bridge->async_connect(as_tuple(asio::use_awaitable));
    if (ec) {
        RBRIDGE_ERROR_RT(log, "connect failed: {}", ec.message());
        co_return;
    }

    auto received = std::make_shared<std::atomic<int>>(0);
    bridge->on_pmessage([log, received](const std::string &pattern, const std::string &channel, const std::string &payload) {
        RBRIDGE_INFO_RT(log, "pmessage pattern={} channel={} payload={}", pattern, channel, payload);
        received->fetch_add(1);
    });
    bridge->on_message([log, received](const std::string &channel, const std::string &payload) {
        RBRIDGE_INFO_RT(log, "message channel={} payload={}", channel, payload);
        received->fetch_add(1);
    });

    auto [pec, patterns] = co_await bridge->async_psubscribe({"news.*"}, as_tuple(asio::use_awaitable));
    if (pec) {
        RBRIDGE_ERROR_RT(log, "psubscribe failed: {}", pec.message());
        co_return;
    }
    auto [sec, channels] = co_await bridge->async_subscribe({"alerts"}, as_tuple(asio::use_awaitable));
    if (sec) {
        RBRIDGE_ERROR_RT(log, "subscribe failed: {}", sec.message());
        co_return;
    }
    RBRIDGE_INFO_RT(log, "listening on {} pattern(s) and {} channel(s)", patterns, channels);

    for (int i = 0; i < 3; ++i) {
        auto [e, receivers] = co_await bridge->async_publish(std::format("news.{}", 100 + i), std::format("item {}", i),
                                                             as_tuple(asio::use_awaitable));
        if (e)
            RBRIDGE_WARN_RT(log, "publish failed: {}", e.message());
        else
            RBRIDGE_DEBUG_RT(log, "published to {} receiver(s)", receivers);
    }

    // A pipeline: replies come back in command order, errors stay with their command.
    auto batch = bridge->pipeline();
    batch->set("demo:greeting", "hello", 30s).incr("demo:hits").get("demo:greeting");
    auto [bec, results] = co_await batch->async_exec(as_tuple(asio::use_awaitable));
    if (bec) {
        RBRIDGE_WARN_RT(log, "pipeline failed: {}", bec.message());
    } else {
        for (std::size_t i = 0; i < results.size(); ++i) {
            if (results[i].ok())
                RBRIDGE_INFO_RT(log, "pipeline[{}] = {}", i, results[i].value.toString());
            else
                RBRIDGE_INFO_RT(log, "pipeline[{}] error {}", i, results[i].error->message);
        }
    }

    // A checked transaction on the hit counter.
    auto [wec] = co_await bridge->async_watch({"demo:hits"}, as_tuple(asio::use_awaitable));
    if (wec)
        RBRIDGE_WARN_RT(log, "watch failed: {}", wec.message());
    auto tx = bridge->multi();
    tx->incrby("demo:hits", 10).publish("alerts", "hits bumped");
    auto [tec, outcome] = co_await tx->async_exec(as_tuple(asio::use_awaitable));
    if (tec)
        RBRIDGE_WARN_RT(log, "transaction failed: {}", tec.message());
    else if (!outcome)
        RBRIDGE_INFO_RT(log, "transaction aborted, demo:hits changed underneath");
    else
        RBRIDGE_INFO_RT(log, "transaction committed {} command(s)", outcome->size());

    asio::steady_timer t(co_await asio::this_coro::executor);
    for (int waited = 0; received->load() < 4 && waited < 20; ++waited) {
        t.expires_after(100ms);
        co_await t.async_wait(as_tuple(asio::use_awaitable));
    }

    auto report = bridge->status_report();
    RBRIDGE_INFO_RT(log, "status={} generation={} dispatched={} dropped={} backlog_drops={}",
                    rb::to_string(report.status), report.generation, report.dispatched, report.dropped,
                    report.dropped_pushes);

    auto [cec] = co_await bridge->async_cleanup(as_tuple(asio::use_awaitable));
    if (cec)
        RBRIDGE_WARN_RT(log, "cleanup: {}", cec.message());
    co_return;
}

int main() {
    rb::HiredisClient::initOpenSSL();
    auto log = rb::make_clog_logger(rb::Logger::Level::debug, "psub_bridge");
    try {
        asio::io_context ioc;
        auto opts = rb::bridge_options_from_env();
        if (!opts.connection.client_name)
            opts.connection.client_name = "psub_bridge";
        auto bridge = rb::RedisBridge::create(ioc.get_executor(), opts, log);
        bridge->on_error([log](std::error_code ec, std::string_view context) {
            RBRIDGE_ERROR_RT(log, "{}: {}", context, ec.message());
        });
        bridge->on_reconnecting([log] { RBRIDGE_WARN_RT(log, "subscription connection lost, rebuilding"); });
        bridge->on_end([log] { RBRIDGE_INFO_RT(log, "bridge closed"); });

        asio::co_spawn(ioc, run_demo(bridge, log), asio::detached);
        ioc.run();
    } catch (const std::exception &e) {
        RBRIDGE_ERROR_RT(log, "exception: {}", e.what());
        return 1;
    }
    return 0;
}
