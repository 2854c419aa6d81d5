#include "hiredis_client.hpp"
#include "backoff.hpp"
#include "hiredis_asio_adapter.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/system/error_code.hpp>

#include <cstring>
#include <format>

namespace redis_bridge {

using namespace std::chrono_literals;

namespace {

std::string_view reply_first_string(const redisReply *r) {
    if (!r || (r->type != REDIS_REPLY_ARRAY && r->type != REDIS_REPLY_PUSH) || r->elements == 0)
        return {};
    const redisReply *head = r->element[0];
    if (head && head->type == REDIS_REPLY_STRING)
        return {head->str, static_cast<size_t>(head->len)};
    return {};
}

std::string element_string(const redisReply *r, size_t i) {
    const redisReply *e = r->element[i];
    if (!e || !e->str)
        return {};
    return {e->str, static_cast<size_t>(e->len)};
}

// message <channel> <payload> | pmessage <pattern> <channel> <payload>, as ARRAY (RESP2) or PUSH (RESP3).
std::optional<PublishMessage> parse_pubsub_reply(const redisReply *r) {
    const auto kind = reply_first_string(r);
    if (kind == "message" && r->elements >= 3)
        return PublishMessage{element_string(r, 1), element_string(r, 2), std::nullopt};
    if (kind == "pmessage" && r->elements >= 4)
        return PublishMessage{element_string(r, 2), element_string(r, 3), element_string(r, 1)};
    return std::nullopt;
}

std::string summarize_hello(const RedisValue &rv) {
    if (auto *kv = std::get_if<RedisValue::KVList>(&rv.payload)) {
        std::string server, version, role, mode;
        long long proto = 0;
        for (auto &[k, v] : *kv) {
            if (k == "server") {
                if (auto s = string_like(v))
                    server = *s;
            } else if (k == "version") {
                if (auto s = string_like(v))
                    version = *s;
            } else if (k == "proto") {
                if (auto p = as_integer(v))
                    proto = *p;
            } else if (k == "role") {
                if (auto s = string_like(v))
                    role = *s;
            } else if (k == "mode") {
                if (auto s = string_like(v))
                    mode = *s;
            }
        }
        auto out = std::format("{} {} proto={}", server, version, proto);
        if (!role.empty())
            out += std::format(" role={}", role);
        if (!mode.empty())
            out += std::format(" mode={}", mode);
        return out;
    }
    if (auto s = string_like(rv))
        return *s;
    return {};
}

struct BatchSlot {
    std::shared_ptr<void> keep;
    void *batch;
    std::size_t index;
};

} // namespace

std::shared_ptr<HiredisClient>
HiredisClient::create(executor_type exec, ConnectOptions opts, Subscriptions subscriptions, std::shared_ptr<Logger> logger) {
    return std::shared_ptr<HiredisClient>(
        new HiredisClient(exec, std::move(opts), std::move(subscriptions), std::move(logger)));
}

HiredisClient::HiredisClient(executor_type exec, ConnectOptions opts, Subscriptions subs, std::shared_ptr<Logger> log)
    : strand_(asio::make_strand(exec)),
      reconnect_timer_(strand_),
      ping_timer_(strand_),
      pub_channel_(strand_, opts.max_backlog),
      opts_(std::move(opts)),
      subs_(std::move(subs)),
      log_(log ? std::move(log) : make_null_logger()) {}

std::string HiredisClient::hello_summary() const {
    std::scoped_lock lk(hello_mtx_);
    return hello_summary_;
}

void HiredisClient::shutdown_from_dtor_() noexcept {
    // best-effort, synchronous; no posts, no shared_from_this
    stopping_ = true;
    connected_.store(false, std::memory_order_relaxed);
    reconnect_timer_.cancel();
    ping_timer_.cancel();
    pub_channel_.close();

    if (ctx_) {
        // detach callbacks and user data so the NULL replies hiredis hands out while freeing are no-ops
        redisAsyncSetConnectCallback(ctx_, nullptr);
        redisAsyncSetDisconnectCallback(ctx_, nullptr);
        ctx_->data = nullptr;
        redisAsyncFree(ctx_);
        ctx_ = nullptr;
    }
    if (sslctx_) {
        redisFreeSSLContext(sslctx_);
        sslctx_ = nullptr;
    }
    adapter_.reset();

    auto waiters = std::move(connect_waiters_);
    connect_waiters_.clear();
    for (auto &[id, h] : waiters) {
        try {
            h(make_error(errc::stopped));
        } catch (const std::exception &e) {
            RBRIDGE_ERROR_RT(log_, "connect waiter {} threw during shutdown: {}", id, e.what());
        }
    }
}

void HiredisClient::stop() {
    asio::dispatch(strand_, [self = shared_from_this()] {
        if (self->stopping_)
            return;
        self->stopping_ = true;
        self->connect_inflight_ = false;
        self->connected_.store(false, std::memory_order_relaxed);
        self->fail_connect(make_error(errc::stopped));
        self->reconnect_timer_.cancel();
        self->ping_timer_.cancel();
        self->pub_channel_.close();
        // hiredis frees the context after the disconnect callback, which clears ctx_.
        if (self->ctx_)
            redisAsyncDisconnect(self->ctx_);
    });
}

void HiredisClient::fail_connect(std::error_code ec) {
    auto waiters = std::move(connect_waiters_);
    connect_waiters_.clear();
    for (auto &[id, h] : waiters)
        h(ec);
}

void HiredisClient::do_connect() {
    if (stopping_)
        return;
    RBRIDGE_INFO_RT(log_, "connecting to {}:{} TLS={} ({} channels, {} patterns)", opts_.host, opts_.port,
                    opts_.tls.use_tls, subs_.channels.size(), subs_.patterns.size());

    if (sslctx_) {
        redisFreeSSLContext(sslctx_);
        sslctx_ = nullptr;
    }

    const auto ms = opts_.connect_timeout.count();
    timeval tv{static_cast<time_t>(ms / 1000), static_cast<suseconds_t>((ms % 1000) * 1000)};
    redisOptions ro{};
    REDIS_OPTIONS_SET_TCP(&ro, opts_.host.c_str(), opts_.port);
    ro.connect_timeout = &tv;

    redisAsyncContext *ac = redisAsyncConnectWithOptions(&ro);
    if (!ac || ac->err) {
        RBRIDGE_WARN_RT(log_, "connect failed immediately: {}", ac ? ac->errstr : "out of memory");
        if (ac)
            redisAsyncFree(ac);
        schedule_reconnect();
        return;
    }
    ctx_ = ac;
    ctx_->data = this;
    redisAsyncSetConnectCallback(ctx_, &HiredisClient::handle_connect);
    redisAsyncSetDisconnectCallback(ctx_, &HiredisClient::handle_disconnect);

    if (opts_.tls.use_tls) {
        initOpenSSL();
        redisSSLContextError ssl_err = REDIS_SSL_CTX_NONE;
        redisSSLOptions ssl_opts{};
        if (!opts_.tls.ca_file.empty())
            ssl_opts.cacert_filename = opts_.tls.ca_file.c_str();
        if (!opts_.tls.ca_path.empty())
            ssl_opts.capath = opts_.tls.ca_path.c_str();
        if (!opts_.tls.cert_file.empty())
            ssl_opts.cert_filename = opts_.tls.cert_file.c_str();
        if (!opts_.tls.key_file.empty())
            ssl_opts.private_key_filename = opts_.tls.key_file.c_str();
        ssl_opts.server_name = opts_.host.c_str(); // SNI
        ssl_opts.verify_mode = opts_.tls.verify_peer ? REDIS_SSL_VERIFY_PEER : REDIS_SSL_VERIFY_NONE;

        redisSSLContext *ssl = redisCreateSSLContextWithOptions(&ssl_opts, &ssl_err);
        const bool initiated = ssl && redisInitiateSSLWithContext(&ctx_->c, ssl) == REDIS_OK;
        if (!initiated) {
            RBRIDGE_ERROR_RT(log_, "TLS setup failed: {}",
                             ssl ? (ctx_->c.errstr[0] ? ctx_->c.errstr : "initiate failed") : redisSSLContextGetError(ssl_err));
            if (ssl)
                redisFreeSSLContext(ssl);
            ctx_->data = nullptr;
            redisAsyncFree(std::exchange(ctx_, nullptr));
            // Certificates and paths do not fix themselves; give up instead of retrying.
            connect_inflight_ = false;
            fail_connect(make_error(errc::ssl_error));
            return;
        }
        sslctx_ = ssl; // alive until the context is gone
    }
    adapter_ = std::make_shared<HiredisAsioAdapter>(strand_, ctx_);
    adapter_->start();
}

void HiredisClient::schedule_reconnect() {
    if (stopping_)
        return;
    backoff_ = detail::next_backoff(backoff_, opts_.reconnect_initial, opts_.reconnect_max);
    RBRIDGE_DEBUG_RT(log_, "scheduling reconnect in {} ms", backoff_.count());
    reconnect_timer_.expires_after(backoff_);
    reconnect_timer_.async_wait([w = weak_from_this()](auto ec) {
        if (ec)
            return;
        if (auto self = w.lock())
            self->do_connect();
    });
}

void HiredisClient::on_connected() {
    RBRIDGE_DEBUG_RT(log_, "socket connected to {}:{} TLS={}", opts_.host, opts_.port, opts_.tls.use_tls);
    send_handshake_hello();
}

void HiredisClient::on_disconnected(int status, std::string errstr) {
    const bool was_ready = connected_.exchange(false, std::memory_order_relaxed);
    if (status != REDIS_OK)
        RBRIDGE_WARN_RT(log_, "disconnected: status={} errstr={}", status, errstr);
    else
        RBRIDGE_DEBUG_RT(log_, "disconnected cleanly{}", was_ready ? "" : " before ready");

    // hiredis frees the context itself once this callback returns.
    ctx_ = nullptr;
    if (sslctx_) {
        redisFreeSSLContext(sslctx_);
        sslctx_ = nullptr;
    }
    if (adapter_)
        adapter_->stop();
    adapter_.reset();
    ping_timer_.cancel();
    ch_batons_.clear();
    pch_batons_.clear();
    pending_acks_ = 0;

    if (stopping_) {
        connect_inflight_ = false;
        pub_channel_.close();
        return;
    }
    if (status != REDIS_OK || std::exchange(reconnect_on_close_, false)) {
        health_.store(Health::unhealthy, std::memory_order_relaxed);
        ping_failures_ = 0;
        schedule_reconnect();
        return;
    }
    // Closed cleanly from the other side: nothing left to wait for.
    connect_inflight_ = false;
    pub_channel_.close();
    fail_connect(make_error(errc::connection_lost));
}

void HiredisClient::force_reconnect(std::string_view why) {
    if (!ctx_)
        return;
    RBRIDGE_WARN_RT(log_, "dropping connection: {}", why);
    reconnect_on_close_ = true;
    connected_.store(false, std::memory_order_relaxed);
    redisAsyncDisconnect(ctx_);
}

void HiredisClient::handle_connect(const redisAsyncContext *c, int status) {
    auto *self = static_cast<HiredisClient *>(c->data);
    if (!self)
        return;
    std::string errstr = status != REDIS_OK && c->errstr ? c->errstr : "";
    asio::dispatch(self->strand_, [self, status, errstr = std::move(errstr)]() mutable {
        if (status != REDIS_OK) {
            // hiredis frees a context that never connected without a disconnect callback.
            self->on_disconnected(status, std::move(errstr));
            return;
        }
        self->on_connected();
    });
}

void HiredisClient::handle_disconnect(const redisAsyncContext *c, int status) {
    auto *self = static_cast<HiredisClient *>(c->data);
    if (!self)
        return;
    std::string errstr = c->errstr ? c->errstr : "";
    asio::dispatch(self->strand_, [self, status, errstr = std::move(errstr)]() mutable {
        self->on_disconnected(status, std::move(errstr));
    });
}

int HiredisClient::submit_argv(const std::vector<std::string> &argv, redisCallbackFn *fn, void *priv) {
    std::vector<const char *> cargv;
    cargv.reserve(argv.size());
    std::vector<size_t> alen;
    alen.reserve(argv.size());
    for (auto &s : argv) {
        cargv.push_back(s.data());
        alen.push_back(s.size());
    }
    return redisAsyncCommandArgv(ctx_, fn, priv, static_cast<int>(cargv.size()), cargv.data(), alen.data());
}

void HiredisClient::send_handshake_hello() {
    std::vector<std::string> argv{"HELLO", "3"};
    if (opts_.password) {
        argv.emplace_back("AUTH");
        argv.emplace_back(opts_.username ? *opts_.username : std::string{"default"});
        argv.emplace_back(*opts_.password);
    }
    if (opts_.client_name && !opts_.client_name->empty()) {
        argv.emplace_back("SETNAME");
        argv.emplace_back(*opts_.client_name);
    }

    const int rc = submit_argv(
        argv,
        [](redisAsyncContext *c, void *r, void *) {
            auto *self = static_cast<HiredisClient *>(c->data);
            if (!self)
                return;
            auto *reply = static_cast<redisReply *>(r);
            if (!reply) // context going away; the disconnect callback follows
                return;
            if (reply->type == REDIS_REPLY_ERROR) {
                RBRIDGE_ERROR_RT(self->log_, "HELLO rejected: {}", std::string_view{reply->str, reply->len});
                self->force_reconnect("handshake failed");
                return;
            }
            auto summary = summarize_hello(RedisValue::fromRaw(reply));
            {
                std::scoped_lock lk(self->hello_mtx_);
                self->hello_summary_ = std::move(summary);
            }
            self->epoch_.fetch_add(1, std::memory_order_relaxed);
            self->backoff_ = {};
            RBRIDGE_TRACE_RT(self->log_, "HELLO ok: {}", self->hello_summary());
            if (self->subs_.empty()) {
                self->mark_ready();
                return;
            }
            self->issue_subscriptions();
        },
        nullptr);
    if (rc != REDIS_OK) {
        RBRIDGE_ERROR_RT(log_, "HELLO submit failed");
        force_reconnect("HELLO could not be sent");
    }
}

void HiredisClient::mark_ready() {
    connected_.store(true, std::memory_order_relaxed);
    health_.store(Health::healthy, std::memory_order_relaxed);
    RBRIDGE_INFO_RT(log_, "ready: {}", hello_summary());
    start_keepalive();
    fail_connect(std::error_code{});
}

void HiredisClient::issue_subscriptions() {
    pending_acks_ = subs_.size();
    for (auto &ch : subs_.channels)
        issue_sub("SUBSCRIBE", ch);
    for (auto &p : subs_.patterns)
        issue_sub("PSUBSCRIBE", p);
}

void HiredisClient::issue_sub(const char *verb, const std::string &subject) {
    auto baton = std::make_unique<SubBaton>();
    baton->w = weak_from_this();
    baton->subject = subject;
    baton->is_pattern = std::strcmp(verb, "PSUBSCRIBE") == 0;
    auto *priv = baton.get();

    const char *argvs[2] = {verb, baton->subject.c_str()};
    size_t arglens[2] = {std::strlen(verb), baton->subject.size()};
    // hiredis keeps calling back with `priv` for the ack and every message of this subject.
    if (redisAsyncCommandArgv(ctx_, &HiredisClient::handle_sub_reply, priv, 2, argvs, arglens) != REDIS_OK) {
        RBRIDGE_ERROR_RT(log_, "{} submit failed for '{}'", verb, subject);
        force_reconnect("subscription could not be sent");
        return;
    }
    auto &batons = baton->is_pattern ? pch_batons_ : ch_batons_;
    batons[subject] = std::move(baton);
}

void HiredisClient::handle_sub_reply(redisAsyncContext *, void *r, void *priv) {
    auto *baton = static_cast<SubBaton *>(priv);
    auto *reply = static_cast<redisReply *>(r);
    if (!baton || !reply) // freed context; batons are dropped by on_disconnected
        return;
    auto self = baton->w.lock();
    if (!self)
        return;

    if (reply->type == REDIS_REPLY_ERROR) {
        self->on_sub_error(*baton, {reply->str, reply->len});
        return;
    }
    const auto kind = reply_first_string(reply);
    if (kind == "subscribe" || kind == "psubscribe") {
        if (!std::exchange(baton->acked, true))
            self->on_sub_ack(*baton);
        return;
    }
    if (auto pm = parse_pubsub_reply(reply)) {
        self->enqueue(std::move(*pm));
        return;
    }
    RBRIDGE_TRACE_RT(self->log_, "ignoring '{}' notification for '{}'", kind, baton->subject);
}

void HiredisClient::on_sub_ack(const SubBaton &baton) {
    RBRIDGE_TRACE_RT(log_, "{} '{}' acknowledged", baton.is_pattern ? "psubscribe" : "subscribe", baton.subject);
    if (pending_acks_ > 0 && --pending_acks_ == 0)
        mark_ready();
}

void HiredisClient::on_sub_error(const SubBaton &baton, std::string_view text) {
    RBRIDGE_ERROR_RT(log_, "{} '{}' rejected: {}", baton.is_pattern ? "PSUBSCRIBE" : "SUBSCRIBE", baton.subject, text);
    // A rejected subscription will be rejected again on reconnect.
    connect_inflight_ = false;
    fail_connect(protocol_error());
    stop();
}

void HiredisClient::enqueue(PublishMessage pm) {
    ping_failures_ = 0;
    health_.store(Health::healthy, std::memory_order_relaxed);
    if (!pub_channel_.try_send(boost::system::error_code{}, std::move(pm))) {
        const auto n = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
        RBRIDGE_WARN_RT(log_, "push backlog full ({}), dropped {} so far", opts_.max_backlog, n);
    }
}

void HiredisClient::submit_batch(BatchRequest request, BatchHandler handler) {
    if (!ctx_ || !is_connected()) {
        handler(make_error(errc::not_connected), BatchReply{});
        return;
    }
    std::vector<std::vector<std::string>> frames;
    frames.reserve(request.commands.size() + 2);
    if (request.atomic)
        frames.push_back({"MULTI"});
    for (auto &c : request.commands)
        frames.push_back(c.argv());
    if (request.atomic)
        frames.push_back({"EXEC"});

    auto batch = std::make_shared<BatchCtx>();
    batch->handler = std::move(handler);
    batch->atomic = request.atomic;
    batch->replies.resize(frames.size());
    batch->remaining = frames.size();
    RBRIDGE_TRACE_RT(log_, "batch: {} frames atomic={}", frames.size(), request.atomic);

    for (std::size_t i = 0; i < frames.size(); ++i) {
        auto *slot = new BatchSlot{batch, batch.get(), i};
        if (submit_argv(frames[i], &HiredisClient::handle_batch_reply, slot) != REDIS_OK) {
            delete slot;
            // Frames already handed to hiredis still get their (NULL) callbacks.
            batch->lost = true;
            batch->remaining -= frames.size() - i;
            break;
        }
    }
    if (batch->remaining == 0)
        finish_batch(*batch);
}

void HiredisClient::handle_batch_reply(redisAsyncContext *, void *r, void *priv) {
    std::unique_ptr<BatchSlot> slot(static_cast<BatchSlot *>(priv));
    auto &batch = *static_cast<BatchCtx *>(slot->batch);
    if (!r)
        batch.lost = true;
    else
        batch.replies[slot->index] = RedisValue::fromRaw(static_cast<redisReply *>(r));
    if (--batch.remaining == 0)
        finish_batch(batch);
}

void HiredisClient::finish_batch(BatchCtx &batch) {
    if (!batch.handler)
        return;
    auto h = std::move(batch.handler);
    if (batch.lost) {
        h(make_error(errc::connection_lost), BatchReply{});
        return;
    }
    if (!batch.atomic) {
        h(std::error_code{}, BatchReply{std::move(batch.replies)});
        return;
    }

    const auto &exec = batch.replies.back();
    if (exec.is_nil()) { // a watched key changed
        h(std::error_code{}, BatchReply{});
        return;
    }
    if (exec.is_array()) {
        h(std::error_code{}, BatchReply{exec.elements()});
        return;
    }
    if (exec.is_error()) {
        // EXECABORT: report each command's own queueing error, the abort for the rest.
        std::vector<RedisValue> out;
        out.reserve(batch.replies.size() - 2);
        for (std::size_t i = 1; i + 1 < batch.replies.size(); ++i) {
            const auto &queued = batch.replies[i];
            out.push_back(queued.is_error() ? queued : RedisValue::error(exec.error_message()));
        }
        h(std::error_code{}, BatchReply{std::move(out)});
        return;
    }
    h(protocol_error(), BatchReply{});
}

void HiredisClient::start_keepalive() {
    ping_failures_ = 0;
    schedule_next_ping();
}

void HiredisClient::schedule_next_ping() {
    if (stopping_ || opts_.keepalive_period.count() <= 0)
        return;
    ping_timer_.expires_after(detail::jitter(opts_.keepalive_period, opts_.keepalive_jitter));
    ping_timer_.async_wait([w = weak_from_this()](auto ec) {
        if (ec)
            return; // cancelled
        auto self = w.lock();
        if (!self || !self->ctx_ || !self->is_connected())
            return;
        const int rc = redisAsyncCommand(
            self->ctx_,
            [](redisAsyncContext *c, void *r, void *) {
                auto *self = static_cast<HiredisClient *>(c->data);
                auto *reply = static_cast<redisReply *>(r);
                if (!self || !reply) // disconnect in progress
                    return;
                if (reply->type == REDIS_REPLY_ERROR) {
                    if (++self->ping_failures_ >= 3) {
                        self->health_.store(Health::unhealthy, std::memory_order_relaxed);
                        self->force_reconnect(std::format("PING failed {} times: {}", self->ping_failures_,
                                                          std::string_view{reply->str, reply->len}));
                        return;
                    }
                    self->health_.store(Health::suspect, std::memory_order_relaxed);
                } else {
                    self->ping_failures_ = 0;
                    self->health_.store(Health::healthy, std::memory_order_relaxed);
                }
                self->schedule_next_ping();
            },
            nullptr, "PING");
        if (rc != REDIS_OK)
            self->force_reconnect("PING could not be sent");
    });
}

// ---- KvClient ----

asio::awaitable<std::error_code> HiredisClient::connect() {
    using namespace asio::experimental::awaitable_operators;
    auto self = shared_from_this();
    asio::steady_timer limit(co_await asio::this_coro::executor, opts_.connect_timeout);
    auto r = co_await (async_connect(asio::as_tuple(asio::use_awaitable)) ||
                       limit.async_wait(asio::as_tuple(asio::use_awaitable)));
    if (r.index() == 1) {
        RBRIDGE_WARN_RT(log_, "not ready after {} ms, giving up", opts_.connect_timeout.count());
        stop();
        co_return make_error(errc::connect_failed);
    }
    co_return std::get<0>(std::get<0>(r));
}

asio::awaitable<std::tuple<std::error_code, RedisValue>> HiredisClient::execute(std::vector<std::string> argv) {
    auto self = shared_from_this();
    co_return co_await async_command(std::move(argv), asio::as_tuple(asio::use_awaitable));
}

asio::awaitable<std::tuple<std::error_code, BatchReply>> HiredisClient::execute_batch(BatchRequest request) {
    auto self = shared_from_this();
    co_return co_await async_batch(std::move(request), asio::as_tuple(asio::use_awaitable));
}

asio::awaitable<std::tuple<std::error_code, std::optional<PublishMessage>>>
HiredisClient::next_message(std::chrono::milliseconds timeout) {
    auto self = shared_from_this();
    asio::steady_timer timer(co_await asio::this_coro::executor, timeout);
    auto [order, rec_ec, msg, timer_ec] =
        co_await asio::experimental::make_parallel_group(pub_channel_.async_receive(asio::deferred),
                                                         timer.async_wait(asio::deferred))
            .async_wait(asio::experimental::wait_for_one(), asio::use_awaitable);
    // The group waits for both operations, so a receive that completed after
    // the timer fired still carries a message that is already off the channel.
    if (!rec_ec)
        co_return std::make_tuple(std::error_code{}, std::optional<PublishMessage>{std::move(msg)});
    if (order[0] == 1)
        co_return std::make_tuple(std::error_code{}, std::optional<PublishMessage>{});
    co_return std::make_tuple(make_error(errc::stopped), std::optional<PublishMessage>{});
}

asio::awaitable<std::tuple<std::error_code, WatchSet>> HiredisClient::watch(std::vector<std::string> keys) {
    auto self = shared_from_this();
    const auto token = epoch_.load(std::memory_order_relaxed);
    std::vector<std::string> argv;
    argv.reserve(keys.size() + 1);
    argv.emplace_back("WATCH");
    argv.insert(argv.end(), keys.begin(), keys.end());

    auto [ec, reply] = co_await async_command(std::move(argv), asio::as_tuple(asio::use_awaitable));
    if (ec)
        co_return std::make_tuple(ec, WatchSet{});
    if (reply.is_error()) {
        RBRIDGE_WARN_RT(log_, "WATCH rejected: {}", reply.error_message());
        co_return std::make_tuple(protocol_error(), WatchSet{});
    }
    // A reconnect in between dropped the server-side watch.
    if (epoch_.load(std::memory_order_relaxed) != token)
        co_return std::make_tuple(make_error(errc::connection_lost), WatchSet{});

    WatchSet out;
    for (auto &k : keys)
        out.emplace(std::move(k), token);
    co_return std::make_tuple(std::error_code{}, std::move(out));
}

asio::awaitable<std::error_code> HiredisClient::unwatch() {
    auto self = shared_from_this();
    auto [ec, reply] = co_await async_command({"UNWATCH"}, asio::as_tuple(asio::use_awaitable));
    if (ec)
        co_return ec;
    if (reply.is_error())
        co_return protocol_error();
    co_return std::error_code{};
}

bool HiredisClient::watch_intact(const WatchSet &watched) const noexcept {
    const auto current = epoch_.load(std::memory_order_relaxed);
    for (auto &[key, token] : watched)
        if (token != current)
            return false;
    return true;
}

// ---- factory ----

HiredisClientFactory::HiredisClientFactory(asio::any_io_executor exec,
                                           ConnectOptions opts,
                                           std::string subscriber_suffix,
                                           std::string publisher_suffix,
                                           std::shared_ptr<Logger> log)
    : exec_(std::move(exec)),
      opts_(std::move(opts)),
      subscriber_suffix_(std::move(subscriber_suffix)),
      publisher_suffix_(std::move(publisher_suffix)),
      log_(log ? std::move(log) : make_null_logger()) {}

std::shared_ptr<KvClient> HiredisClientFactory::create(Subscriptions subscriptions) {
    auto opts = opts_;
    const bool subscriber = !subscriptions.empty();
    if (opts.client_name && !opts.client_name->empty())
        *opts.client_name += subscriber ? subscriber_suffix_ : publisher_suffix_;
    const auto n = created_.fetch_add(1, std::memory_order_relaxed) + 1;
    auto log = make_child_logger(log_, std::format("{}#{}", subscriber ? "sub" : "pub", n));
    return HiredisClient::create(exec_, std::move(opts), std::move(subscriptions), std::move(log));
}

} // namespace redis_bridge
