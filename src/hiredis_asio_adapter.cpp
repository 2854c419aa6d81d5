#include "hiredis_asio_adapter.hpp"

#include <chrono>
#include <utility>

namespace redis_bridge {

namespace {
HiredisAsioAdapter *from(void *privdata) { return static_cast<HiredisAsioAdapter *>(privdata); }
} // namespace

HiredisAsioAdapter::HiredisAsioAdapter(executor_type exec, redisAsyncContext *ctx)
    : exec_(exec), ctx_(ctx), sd_(exec), timeout_(exec) {
    sd_.assign(ctx->c.fd);
    ctx_->ev.data = this;
    ctx_->ev.addRead = [](void *p) { from(p)->want(Dir::read, true); };
    ctx_->ev.delRead = [](void *p) { from(p)->want(Dir::read, false); };
    ctx_->ev.addWrite = [](void *p) { from(p)->want(Dir::write, true); };
    ctx_->ev.delWrite = [](void *p) { from(p)->want(Dir::write, false); };
    ctx_->ev.cleanup = [](void *p) {
        if (p)
            from(p)->stop();
    };
    ctx_->ev.scheduleTimer = [](void *p, struct timeval tv) {
        from(p)->schedule_timeout(static_cast<long long>(tv.tv_sec) * 1000 + tv.tv_usec / 1000);
    };
}

HiredisAsioAdapter::~HiredisAsioAdapter() {
    stop();
}

void HiredisAsioAdapter::start() {
    want(Dir::read, true);
    want(Dir::write, true);
}

void HiredisAsioAdapter::stop() {
    auto *ctx = std::exchange(ctx_, nullptr);
    reading_ = writing_ = false;
    timeout_.cancel();
    boost::system::error_code ec;
    sd_.cancel(ec);
    if (sd_.is_open())
        (void)sd_.release();
    if (ctx) {
        ctx->ev.addRead = nullptr;
        ctx->ev.delRead = nullptr;
        ctx->ev.addWrite = nullptr;
        ctx->ev.delWrite = nullptr;
        ctx->ev.cleanup = nullptr;
        ctx->ev.scheduleTimer = nullptr;
        ctx->ev.data = nullptr;
    }
}

void HiredisAsioAdapter::want(Dir d, bool on) {
    bool &flag = d == Dir::read ? reading_ : writing_;
    if (!on) {
        flag = false;
        return;
    }
    if (!ctx_ || flag)
        return;
    flag = true;
    arm(d);
}

// At most one outstanding wait per direction.
void HiredisAsioAdapter::arm(Dir d) {
    bool &pending = d == Dir::read ? read_pending_ : write_pending_;
    if (pending || !sd_.is_open())
        return;
    pending = true;
    const auto what = d == Dir::read ? asio::posix::descriptor_base::wait_read
                                     : asio::posix::descriptor_base::wait_write;
    sd_.async_wait(what, [w = weak_from_this(), d](const boost::system::error_code &ec) {
        if (auto self = w.lock())
            self->on_ready(d, ec);
    });
}

void HiredisAsioAdapter::on_ready(Dir d, const boost::system::error_code &ec) {
    (d == Dir::read ? read_pending_ : write_pending_) = false;
    bool &flag = d == Dir::read ? reading_ : writing_;
    if (ec || !ctx_) {
        flag = false;
        return;
    }
    if (!flag)
        return;
    if (d == Dir::read) {
        redisAsyncHandleRead(ctx_);
        // The context may have been freed (cleanup hook) inside the call.
        if (ctx_ && reading_)
            arm(Dir::read);
    } else {
        // hiredis re-adds write interest through addWrite while output remains.
        writing_ = false;
        redisAsyncHandleWrite(ctx_);
    }
}

void HiredisAsioAdapter::schedule_timeout(long long ms) {
    timeout_.expires_after(std::chrono::milliseconds(ms > 0 ? ms : 0));
    timeout_.async_wait([w = weak_from_this()](const boost::system::error_code &ec) {
        if (ec)
            return;
        if (auto self = w.lock(); self && self->ctx_)
            redisAsyncHandleTimeout(self->ctx_);
    });
}

} // namespace redis_bridge
