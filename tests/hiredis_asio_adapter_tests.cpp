#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <memory>
#include <stdexcept>
#include <unistd.h>

#include "hiredis_asio_adapter.hpp"

namespace redis_bridge {
struct HiredisAsioAdapterTestAccess {
    static bool reading(const HiredisAsioAdapter &a) { return a.reading_; }
    static bool writing(const HiredisAsioAdapter &a) { return a.writing_; }
    static bool read_pending(const HiredisAsioAdapter &a) { return a.read_pending_; }
    static bool write_pending(const HiredisAsioAdapter &a) { return a.write_pending_; }
    static bool fd_attached(const HiredisAsioAdapter &a) { return a.sd_.is_open(); }
};
} // namespace redis_bridge

using redis_bridge::HiredisAsioAdapter;
using Access = redis_bridge::HiredisAsioAdapterTestAccess;

namespace {

struct Pipe {
    int fds[2]{-1, -1};
    Pipe() {
        if (::pipe(fds) != 0)
            throw std::runtime_error("pipe failed");
    }
    ~Pipe() {
        for (int fd : fds)
            if (fd != -1)
                ::close(fd);
    }
};

// A context with only the socket filled in; hiredis entry points are never reached
// because the io_context is not run.
struct AdapterRig {
    boost::asio::io_context ioc;
    Pipe pipe;
    redisAsyncContext ctx{};
    std::shared_ptr<HiredisAsioAdapter> adapter;

    AdapterRig() {
        ctx.c.fd = pipe.fds[0];
        adapter = std::make_shared<HiredisAsioAdapter>(ioc.get_executor(), &ctx);
    }

    void expect_detached() {
        EXPECT_EQ(ctx.ev.addRead, nullptr);
        EXPECT_EQ(ctx.ev.delRead, nullptr);
        EXPECT_EQ(ctx.ev.addWrite, nullptr);
        EXPECT_EQ(ctx.ev.delWrite, nullptr);
        EXPECT_EQ(ctx.ev.cleanup, nullptr);
        EXPECT_EQ(ctx.ev.scheduleTimer, nullptr);
        EXPECT_EQ(ctx.ev.data, nullptr);
        EXPECT_FALSE(adapter->attached());
    }
};

} // namespace

TEST(HiredisAsioAdapter, ConstructionInstallsEveryHook) {
    AdapterRig rig;
    EXPECT_EQ(rig.ctx.ev.data, rig.adapter.get());
    EXPECT_NE(rig.ctx.ev.addRead, nullptr);
    EXPECT_NE(rig.ctx.ev.delRead, nullptr);
    EXPECT_NE(rig.ctx.ev.addWrite, nullptr);
    EXPECT_NE(rig.ctx.ev.delWrite, nullptr);
    EXPECT_NE(rig.ctx.ev.cleanup, nullptr);
    EXPECT_NE(rig.ctx.ev.scheduleTimer, nullptr);
    EXPECT_TRUE(rig.adapter->attached());
    EXPECT_TRUE(Access::fd_attached(*rig.adapter));
    EXPECT_FALSE(Access::reading(*rig.adapter));
    EXPECT_FALSE(Access::writing(*rig.adapter));
}

TEST(HiredisAsioAdapter, StartArmsBothDirectionsOnce) {
    AdapterRig rig;
    rig.adapter->start();
    EXPECT_TRUE(Access::reading(*rig.adapter));
    EXPECT_TRUE(Access::writing(*rig.adapter));
    EXPECT_TRUE(Access::read_pending(*rig.adapter));
    EXPECT_TRUE(Access::write_pending(*rig.adapter));
}

TEST(HiredisAsioAdapter, DelHooksClearInterestButKeepOutstandingWait) {
    AdapterRig rig;
    rig.adapter->start();
    rig.ctx.ev.delRead(rig.ctx.ev.data);
    rig.ctx.ev.delWrite(rig.ctx.ev.data);
    EXPECT_FALSE(Access::reading(*rig.adapter));
    EXPECT_FALSE(Access::writing(*rig.adapter));
    // The wait already issued stays; its completion is ignored.
    EXPECT_TRUE(Access::read_pending(*rig.adapter));

    rig.ctx.ev.addRead(rig.ctx.ev.data);
    rig.ctx.ev.addWrite(rig.ctx.ev.data);
    EXPECT_TRUE(Access::reading(*rig.adapter));
    EXPECT_TRUE(Access::writing(*rig.adapter));
}

TEST(HiredisAsioAdapter, AddWriteIsIdempotent) {
    AdapterRig rig;
    rig.ctx.ev.addWrite(rig.ctx.ev.data);
    rig.ctx.ev.addWrite(rig.ctx.ev.data);
    EXPECT_TRUE(Access::writing(*rig.adapter));
    EXPECT_TRUE(Access::write_pending(*rig.adapter));
    EXPECT_FALSE(Access::reading(*rig.adapter));
    EXPECT_FALSE(Access::read_pending(*rig.adapter));
}

TEST(HiredisAsioAdapter, StopDetachesHooksAndReleasesDescriptor) {
    AdapterRig rig;
    rig.adapter->start();
    rig.adapter->stop();
    EXPECT_FALSE(Access::reading(*rig.adapter));
    EXPECT_FALSE(Access::writing(*rig.adapter));
    EXPECT_FALSE(Access::fd_attached(*rig.adapter));
    rig.expect_detached();
    // The fd belongs to hiredis and is still usable.
    EXPECT_EQ(::write(rig.pipe.fds[1], "x", 1), 1);
}

TEST(HiredisAsioAdapter, CleanupHookStopsAdapter) {
    AdapterRig rig;
    rig.adapter->start();
    rig.ctx.ev.cleanup(rig.ctx.ev.data);
    EXPECT_FALSE(Access::reading(*rig.adapter));
    EXPECT_FALSE(Access::writing(*rig.adapter));
    rig.expect_detached();
}

TEST(HiredisAsioAdapter, StopIsRepeatableAndStartAfterStopIsInert) {
    AdapterRig rig;
    rig.adapter->stop();
    rig.adapter->stop();
    rig.adapter->start();
    EXPECT_FALSE(Access::reading(*rig.adapter));
    EXPECT_FALSE(Access::writing(*rig.adapter));
    rig.expect_detached();
}

TEST(HiredisAsioAdapter, DestructorDetachesHooks) {
    AdapterRig rig;
    rig.adapter->start();
    rig.adapter.reset();
    EXPECT_EQ(rig.ctx.ev.data, nullptr);
    EXPECT_EQ(rig.ctx.ev.addRead, nullptr);
    EXPECT_EQ(rig.ctx.ev.scheduleTimer, nullptr);
}
