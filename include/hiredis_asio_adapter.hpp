#pragma once
/**
 * @file hiredis_asio_adapter.hpp
 * @brief Drives a hiredis async context from a Boost.Asio executor:
 *        socket readiness through a stream_descriptor, hiredis timeouts
 *        through a steady_timer.
 */
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <hiredis/async.h>

#include <memory>

namespace redis_bridge {
namespace asio = boost::asio;

class HiredisAsioAdapter : public std::enable_shared_from_this<HiredisAsioAdapter> {
  public:
    using executor_type = asio::any_io_executor;

    // Installs the event hooks on `ctx`; its socket must already exist.
    HiredisAsioAdapter(executor_type exec, redisAsyncContext *ctx);
    ~HiredisAsioAdapter();

    executor_type get_executor() const noexcept { return exec_; }

    void start();

    // Detaches every hook from the context. The fd is never closed here: hiredis owns it.
    void stop();

    bool attached() const noexcept { return ctx_ != nullptr; }

  private:
    enum class Dir { read,
                     write };

    void want(Dir d, bool on);
    void arm(Dir d);
    void on_ready(Dir d, const boost::system::error_code &ec);
    void schedule_timeout(long long ms);

#ifdef RBRIDGE_TEST_ACCESS
    friend struct HiredisAsioAdapterTestAccess;
#endif
    executor_type exec_;
    redisAsyncContext *ctx_{};
    asio::posix::stream_descriptor sd_;
    asio::steady_timer timeout_;
    bool reading_{false};
    bool writing_{false};
    bool read_pending_{false};
    bool write_pending_{false};
};

} // namespace redis_bridge
