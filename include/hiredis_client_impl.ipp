#pragma once

#include "hiredis_client.hpp"

// Implementations for templates that must remain header-visible

template <class Slot>
void HiredisClient::bind_connect_cancellation(Slot &slot, std::uint64_t id) {
    if (!slot.is_connected() || slot.has_handler())
        return;
    slot.assign([w = weak_from_this(), id](asio::cancellation_type_t t) {
        if (t == asio::cancellation_type::none)
            return;
        if (auto s = w.lock()) {
            asio::dispatch(s->strand_, [s, id]() mutable {
                if (auto h = s->take_connect_waiter(id))
                    h(make_error(errc::stopped));
            });
        }
    });
}

template <typename CompletionToken>
auto HiredisClient::async_connect(CompletionToken &&token) {
    using Sig = void(std::error_code, bool);
    return asio::async_initiate<CompletionToken, Sig>(
        [w = weak_from_this()](auto handler) mutable {
            auto self = w.lock();
            if (!self) {
                detail::complete_on_associated(std::move(handler), asio::system_executor{}, make_error(errc::stopped), false);
                return;
            }
            asio::dispatch(self->strand_, [self, handler = std::move(handler)]() mutable {
                if (self->is_connected()) {
                    detail::complete_on_associated(std::move(handler), self->strand_, std::error_code{}, true);
                    return;
                }
                if (self->stopping_) {
                    detail::complete_on_associated(std::move(handler), self->strand_, make_error(errc::stopped), false);
                    return;
                }
                auto slot = asio::get_associated_cancellation_slot(handler);
                auto ex = self->strand_;
                auto id = self->add_connect_waiter([h = std::move(handler), ex](std::error_code ec) mutable {
                    detail::complete_on_associated(std::move(h), ex, ec, false);
                });
                self->bind_connect_cancellation(slot, id);
                if (self->connect_inflight_)
                    return;
                self->connect_inflight_ = true;
                self->do_connect();
            });
        },
        token);
}

template <typename CompletionToken>
auto HiredisClient::async_wait_connected(CompletionToken &&token) {
    return asio::async_initiate<CompletionToken, void(std::error_code)>(
        [w = weak_from_this()](auto handler) mutable {
            auto self = w.lock();
            if (!self) {
                detail::complete_on_associated(std::move(handler), asio::system_executor{}, make_error(errc::stopped));
                return;
            }
            asio::dispatch(self->strand_, [self, handler = std::move(handler)]() mutable {
                if (self->is_connected()) {
                    detail::complete_on_associated(std::move(handler), self->strand_, std::error_code{});
                    return;
                }
                if (self->stopping_) {
                    detail::complete_on_associated(std::move(handler), self->strand_, make_error(errc::stopped));
                    return;
                }
                auto slot = asio::get_associated_cancellation_slot(handler);
                auto ex = self->strand_;
                auto id = self->add_connect_waiter([h = std::move(handler), ex](std::error_code ec) mutable {
                    detail::complete_on_associated(std::move(h), ex, ec);
                });
                self->bind_connect_cancellation(slot, id);
            });
        },
        token);
}

template <typename CompletionToken>
auto HiredisClient::async_command(std::vector<std::string> argv, CompletionToken &&token) {
    using Sig = void(std::error_code, RedisValue);
    return asio::async_initiate<CompletionToken, Sig>(
        [w = weak_from_this(), argv = std::move(argv)](auto handler) mutable {
            auto self = w.lock();
            if (!self) {
                detail::complete_on_associated(std::move(handler), asio::system_executor{}, make_error(errc::stopped), RedisValue{});
                return;
            }
            asio::dispatch(self->strand_, [self, argv = std::move(argv), handler = std::move(handler)]() mutable {
                if (!self->ctx_ || !self->is_connected()) {
                    detail::complete_on_associated(std::move(handler), self->strand_, make_error(errc::not_connected), RedisValue{});
                    return;
                }
                if (argv.empty()) {
                    detail::complete_on_associated(std::move(handler), self->strand_, make_error(errc::invalid_argument), RedisValue{});
                    return;
                }
                RBRIDGE_TRACE_RT(self->log_, "command '{}' argc={} (payload elided)", argv.front(), argv.size());

                using Handler = decltype(handler);
                struct Ctx {
                    Handler h;
                    asio::any_io_executor ex;
                };
                auto ex_for_handler = asio::get_associated_executor(handler, self->strand_);
                auto *baton = new Ctx{std::move(handler), ex_for_handler};

                const int rc = self->submit_argv(
                    argv,
                    [](redisAsyncContext *, void *r, void *priv) {
                        std::unique_ptr<Ctx> holder(static_cast<Ctx *>(priv));
                        if (!r) {
                            detail::complete_on_associated(std::move(holder->h), holder->ex,
                                                           make_error(errc::connection_lost), RedisValue{});
                            return;
                        }
                        detail::complete_on_associated(std::move(holder->h), holder->ex, std::error_code{},
                                                       RedisValue::fromRaw(static_cast<redisReply *>(r)));
                    },
                    baton);
                if (rc != REDIS_OK) {
                    std::unique_ptr<Ctx> holder(baton);
                    detail::complete_on_associated(std::move(holder->h), holder->ex, make_error(errc::not_connected), RedisValue{});
                }
            });
        },
        token);
}

template <typename CompletionToken>
auto HiredisClient::async_batch(BatchRequest request, CompletionToken &&token) {
    using Sig = void(std::error_code, BatchReply);
    return asio::async_initiate<CompletionToken, Sig>(
        [w = weak_from_this(), request = std::move(request)](auto handler) mutable {
            auto self = w.lock();
            if (!self) {
                detail::complete_on_associated(std::move(handler), asio::system_executor{}, make_error(errc::stopped), BatchReply{});
                return;
            }
            asio::dispatch(self->strand_, [self, request = std::move(request), handler = std::move(handler)]() mutable {
                auto ex = self->strand_;
                self->submit_batch(std::move(request), [h = std::move(handler), ex](std::error_code ec, BatchReply reply) mutable {
                    detail::complete_on_associated(std::move(h), ex, ec, std::move(reply));
                });
            });
        },
        token);
}
