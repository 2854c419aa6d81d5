#pragma once

#include "redis_bridge.hpp"

// Implementations for templates that must remain header-visible

template <class... Ts, class CompletionToken, class MakeOp>
auto RedisBridge::launch(CompletionToken &&token, MakeOp make_op) {
    return asio::async_initiate<CompletionToken, void(std::error_code, Ts...)>(
        [self = shared_from_this(), make_op = std::move(make_op)](auto handler) mutable {
            auto op = make_op(*self);
            detail::spawn_complete(self->strand_, self, self->log_, std::move(op), std::move(handler));
        },
        token);
}

template <class Fn, class... Args>
void RedisBridge::emit(const ListenerList<Fn> &list, std::string_view event, const Args &...args) {
    for (auto &fn : list.snapshot()) {
        try {
            fn(args...);
        } catch (const std::exception &e) {
            RBRIDGE_ERROR_RT(log_, "'{}' listener threw: {}", event, e.what());
        }
    }
}

template <typename CompletionToken>
auto RedisBridge::async_connect(CompletionToken &&token) {
    return launch<>(std::forward<CompletionToken>(token), [](RedisBridge &b) { return b.run_connect(); });
}

template <typename CompletionToken>
auto RedisBridge::async_disconnect(CompletionToken &&token) {
    return launch<>(std::forward<CompletionToken>(token), [](RedisBridge &b) { return b.run_disconnect(false); });
}

template <typename CompletionToken>
auto RedisBridge::async_quit(CompletionToken &&token) {
    return launch<>(std::forward<CompletionToken>(token), [](RedisBridge &b) { return b.run_disconnect(true); });
}

template <typename CompletionToken>
auto RedisBridge::async_cleanup(CompletionToken &&token) {
    return launch<>(std::forward<CompletionToken>(token), [](RedisBridge &b) { return b.run_cleanup(); });
}

template <typename CompletionToken>
auto RedisBridge::async_subscribe(std::vector<std::string> channels, CompletionToken &&token) {
    return launch<std::size_t>(std::forward<CompletionToken>(token),
                               [channels = std::move(channels)](RedisBridge &b) mutable {
                                   return b.run_subscribe(SubscriptionKind::exact, std::move(channels));
                               });
}

template <typename CompletionToken>
auto RedisBridge::async_unsubscribe(std::vector<std::string> channels, CompletionToken &&token) {
    return launch<std::size_t>(std::forward<CompletionToken>(token),
                               [channels = std::move(channels)](RedisBridge &b) mutable {
                                   return b.run_unsubscribe(SubscriptionKind::exact, std::move(channels));
                               });
}

template <typename CompletionToken>
auto RedisBridge::async_psubscribe(std::vector<std::string> patterns, CompletionToken &&token) {
    return launch<std::size_t>(std::forward<CompletionToken>(token),
                               [patterns = std::move(patterns)](RedisBridge &b) mutable {
                                   return b.run_subscribe(SubscriptionKind::pattern, std::move(patterns));
                               });
}

template <typename CompletionToken>
auto RedisBridge::async_punsubscribe(std::vector<std::string> patterns, CompletionToken &&token) {
    return launch<std::size_t>(std::forward<CompletionToken>(token),
                               [patterns = std::move(patterns)](RedisBridge &b) mutable {
                                   return b.run_unsubscribe(SubscriptionKind::pattern, std::move(patterns));
                               });
}

template <typename CompletionToken>
auto RedisBridge::async_publish(std::string channel, std::string payload, CompletionToken &&token) {
    return launch<long long>(std::forward<CompletionToken>(token),
                             [channel = std::move(channel), payload = std::move(payload)](RedisBridge &b) mutable {
                                 return b.run_publish(std::move(channel), std::move(payload));
                             });
}

template <typename CompletionToken>
auto RedisBridge::async_command(std::vector<std::string> argv, CompletionToken &&token) {
    return launch<RedisValue>(std::forward<CompletionToken>(token),
                              [argv = std::move(argv)](RedisBridge &b) mutable { return b.run_command(std::move(argv)); });
}

template <typename CompletionToken>
auto RedisBridge::async_watch(std::vector<std::string> keys, CompletionToken &&token) {
    return launch<>(std::forward<CompletionToken>(token),
                    [keys = std::move(keys)](RedisBridge &b) mutable { return b.run_watch(std::move(keys)); });
}

template <typename CompletionToken>
auto RedisBridge::async_unwatch(CompletionToken &&token) {
    return launch<>(std::forward<CompletionToken>(token), [](RedisBridge &b) { return b.run_unwatch(); });
}
