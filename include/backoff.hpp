#pragma once
#include <chrono>
#include <random>

namespace redis_bridge::detail {

// 0 -> initial -> 2x ... capped at maxv
inline std::chrono::milliseconds next_backoff(std::chrono::milliseconds cur,
                                              std::chrono::milliseconds initial,
                                              std::chrono::milliseconds maxv) noexcept {
    if (cur.count() == 0)
        return initial;
    auto next = cur * 2;
    if (next > maxv)
        next = maxv;
    return next;
}

inline std::chrono::milliseconds jitter(std::chrono::milliseconds base,
                                        std::chrono::milliseconds plus_minus) {
    if (plus_minus.count() == 0)
        return base;
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<long long> d(-plus_minus.count(), plus_minus.count());
    auto ms = base.count() + d(rng);
    return std::chrono::milliseconds{ms > 0 ? ms : 1};
}

} // namespace redis_bridge::detail
