#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "kv_client.hpp"

namespace redis_bridge {

/**
 * SubscriptionRegistry
 *
 * Reference-counted set of exact and pattern subscriptions. The counts
 * returned by add/remove are distinct entries of the same kind, never
 * reference totals. Every effective mutation bumps generation().
 *
 * Thread-safe; the bridge mutates it from its strand while introspection
 * may read it from any thread.
 */
class SubscriptionRegistry {
  public:
    std::size_t add(const Subscription &s);
    // No-op returning the current count when `s` is not registered.
    std::size_t remove(const Subscription &s);
    // Drops every entry of `kind` regardless of reference counts; returns the removed names.
    std::vector<std::string> remove_all(SubscriptionKind kind);

    Subscriptions list_active() const;
    std::size_t count(SubscriptionKind kind) const;
    std::size_t total() const;
    std::size_t ref_count(const Subscription &s) const;
    bool contains(const Subscription &s) const;
    void clear();
    std::uint64_t generation() const;

  private:
    using Entries = std::map<std::string, std::size_t>;
    Entries &entries(SubscriptionKind k) { return k == SubscriptionKind::exact ? channels_ : patterns_; }
    const Entries &entries(SubscriptionKind k) const { return k == SubscriptionKind::exact ? channels_ : patterns_; }

    mutable std::mutex mtx_;
    Entries channels_;
    Entries patterns_;
    std::uint64_t generation_{0};
};

} // namespace redis_bridge
