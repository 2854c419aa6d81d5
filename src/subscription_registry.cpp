#include "subscription_registry.hpp"

namespace redis_bridge {

std::size_t SubscriptionRegistry::add(const Subscription &s) {
    std::scoped_lock lk(mtx_);
    auto &e = entries(s.kind);
    auto [it, inserted] = e.try_emplace(s.name, 0);
    ++it->second;
    if (inserted)
        ++generation_;
    return e.size();
}

std::size_t SubscriptionRegistry::remove(const Subscription &s) {
    std::scoped_lock lk(mtx_);
    auto &e = entries(s.kind);
    auto it = e.find(s.name);
    if (it == e.end())
        return e.size();
    if (--it->second == 0) {
        e.erase(it);
        ++generation_;
    }
    return e.size();
}

std::vector<std::string> SubscriptionRegistry::remove_all(SubscriptionKind kind) {
    std::scoped_lock lk(mtx_);
    auto &e = entries(kind);
    std::vector<std::string> names;
    names.reserve(e.size());
    for (auto &[name, refs] : e)
        names.push_back(name);
    if (!e.empty())
        ++generation_;
    e.clear();
    return names;
}

Subscriptions SubscriptionRegistry::list_active() const {
    std::scoped_lock lk(mtx_);
    Subscriptions out;
    for (auto &[name, refs] : channels_)
        out.channels.insert(name);
    for (auto &[name, refs] : patterns_)
        out.patterns.insert(name);
    return out;
}

std::size_t SubscriptionRegistry::count(SubscriptionKind kind) const {
    std::scoped_lock lk(mtx_);
    return entries(kind).size();
}

std::size_t SubscriptionRegistry::total() const {
    std::scoped_lock lk(mtx_);
    return channels_.size() + patterns_.size();
}

std::size_t SubscriptionRegistry::ref_count(const Subscription &s) const {
    std::scoped_lock lk(mtx_);
    const auto &e = entries(s.kind);
    auto it = e.find(s.name);
    return it == e.end() ? 0 : it->second;
}

bool SubscriptionRegistry::contains(const Subscription &s) const {
    std::scoped_lock lk(mtx_);
    return entries(s.kind).contains(s.name);
}

void SubscriptionRegistry::clear() {
    std::scoped_lock lk(mtx_);
    if (!channels_.empty() || !patterns_.empty())
        ++generation_;
    channels_.clear();
    patterns_.clear();
}

std::uint64_t SubscriptionRegistry::generation() const {
    std::scoped_lock lk(mtx_);
    return generation_;
}

} // namespace redis_bridge
