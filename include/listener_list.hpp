#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace redis_bridge {

using ListenerId = std::uint64_t;

/**
 * ListenerList
 *
 * Registration-ordered set of callbacks keyed by id. Emitters take a
 * snapshot so listeners may register or remove listeners while being called.
 */
template <class Fn>
class ListenerList {
  public:
    void add(ListenerId id, Fn fn) {
        std::scoped_lock lk(mtx_);
        items_.emplace(id, std::move(fn));
    }

    bool remove(ListenerId id) {
        std::scoped_lock lk(mtx_);
        return items_.erase(id) > 0;
    }

    void clear() {
        std::scoped_lock lk(mtx_);
        items_.clear();
    }

    std::size_t size() const {
        std::scoped_lock lk(mtx_);
        return items_.size();
    }

    std::vector<Fn> snapshot() const {
        std::scoped_lock lk(mtx_);
        std::vector<Fn> out;
        out.reserve(items_.size());
        for (auto &[id, fn] : items_)
            out.push_back(fn);
        return out;
    }

  private:
    mutable std::mutex mtx_;
    std::map<ListenerId, Fn> items_;
};

} // namespace redis_bridge
