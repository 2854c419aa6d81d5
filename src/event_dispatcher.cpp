#include "event_dispatcher.hpp"

#include <exception>

#include "glob_match.hpp"

namespace redis_bridge {

EventDispatcher::EventDispatcher(DispatchMode mode, std::shared_ptr<Logger> log)
    : mode_(mode), log_(log ? std::move(log) : make_null_logger()) {}

ListenerId EventDispatcher::on_message(MessageListener fn) {
    const auto id = next_listener_id();
    messages_.add(id, std::move(fn));
    return id;
}

ListenerId EventDispatcher::on_message_async(AsyncMessageListener fn) {
    const auto id = next_listener_id();
    messages_.add(id, std::move(fn));
    return id;
}

ListenerId EventDispatcher::on_pmessage(PatternListener fn) {
    const auto id = next_listener_id();
    pmessages_.add(id, std::move(fn));
    return id;
}

ListenerId EventDispatcher::on_pmessage_async(AsyncPatternListener fn) {
    const auto id = next_listener_id();
    pmessages_.add(id, std::move(fn));
    return id;
}

bool EventDispatcher::remove_listener(ListenerId id) {
    return messages_.remove(id) || pmessages_.remove(id);
}

void EventDispatcher::remove_all_listeners() {
    messages_.clear();
    pmessages_.clear();
}

std::size_t EventDispatcher::listener_count() const {
    return messages_.size() + pmessages_.size();
}

void EventDispatcher::set_active(Subscriptions active) {
    std::scoped_lock lk(active_mtx_);
    active_ = std::move(active);
}

Subscriptions EventDispatcher::active() const {
    std::scoped_lock lk(active_mtx_);
    return active_;
}

std::vector<EventDispatcher::Delivery> EventDispatcher::resolve(const PublishMessage &msg) const {
    std::vector<Delivery> out;
    std::scoped_lock lk(active_mtx_);
    if (mode_ == DispatchMode::attributed) {
        if (msg.pattern) {
            if (active_.patterns.contains(*msg.pattern) && glob_match(*msg.pattern, msg.channel))
                out.push_back({*msg.pattern});
        } else if (active_.channels.contains(msg.channel)) {
            out.push_back({});
        }
        return out;
    }
    if (active_.channels.contains(msg.channel))
        out.push_back({});
    for (const auto &p : active_.patterns) {
        if (glob_match(p, msg.channel))
            out.push_back({p});
    }
    return out;
}

boost::asio::awaitable<std::size_t> EventDispatcher::dispatch(PublishMessage msg) {
    const auto targets = resolve(msg);
    if (targets.empty()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        RBRIDGE_TRACE_RT(log_, "drop message on '{}': no active subscription", msg.channel);
        co_return 0;
    }

    std::size_t calls = 0;
    for (const auto &t : targets) {
        if (!t.pattern) {
            for (auto &entry : messages_.snapshot()) {
                try {
                    if (auto *fn = std::get_if<MessageListener>(&entry))
                        (*fn)(msg.channel, msg.payload);
                    else
                        co_await std::get<AsyncMessageListener>(entry)(msg.channel, msg.payload);
                    ++calls;
                } catch (const std::exception &e) {
                    report_listener_failure(e.what());
                }
            }
        } else {
            for (auto &entry : pmessages_.snapshot()) {
                try {
                    if (auto *fn = std::get_if<PatternListener>(&entry))
                        (*fn)(*t.pattern, msg.channel, msg.payload);
                    else
                        co_await std::get<AsyncPatternListener>(entry)(*t.pattern, msg.channel, msg.payload);
                    ++calls;
                } catch (const std::exception &e) {
                    report_listener_failure(e.what());
                }
            }
        }
    }
    dispatched_.fetch_add(1, std::memory_order_relaxed);
    co_return calls;
}

void EventDispatcher::report_listener_failure(std::string_view what) {
    RBRIDGE_WARN_RT(log_, "listener threw: {}", what);
    if (on_listener_error_)
        on_listener_error_(what);
}

} // namespace redis_bridge
