#include "command_queue.hpp"

namespace redis_bridge {

namespace asio = boost::asio;

std::vector<CommandResult> pack_results(std::size_t command_count, std::vector<RedisValue> replies) {
    std::vector<CommandResult> out;
    out.reserve(command_count);
    for (std::size_t i = 0; i < command_count; ++i) {
        if (i >= replies.size()) {
            out.push_back({CommandError{"PROTOCOL", "no reply received for command"}, RedisValue::nil()});
            continue;
        }
        auto &r = replies[i];
        if (r.is_error())
            out.push_back({CommandError::from_reply(r.error_message()), RedisValue::nil()});
        else
            out.push_back({std::nullopt, std::move(r)});
    }
    return out;
}

CommandQueue::CommandQueue(asio::any_io_executor strand, ClientProvider provider, std::shared_ptr<Logger> log)
    : strand_(std::move(strand)), provider_(std::move(provider)), log_(log ? std::move(log) : make_null_logger()) {}

asio::awaitable<std::tuple<std::error_code, std::vector<CommandResult>>>
CommandQueue::run_exec(std::vector<QueuedCommand> commands) {
    struct Release {
        std::atomic<bool> &flag;
        ~Release() { flag.store(false, std::memory_order_relaxed); }
    } release{executing_};

    if (commands.empty())
        co_return std::make_tuple(std::error_code{}, std::vector<CommandResult>{});

    auto [ec, client] = co_await provider_();
    if (ec)
        co_return std::make_tuple(ec, std::vector<CommandResult>{});

    const auto n = commands.size();
    RBRIDGE_TRACE_RT(log_, "pipeline: sending {} commands", n);
    auto [bec, reply] = co_await client->execute_batch(BatchRequest{std::move(commands), false, {}});
    if (bec) {
        RBRIDGE_WARN_RT(log_, "pipeline of {} commands failed: {}", n, bec.message());
        co_return std::make_tuple(bec, std::vector<CommandResult>{});
    }
    if (!reply)
        co_return std::make_tuple(protocol_error(), std::vector<CommandResult>{});
    co_return std::make_tuple(std::error_code{}, pack_results(n, std::move(*reply)));
}

} // namespace redis_bridge
