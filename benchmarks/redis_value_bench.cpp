#include <benchmark/benchmark.h>
#include <hiredis/hiredis.h>

#include <string>
#include <vector>

#include "command_queue.hpp"
#include "redis_value.hpp"

using redis_bridge::RedisValue;

namespace {

// Owns a reply tree shaped like an EXEC answer: statuses, integers and errors mixed.
struct ExecReply {
    std::vector<redisReply> nodes;
    std::vector<redisReply *> ptrs;
    redisReply root{};
    std::string text = "0123456789abcdef";
    std::string err = "WRONGTYPE Operation against a key holding the wrong kind of value";

    explicit ExecReply(int n) : nodes(static_cast<size_t>(n)) {
        for (int i = 0; i < n; ++i) {
            auto &e = nodes[static_cast<size_t>(i)];
            switch (i % 4) {
            case 0:
                e.type = REDIS_REPLY_STATUS;
                e.str = const_cast<char *>("OK");
                e.len = 2;
                break;
            case 1:
                e.type = REDIS_REPLY_INTEGER;
                e.integer = i;
                break;
            case 2:
                e.type = REDIS_REPLY_STRING;
                e.str = text.data();
                e.len = text.size();
                break;
            default:
                e.type = REDIS_REPLY_ERROR;
                e.str = err.data();
                e.len = err.size();
            }
            ptrs.push_back(&e);
        }
        root.type = REDIS_REPLY_ARRAY;
        root.elements = ptrs.size();
        root.element = ptrs.data();
    }
};

} // namespace

static void BM_FromRaw_ExecReply(benchmark::State &state) {
    ExecReply reply(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        RedisValue v = RedisValue::fromRaw(&reply.root);
        benchmark::DoNotOptimize(v);
        benchmark::ClobberMemory();
    }
}
BENCHMARK(BM_FromRaw_ExecReply)->Arg(4)->Arg(32)->Arg(256)->Arg(1024);

// Reply conversion plus per-command result packing, as a pipeline completes.
static void BM_PackResults(benchmark::State &state) {
    ExecReply reply(static_cast<int>(state.range(0)));
    const auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto v = RedisValue::fromRaw(&reply.root);
        auto results = redis_bridge::pack_results(n, v.elements());
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PackResults)->Arg(4)->Arg(32)->Arg(256)->Arg(1024);

static void BM_ToString_Array(benchmark::State &state) {
    ExecReply reply(static_cast<int>(state.range(0)));
    const RedisValue v = RedisValue::fromRaw(&reply.root);
    for (auto _ : state) {
        auto s = v.toString();
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_ToString_Array)->Arg(4)->Arg(64)->Arg(512);

static void BM_StringLike_Payload(benchmark::State &state) {
    const RedisValue v = RedisValue::string(std::string(static_cast<size_t>(state.range(0)), 'x'));
    for (auto _ : state) {
        auto s = redis_bridge::string_like(v);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_StringLike_Payload)->Arg(16)->Arg(1024)->Arg(65536);

BENCHMARK_MAIN();
