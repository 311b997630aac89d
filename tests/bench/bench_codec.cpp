#include <benchmark/benchmark.h>

#include "daemon/coordination_state.hpp"
#include "daemon/update_policy.hpp"
#include "ipc/codec.hpp"
#include "ipc/message.hpp"

#include <vector>

using namespace loom;
using namespace loom::ipc;

// ═══════════════════════════════════════════════════════════════════════════════
// Envelope
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_EncodeMessage(benchmark::State& state)
{
    Message msg = make_message(std::string(types::GRAPH_RENDER),
                               std::vector<uint8_t>(static_cast<size_t>(state.range(0)), 0x5A));
    msg.seq     = 42;

    for (auto _ : state)
    {
        auto bytes = encode_message(msg);
        benchmark::DoNotOptimize(bytes);
    }
    state.SetBytesProcessed(state.iterations() * (state.range(0) + static_cast<int64_t>(HEADER_SIZE)));
}
BENCHMARK(BM_EncodeMessage)->Arg(16)->Arg(1024)->Arg(64 * 1024);

static void BM_DecodeMessage(benchmark::State& state)
{
    Message msg = make_targeted(std::string(types::DEBUG_COMMAND),
                                SurfaceRole::secondary(RoleKind::Debug),
                                std::vector<uint8_t>(static_cast<size_t>(state.range(0)), 0x11));
    auto    bytes = encode_message(msg);

    for (auto _ : state)
    {
        auto result = decode_message(bytes);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes.size()));
}
BENCHMARK(BM_DecodeMessage)->Arg(16)->Arg(1024)->Arg(64 * 1024);

// ═══════════════════════════════════════════════════════════════════════════════
// Payloads
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_BreakpointSetRoundTrip(benchmark::State& state)
{
    BreakpointSetPayload set;
    for (int64_t i = 0; i < state.range(0); ++i)
        set.breakpoints.push_back({"src/module_" + std::to_string(i % 16) + ".cpp",
                                   static_cast<uint32_t>(i)});

    for (auto _ : state)
    {
        auto bytes   = encode_breakpoint_set(set);
        auto decoded = decode_breakpoint_set(bytes);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_BreakpointSetRoundTrip)->Arg(8)->Arg(256);

static void BM_EncodeBatch(benchmark::State& state)
{
    BatchPayload batch;
    batch.items.assign(static_cast<size_t>(state.range(0)), std::vector<uint8_t>(32, 0x7F));

    for (auto _ : state)
    {
        auto bytes = encode_batch(batch);
        benchmark::DoNotOptimize(bytes);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeBatch)->Arg(16)->Arg(256);

// ═══════════════════════════════════════════════════════════════════════════════
// Update policy
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ScheduleEditsAndFlush(benchmark::State& state)
{
    daemon::CoordinationState state_record;
    daemon::UpdateScheduler   scheduler(state_record,
                                      daemon::UpdateTiming{std::chrono::milliseconds(16), 1 << 20});
    Message                   edit = make_message(std::string(types::EDIT), {1, 2, 3, 4});

    for (auto _ : state)
    {
        auto now = daemon::Clock::now();
        for (int64_t i = 0; i < state.range(0); ++i)
            scheduler.submit(1, RoleKind::GraphView, edit, now);
        auto due = scheduler.collect_due(now, true);
        benchmark::DoNotOptimize(due);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ScheduleEditsAndFlush)->Arg(64)->Arg(1024);
