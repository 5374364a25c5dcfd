// ============================================================================
// Offload Benchmarks
// ============================================================================
//
// Loop-side costs of the protocol: decoding a result file, publishing a
// request, and a full submit-poll-cleanup round trip through a real worker.
// The round trip is dominated by process start-up; the others are what a
// poll tick costs the host loop.
//
// ============================================================================

#include <benchmark/benchmark.h>

#include "offload/protocol/handshake.hpp"
#include "offload/protocol/result_decoder.hpp"
#include "offload/supervisor/task_supervisor.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

using namespace offload;
using nlohmann::json;

namespace {

std::string MakeResult(int items) {
    json doc{{"status", "ok"}};
    json tokens = json::array();
    for (int i = 0; i < items; ++i) {
        tokens.push_back({{"id", i}, {"text", "token-" + std::to_string(i)}, {"logprob", -0.25 * i}});
    }
    doc["tokens"] = std::move(tokens);
    return doc.dump();
}

std::filesystem::path BenchDir(const char* name) {
    auto dir = std::filesystem::temp_directory_path() / (std::string("offload_bench_") + name + "_" + GenerateTaskId());
    std::filesystem::create_directories(dir);
    return dir;
}

}  // namespace

// ============================================================================
// Result Decoding
// ============================================================================

static void BM_DecodeResult(benchmark::State& state) {
    auto bytes = MakeResult(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto decoded = DecodeResult(bytes);
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(bytes.size()));
}
BENCHMARK(BM_DecodeResult)->Arg(1)->Arg(64)->Arg(4096);

static void BM_DecodeIncompleteResult(benchmark::State& state) {
    auto bytes = MakeResult(256);
    bytes.resize(bytes.size() / 2);
    for (auto _ : state) {
        auto decoded = DecodeResult(bytes);
        benchmark::DoNotOptimize(decoded);
    }
}
BENCHMARK(BM_DecodeIncompleteResult);

// ============================================================================
// Handshake Files
// ============================================================================

static void BM_GenerateTaskId(benchmark::State& state) {
    for (auto _ : state) {
        auto id = GenerateTaskId();
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(BM_GenerateTaskId);

static void BM_WriteFileAtomic(benchmark::State& state) {
    auto dir = BenchDir("write");
    auto path = dir / "request.json";
    auto bytes = json{{"query", std::string(static_cast<std::size_t>(state.range(0)), 'x')}}.dump();
    for (auto _ : state) {
        if (WriteFileAtomic(path, bytes).IsErr()) {
            state.SkipWithError("write failed");
            break;
        }
    }
    std::filesystem::remove_all(dir);
}
BENCHMARK(BM_WriteFileAtomic)->Arg(64)->Arg(64 << 10);

// ============================================================================
// Round Trip
// ============================================================================

static void BM_SubmitRoundTrip(benchmark::State& state) {
    auto dir = BenchDir("roundtrip");
    SupervisorOptions options;
    options.handshake_dir = dir;
    options.worker.program = "/bin/sh";
    options.worker.args = {"-c", "printf '{\"status\":\"ok\"}' > \"$2\"", "offload-worker"};
    options.worker.quiet = true;

    auto supervisor = TaskSupervisor::Create(options);
    if (supervisor.IsErr()) {
        state.SkipWithError("cannot create supervisor");
        return;
    }

    for (auto _ : state) {
        auto handle = supervisor.Value()->Submit({{"query", "hello"}}, std::chrono::seconds(5));
        if (handle.IsErr()) {
            state.SkipWithError("submit failed");
            break;
        }
        auto poll = supervisor.Value()->Poll(handle.Value());
        while (!poll.IsDone()) {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            poll = supervisor.Value()->Poll(handle.Value());
        }
        benchmark::DoNotOptimize(poll);
        supervisor.Value()->Cleanup(handle.Value());
    }
    supervisor.Value().reset();
    std::filesystem::remove_all(dir);
}
BENCHMARK(BM_SubmitRoundTrip)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
