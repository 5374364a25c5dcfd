// ============================================================================
// Example 01: Basic Offload
// ============================================================================
//
// Submits one request to a worker process from a libuv loop and prints the
// outcome when the poller notices the result.
//
// RUN:
//   cd build && ./examples/01_basic_offload [worker-program]
//
// The worker defaults to the echo_worker example built next to this binary.
//
// ============================================================================

#include "offload/offload.hpp"

#include <filesystem>
#include <iostream>

using namespace offload;
using namespace std::chrono_literals;

int main(int argc, char** argv) {
    std::cout << "=== Offload Example 01: Basic Offload ===" << std::endl;

    auto loop = LibuvExecutor::Create();
    if (loop.IsErr()) {
        std::cerr << "Cannot create loop: " << loop.Error().message() << std::endl;
        return 1;
    }

    SupervisorOptions options;
    options.handshake_dir = std::filesystem::temp_directory_path() / "offload_example_01";
    options.worker.program = argc > 1 ? std::filesystem::path(argv[1])
                                      : std::filesystem::path(argv[0]).parent_path() / "echo_worker";
    options = SupervisorOptions::FromEnv(options);

    PollerOptions poller_options;
    poller_options.interval = 100ms;

    auto offloader = Offloader::Create(*loop.Value(), options, poller_options);
    if (offloader.IsErr()) {
        std::cerr << "Cannot create offloader: " << offloader.Error().message() << std::endl;
        return 1;
    }

    auto handle = offloader.Value()->Submit({{"query", "hello"}}, 10s, [&](Outcome outcome) {
        if (outcome.IsSuccess()) {
            std::cout << "Result: " << outcome.value.dump() << " (" << outcome.elapsed.count() << " ms)"
                      << std::endl;
        } else {
            std::cout << ToString(outcome.kind) << ": " << outcome.reason << std::endl;
        }
        loop.Value()->Stop();
    });
    if (handle.IsErr()) {
        std::cerr << "Submit failed: " << handle.Error().message() << std::endl;
        return 1;
    }
    std::cout << "Submitted task " << handle.Value().id << std::endl;

    loop.Value()->Run();
    return 0;
}
