// ============================================================================
// Example 02: Offloading From a Redraw Loop
// ============================================================================
//
// An application that redraws at ~60 frames per second hands a slow request
// to a worker. The frame loop calls TickExecutor::RunOnce() and never waits
// on the worker, so frames keep coming while the task runs. Pressing cancel
// is simulated after a few seconds when a second argument is given.
//
// RUN:
//   cd build && ./examples/02_redraw_loop [worker-program] [cancel]
//
// ============================================================================

#include "offload/offload.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <thread>

using namespace offload;
using namespace std::chrono_literals;

int main(int argc, char** argv) {
    std::cout << "=== Offload Example 02: Redraw Loop ===" << std::endl;

    auto loop = TickExecutor::Create();
    if (loop.IsErr()) {
        std::cerr << "Cannot create loop: " << loop.Error().message() << std::endl;
        return 1;
    }

    SupervisorOptions options;
    options.handshake_dir = std::filesystem::temp_directory_path() / "offload_example_02";
    options.worker.program = argc > 1 ? std::filesystem::path(argv[1])
                                      : std::filesystem::path(argv[0]).parent_path() / "echo_worker";

    auto offloader =
        Offloader::Create(*loop.Value(), SupervisorOptions::FromEnv(options), PollerOptions::FromEnv());
    if (offloader.IsErr()) {
        std::cerr << "Cannot create offloader: " << offloader.Error().message() << std::endl;
        return 1;
    }

    std::optional<Outcome> outcome;
    auto handle = offloader.Value()->Submit({{"query", "hello"}}, 30s, [&](Outcome o) { outcome = std::move(o); });
    if (handle.IsErr()) {
        std::cerr << "Submit failed: " << handle.Error().message() << std::endl;
        return 1;
    }

    bool cancel = argc > 2;
    auto start = std::chrono::steady_clock::now();
    int frames = 0;
    while (!outcome) {
        loop.Value()->RunOnce();
        frames++;

        if (cancel && std::chrono::steady_clock::now() - start > 3s) {
            std::cout << "Cancelling task " << handle.Value().id << std::endl;
            if (offloader.Value()->Cancel(handle.Value()).IsErr()) {
                std::cerr << "Cancel failed" << std::endl;
            }
            cancel = false;
        }
        std::this_thread::sleep_for(16ms);
    }

    std::cout << "Drew " << frames << " frames while the worker ran" << std::endl;
    if (outcome->IsSuccess()) {
        std::cout << "Result: " << outcome->value.dump() << std::endl;
    } else {
        std::cout << ToString(outcome->kind) << ": " << outcome->reason << std::endl;
    }
    return 0;
}
