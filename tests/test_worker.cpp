// ============================================================================
// Native Test Worker
// ============================================================================
//
//   offload_test_worker [--delay-ms N] [--mode MODE] <request> <result>
//
// MODE:
//   echo     (default) answers {"query":"hello"} with {"answer":"world"},
//            anything else with {"echo": request}
//   error    reports a handler error
//   throw    handler throws
//   crash    exits with status 3 without writing a result
//   garbage  writes a non-JSON result file
//
// ============================================================================

#include "offload/worker/worker_main.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

using nlohmann::json;
using namespace offload;

int main(int argc, char** argv) {
    long delay_ms = 0;
    std::string mode = "echo";

    // Flags precede the two trailing paths
    for (int i = 1; i + 1 < argc - 2; ++i) {
        std::string flag = argv[i];
        if (flag == "--delay-ms") {
            delay_ms = std::strtol(argv[++i], nullptr, 10);
        } else if (flag == "--mode") {
            mode = argv[++i];
        }
    }

    if (delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }

    if (mode == "crash") {
        std::_Exit(3);
    }
    if (mode == "garbage") {
        auto args = worker::ParseArgs(argc, argv);
        if (!args) return worker::kExitUsage;
        std::ofstream(args->result) << "definitely not json";
        return worker::kExitOk;
    }

    return worker::RunWorker(argc, argv, [&](const json& request) -> worker::HandlerResult {
        if (mode == "error") {
            return Err(std::string("model failed to load"));
        }
        if (mode == "throw") {
            throw std::runtime_error("boom");
        }
        if (request.value("query", "") == "hello") {
            return Ok(json{{"answer", "world"}});
        }
        return Ok(json{{"echo", request}});
    });
}
