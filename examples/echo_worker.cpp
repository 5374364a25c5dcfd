// ============================================================================
// Example Worker: Echo
// ============================================================================
//
// A worker built on the worker SDK. The supervisor runs it as
//
//   echo_worker <request.json> <result.json>
//
// and it answers {"query": "hello"} with {"answer": "world"}. Any other
// request is echoed back, and {"fail": "..."} reports a worker error.
//
// ============================================================================

#include "offload/worker/worker_main.hpp"

#include <string>

using nlohmann::json;
using offload::Err;
using offload::Ok;
using offload::worker::HandlerResult;

int main(int argc, char** argv) {
    return offload::worker::RunWorker(argc, argv, [](const json& request) -> HandlerResult {
        if (request.contains("fail")) {
            return Err(request["fail"].is_string() ? request["fail"].get<std::string>() : request["fail"].dump());
        }
        if (request.value("query", "") == "hello") {
            return Ok(json{{"answer", "world"}});
        }
        return Ok(json{{"echo", request}});
    });
}
