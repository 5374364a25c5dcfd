// ============================================================================
// offload/worker/worker_main.cpp - Worker-Side Entry Point Helpers
// ============================================================================

#include "offload/worker/worker_main.hpp"

#include "offload/core/log.hpp"
#include "offload/protocol/handshake.hpp"
#include "offload/protocol/result_decoder.hpp"

#include <exception>

namespace offload::worker {

using nlohmann::json;

std::optional<WorkerArgs> ParseArgs(int argc, const char* const* argv) {
    if (argc < 3 || argv == nullptr) {
        return std::nullopt;
    }
    const char* request = argv[argc - 2];
    const char* result = argv[argc - 1];
    if (request == nullptr || result == nullptr || *request == '\0' || *result == '\0') {
        return std::nullopt;
    }
    return WorkerArgs{request, result};
}

Result<json, Error> ReadRequest(const std::filesystem::path& path) {
    auto bytes = ReadFile(path);
    if (bytes.IsErr()) {
        return Err(bytes.Error());
    }

    try {
        return Ok(json::parse(bytes.Value()));
    } catch (const json::exception& e) {
        Log().error("Request {} cannot be decoded: {}", path.string(), e.what());
        return Err(make_error_code(Errc::InvalidArgument));
    }
}

Result<void, Error> WriteResultFile(const std::filesystem::path& path, const json& value) {
    return WriteFileAtomic(path, EncodeSuccess(value));
}

Result<void, Error> WriteErrorFile(const std::filesystem::path& path, std::string_view reason) {
    return WriteFileAtomic(path, EncodeError(reason));
}

int RunWorker(int argc, const char* const* argv, const Handler& handler) {
    auto args = ParseArgs(argc, argv);
    if (!args) {
        Log().error("usage: {} <request_path> <result_path>", argc > 0 && argv ? argv[0] : "worker");
        return kExitUsage;
    }

    auto request = ReadRequest(args->request);
    if (request.IsErr()) {
        auto reason = "cannot read request: " + request.Error().message();
        if (WriteErrorFile(args->result, reason).IsErr()) {
            Log().error("Cannot write result file {}", args->result.string());
        }
        return kExitUsage;
    }

    HandlerResult outcome = Err(std::string("handler produced no result"));
    try {
        outcome = handler(request.Value());
    } catch (const std::exception& e) {
        outcome = Err(std::string("handler threw: ") + e.what());
    }

    if (outcome.IsOk()) {
        if (WriteResultFile(args->result, outcome.Value()).IsErr()) {
            Log().error("Cannot write result file {}", args->result.string());
            return kExitUsage;
        }
        return kExitOk;
    }

    Log().warn("Handler failed: {}", outcome.Error());
    if (WriteErrorFile(args->result, outcome.Error()).IsErr()) {
        Log().error("Cannot write result file {}", args->result.string());
        return kExitUsage;
    }
    return kExitHandlerError;
}

}  // namespace offload::worker
