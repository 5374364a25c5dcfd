// ============================================================================
// offload/worker/worker_main.hpp - Worker-Side Entry Point Helpers
// ============================================================================
//
// The worker half of the handshake. A C++ worker's main() can be a single
// call:
//
//   int main(int argc, char** argv) {
//       return offload::worker::RunWorker(argc, argv, [](const nlohmann::json& request)
//                                             -> offload::worker::HandlerResult {
//           return offload::Ok(nlohmann::json{{"answer", Infer(request)}});
//       });
//   }
//
// RunWorker reads the request file named by the second-to-last argument,
// runs the handler and publishes the result file named by the last
// argument with a temp-file rename, so the supervisor never sees a partial
// write. Workers in other languages follow the same contract by hand.
//
// EXIT CODES:
// -----------
//   0  result written with status "ok"
//   1  handler failed or threw; result written with status "error"
//   2  bad arguments or unreadable request; error result written if possible
//
// ============================================================================

#pragma once

#include "offload/core/error.hpp"
#include "offload/core/result.hpp"

#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace offload::worker {

inline constexpr int kExitOk = 0;
inline constexpr int kExitHandlerError = 1;
inline constexpr int kExitUsage = 2;

using HandlerResult = Result<nlohmann::json, std::string>;
using Handler = std::function<HandlerResult(const nlohmann::json& request)>;

struct WorkerArgs {
    std::filesystem::path request;
    std::filesystem::path result;
};

// The two trailing arguments; anything before them is ignored
[[nodiscard]] std::optional<WorkerArgs> ParseArgs(int argc, const char* const* argv);

Result<nlohmann::json, Error> ReadRequest(const std::filesystem::path& path);

Result<void, Error> WriteResultFile(const std::filesystem::path& path, const nlohmann::json& value);
Result<void, Error> WriteErrorFile(const std::filesystem::path& path, std::string_view reason);

int RunWorker(int argc, const char* const* argv, const Handler& handler);

}  // namespace offload::worker
