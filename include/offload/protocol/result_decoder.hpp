// ============================================================================
// offload/protocol/result_decoder.hpp - Result File Wire Format
// ============================================================================
//
// The worker's result file is a JSON object tagged by "status":
//
//   {"status":"ok", "answer":"world"}         -> success, value {"answer":"world"}
//   {"status":"error", "error":"OOM"}         -> worker-reported failure "OOM"
//
// Decoding distinguishes three failure kinds:
//
//   Errc::ResultIncomplete     empty file, or bytes that do not parse as JSON
//                              (truncated, pre-sized, mid-write). Transient:
//                              the supervisor retries within its grace window
//                              and gives up once the worker has exited.
//   Errc::WorkerReportedError  an explicit, well-formed error payload.
//   Errc::MalformedResult      valid JSON of the wrong shape (a non-object, a
//                              missing or unknown status) or a value that
//                              cannot be represented. Final.
//
// ============================================================================

#pragma once

#include "offload/core/error.hpp"
#include "offload/core/result.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace offload {

struct DecodeError {
    Error code;
    std::string reason;

    // Worth another look on the next poll tick
    [[nodiscard]] bool IsTransient() const noexcept { return code == Errc::ResultIncomplete; }
};

[[nodiscard]] Result<nlohmann::json, DecodeError> DecodeResult(std::string_view bytes);

// Inverse of DecodeResult, for workers. A non-object value is wrapped as
// {"result": value}.
[[nodiscard]] std::string EncodeSuccess(const nlohmann::json& value);
[[nodiscard]] std::string EncodeError(std::string_view reason);

}  // namespace offload
