// ============================================================================
// offload/core/error.hpp - Error Codes for offload
// ============================================================================
//
// Every failure the library can report is a std::error_code in the offload
// error category. The same codes classify terminal task failures (see
// Outcome::error), so a caller can branch on them without string matching.
//
// USAGE:
// ------
//   auto handle = supervisor.Submit(request);
//   if (handle.IsErr() && handle.Error() == Errc::WorkerNotFound) {
//       ShowInstallHint();
//   }
//
// ============================================================================

#pragma once

#include <system_error>

namespace offload {

enum class Errc {
    InvalidArgument = 1,
    IoError,

    // Submission
    HandshakeDirFailed,
    RequestWriteFailed,
    WorkerNotFound,
    SpawnFailed,
    TaskInFlight,
    UnknownTask,

    // Result classification
    ResultIncomplete,
    MalformedResult,
    WorkerReportedError,
    WorkerExitedWithoutResult,
    TimedOut,
    Cancelled,

    // Host loop
    EventfdFailed,
};

const std::error_category& OffloadCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

using Error = std::error_code;

}  // namespace offload

namespace std {
template <>
struct is_error_code_enum<offload::Errc> : true_type {};
}  // namespace std
