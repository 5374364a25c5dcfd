// ============================================================================
// offload/core/check.hpp - Always-On Precondition Checks
// ============================================================================
//
// OFFLOAD_CHECK(cond, msg) guards API misuse that is a programming error,
// e.g. polling the same task from two pollers. It is never compiled out.
// On failure the condition and source location go to the offload logger and
// stderr, then the process aborts.
//
// Runtime failures (a worker crashing, a file that cannot be written) are
// never checks: they travel as Result errors or terminal Outcomes.
//
// ============================================================================

#pragma once

#include <source_location>

namespace offload::detail {

[[noreturn]] void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc);

}  // namespace offload::detail

#define OFFLOAD_CHECK(cond, msg)                                                       \
    do {                                                                               \
        if (!(cond)) [[unlikely]] {                                                    \
            ::offload::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                              \
    } while (0)
