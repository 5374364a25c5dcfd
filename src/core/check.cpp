// ============================================================================
// offload/core/check.cpp - Precondition Failure Reporting
// ============================================================================

#include "offload/core/check.hpp"

#include "offload/core/log.hpp"

#include <cstdlib>

namespace offload::detail {

void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    Log().critical("OFFLOAD_CHECK({}) failed: {}\n  in {} ({}:{})", cond_str, msg, loc.function_name(),
                   loc.file_name(), loc.line());
    Log().flush();
    std::abort();
}

}  // namespace offload::detail
