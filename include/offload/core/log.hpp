// ============================================================================
// offload/core/log.hpp - Library Logger
// ============================================================================
//
// All diagnostics go through one spdlog logger named "offload", writing to
// stderr so the host application's stdout stays untouched. The logger is
// created on first use; if the application already registered a logger
// with that name (to route it into its own sinks), that one is used.
//
// The initial level comes from OFFLOAD_LOG_LEVEL
// (trace|debug|info|warn|error|off, case-insensitive, default info).
//
// USAGE:
// ------
//   Log().info("Spawned worker (pid={})", pid);
//   SetLogLevel(spdlog::level::debug);
//
// ============================================================================

#pragma once

#include <optional>
#include <spdlog/spdlog.h>
#include <string_view>

namespace offload {

inline constexpr const char* kLoggerName = "offload";

// The library logger. Never null.
spdlog::logger& Log();

void SetLogLevel(spdlog::level::level_enum level);

// Accepts the OFFLOAD_LOG_LEVEL spellings, plus "warning".
[[nodiscard]] std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view text);

}  // namespace offload
