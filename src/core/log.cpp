// ============================================================================
// offload/core/log.cpp - Library Logger
// ============================================================================

#include "offload/core/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>

namespace offload {

namespace {

std::shared_ptr<spdlog::logger> CreateLogger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = spdlog::stderr_color_mt(kLoggerName);
    } catch (const spdlog::spdlog_ex&) {
        // Lost a registration race with another thread
        logger = spdlog::get(kLoggerName);
    }

    const char* env = std::getenv("OFFLOAD_LOG_LEVEL");
    auto level = env ? ParseLogLevel(env) : std::nullopt;
    logger->set_level(level.value_or(spdlog::level::info));
    return logger;
}

}  // namespace

spdlog::logger& Log() {
    static const std::shared_ptr<spdlog::logger> logger = CreateLogger();
    return *logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
    Log().set_level(level);
}

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

}  // namespace offload
