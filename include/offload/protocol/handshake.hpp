// ============================================================================
// offload/protocol/handshake.hpp - Filesystem Handshake Between Processes
// ============================================================================
//
// A task's request and result travel as two one-shot files:
//
//   <base>/<task-id>/request.json   written once by the supervisor, before spawn
//   <base>/<task-id>/result.json    written once by the worker, as its last act
//
// Both are published by writing "<name>.tmp" and renaming it into place, so
// a reader that sees the final name sees complete content. Workers that do
// not rename are still tolerated by the result decoder (see ResultDecoder).
//
// The per-task subdirectory means a stale result from an earlier task can
// never be mistaken for the current one.
//
// ============================================================================

#pragma once

#include "offload/core/error.hpp"
#include "offload/core/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace offload {

inline constexpr const char* kRequestFileName = "request.json";
inline constexpr const char* kResultFileName = "result.json";

struct TaskPaths {
    std::filesystem::path dir;
    std::filesystem::path request;
    std::filesystem::path result;
};

// ============================================================================
// HandshakeDirectory - Base Path Owned by One Supervisor
// ============================================================================
class HandshakeDirectory {
   public:
    // Creates `base` (and parents) if missing
    static Result<HandshakeDirectory, Error> Open(const std::filesystem::path& base);

    [[nodiscard]] const std::filesystem::path& Base() const noexcept { return base_; }

    // Paths for a task, without touching the filesystem
    [[nodiscard]] TaskPaths PathsFor(const std::string& task_id) const;

    // Create the task's subdirectory. Fails if it already exists.
    Result<TaskPaths, Error> Prepare(const std::string& task_id) const;

    // Remove the task's subdirectory and everything in it. Best effort.
    bool Remove(const TaskPaths& paths) const noexcept;

   private:
    explicit HandshakeDirectory(std::filesystem::path base) : base_(std::move(base)) {}

    std::filesystem::path base_;
};

// ============================================================================
// File Helpers
// ============================================================================

// Write to "<path>.tmp", flush, then rename over `path`
Result<void, Error> WriteFileAtomic(const std::filesystem::path& path, std::string_view bytes);

Result<std::string, Error> ReadFile(const std::filesystem::path& path);

[[nodiscard]] bool FileExists(const std::filesystem::path& path) noexcept;

// "<steady-clock-us>_<pid>_<counter>": unique within and across processes
[[nodiscard]] std::string GenerateTaskId();

}  // namespace offload
