// ============================================================================
// offload/protocol/handshake.cpp - Filesystem Handshake Between Processes
// ============================================================================

#include "offload/protocol/handshake.hpp"

#include "offload/core/log.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iterator>

namespace offload {

// ============================================================================
// HandshakeDirectory
// ============================================================================

Result<HandshakeDirectory, Error> HandshakeDirectory::Open(const std::filesystem::path& base) {
    if (base.empty()) {
        return Err(make_error_code(Errc::InvalidArgument));
    }

    std::error_code ec;
    std::filesystem::create_directories(base, ec);
    if (ec || !std::filesystem::is_directory(base, ec)) {
        Log().error("Cannot create handshake directory '{}': {}", base.string(), ec.message());
        return Err(make_error_code(Errc::HandshakeDirFailed));
    }

    auto absolute = std::filesystem::absolute(base, ec);
    return Ok(HandshakeDirectory(ec ? base : absolute));
}

TaskPaths HandshakeDirectory::PathsFor(const std::string& task_id) const {
    auto dir = base_ / task_id;
    return TaskPaths{dir, dir / kRequestFileName, dir / kResultFileName};
}

Result<TaskPaths, Error> HandshakeDirectory::Prepare(const std::string& task_id) const {
    if (task_id.empty() || task_id.find('/') != std::string::npos) {
        return Err(make_error_code(Errc::InvalidArgument));
    }

    TaskPaths paths = PathsFor(task_id);
    std::error_code ec;
    if (!std::filesystem::create_directory(paths.dir, ec)) {
        Log().error("Cannot create task directory '{}': {}", paths.dir.string(),
                    ec ? ec.message() : std::string("already exists"));
        return Err(make_error_code(Errc::HandshakeDirFailed));
    }
    return Ok(std::move(paths));
}

bool HandshakeDirectory::Remove(const TaskPaths& paths) const noexcept {
    std::error_code ec;
    std::filesystem::remove_all(paths.dir, ec);
    if (ec) {
        Log().warn("Failed to remove task directory '{}': {}", paths.dir.string(), ec.message());
        return false;
    }
    return true;
}

// ============================================================================
// File Helpers
// ============================================================================

Result<void, Error> WriteFileAtomic(const std::filesystem::path& path, std::string_view bytes) {
    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            Log().error("Cannot open '{}' for writing", tmp.string());
            return Err(make_error_code(Errc::IoError));
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            Log().error("Short write to '{}'", tmp.string());
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return Err(make_error_code(Errc::IoError));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        Log().error("Cannot publish '{}': {}", path.string(), ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return Err(make_error_code(Errc::IoError));
    }
    return Ok();
}

Result<std::string, Error> ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Err(make_error_code(Errc::IoError));
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Err(make_error_code(Errc::IoError));
    }
    return Ok(std::move(bytes));
}

bool FileExists(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::string GenerateTaskId() {
    static std::atomic<std::uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
                   std::chrono::steady_clock::now().time_since_epoch())
                   .count();
    return std::to_string(now) + "_" + std::to_string(getpid()) + "_" + std::to_string(counter.fetch_add(1));
}

}  // namespace offload
