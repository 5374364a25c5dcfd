// ============================================================================
// offload/process/worker_launcher.hpp - Worker Process Spawning
// ============================================================================
//
// Starts a worker as an independent OS process. The worker shares nothing
// with the caller's runtime: it has its own address space, its own process
// group, and stdin redirected from /dev/null so it can never compete with
// the foreground application for terminal input or job-control signals.
//
// The worker is invoked as
//
//   <program> [args...] [entry_point] <request_path> <result_path>
//
// so an interpreter-hosted worker is { program = "python3",
// entry_point = "infer.py" } and a native one is { program = "./infer" }.
//
// ProcessHandle answers liveness and exit-status queries with
// waitpid(WNOHANG) and terminates with SIGKILL to the whole process group,
// so both work on an unresponsive worker and neither ever blocks.
//
// ============================================================================

#pragma once

#include "offload/core/error.hpp"
#include "offload/core/result.hpp"

#include <sys/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace offload {

// ============================================================================
// WorkerCommand - How to Invoke the Worker
// ============================================================================
struct WorkerCommand {
    // Absolute/relative path, or a bare name searched in PATH
    std::filesystem::path program;

    // Arguments placed before the entry point
    std::vector<std::string> args;

    // Script or module run by `program`; must exist when set
    std::filesystem::path entry_point;

    // Added to (or overriding) the inherited environment
    std::vector<std::pair<std::string, std::string>> env;

    // Send the worker's stdout/stderr to /dev/null instead of inheriting them
    bool quiet = false;
};

// ============================================================================
// ProcessHandle - Spawned Worker
// ============================================================================
class ProcessHandle {
   public:
    ProcessHandle() = default;
    explicit ProcessHandle(pid_t pid) : pid_(pid) {}

    // Kills the worker if it is still running
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;
    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;

    [[nodiscard]] bool IsValid() const noexcept { return pid_ > 0; }
    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }

    // Non-blocking. Reaps the process the first time it is seen dead.
    [[nodiscard]] bool IsAlive();

    // Exit code, or 128 + signal number; nullopt while running
    [[nodiscard]] std::optional<int> ExitStatus();

    // SIGKILL the worker's process group. Returns false if it had already
    // exited. Does not wait; the process is reaped by a later IsAlive().
    bool Terminate();

    // Terminate if needed and give up ownership. Helpers the worker left
    // running in its process group are killed even after it exited.
    // Idempotent.
    void Release() noexcept;

   private:
    void Reap(int status);

    pid_t pid_ = -1;
    bool reaped_ = false;
    std::optional<int> exit_status_;
};

// ============================================================================
// Launching
// ============================================================================

// Resolve a program the way execvp would. Paths containing '/' are checked
// directly; bare names are searched in PATH.
[[nodiscard]] std::optional<std::filesystem::path> FindProgram(const std::filesystem::path& program);

// Spawn the worker. Fails with Errc::WorkerNotFound when the program or the
// entry point cannot be located, Errc::SpawnFailed when the OS refuses.
// An empty working_dir inherits the caller's.
[[nodiscard]] Result<ProcessHandle, Error> LaunchWorker(const WorkerCommand& command,
                                                       const std::filesystem::path& request_path,
                                                       const std::filesystem::path& result_path,
                                                       const std::filesystem::path& working_dir = {});

// Collect workers that were killed but not yet reaped when their handle was
// released. Non-blocking; called on every launch.
void ReapReleasedWorkers();

}  // namespace offload
