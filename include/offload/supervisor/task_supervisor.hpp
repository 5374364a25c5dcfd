// ============================================================================
// offload/supervisor/task_supervisor.hpp - Process-Isolated Task Supervisor
// ============================================================================
//
// TaskSupervisor runs each task in its own worker process and tracks it from
// Submit to a terminal Outcome. It never waits: Submit returns right after
// the spawn, and Poll only looks at the filesystem and at waitpid(WNOHANG).
// Something else (a Poller on the host loop) decides when to call Poll.
//
// POLL ORDER:
// -----------
//   1. Result file present?  Decode it. Valid -> Succeeded. Final decode
//      error -> Failed. Still being written -> look again next tick.
//   2. Worker exited?        Re-check for a result written just before exit,
//                            then Failed(WorkerExitedWithoutResult).
//   3. Deadline passed?      Kill the worker, TimedOut.
//   4. Otherwise             Pending.
//
// The result file is checked before liveness because a worker writes its
// result as its last act; a worker that has exited is never taken as done.
//
// USAGE:
// ------
//   SupervisorOptions options;
//   options.handshake_dir = cache_dir / "offload";
//   options.worker = {.program = "python3", .entry_point = "infer.py"};
//
//   auto supervisor = TaskSupervisor::Create(options).Value();
//   auto handle = supervisor->Submit({{"query", "hello"}}, 30s);
//   ...
//   auto poll = supervisor->Poll(handle.Value());
//   if (poll.IsDone()) {
//       Use(poll.Get());
//       supervisor->Cleanup(handle.Value());
//   }
//
// ============================================================================

#pragma once

#include "offload/core/error.hpp"
#include "offload/core/result.hpp"
#include "offload/process/worker_launcher.hpp"
#include "offload/protocol/handshake.hpp"
#include "offload/supervisor/task.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <unordered_map>

namespace offload {

// ============================================================================
// SupervisorOptions
// ============================================================================
struct SupervisorOptions {
    // Owned exclusively by this supervisor; created if missing
    std::filesystem::path handshake_dir;

    WorkerCommand worker;

    // Worker's working directory; empty inherits the caller's
    std::filesystem::path working_dir;

    // Applied by Submit(request); nullopt means no deadline
    std::optional<std::chrono::milliseconds> default_timeout;

    // How long a present-but-unparseable result may stay that way
    std::chrono::milliseconds decode_grace{2000};

    // Tasks allowed in the Running state at once
    std::size_t max_in_flight = 1;

    // Leave handshake files behind for debugging
    bool keep_files = false;

    // Overlay OFFLOAD_HANDSHAKE_DIR, OFFLOAD_TASK_TIMEOUT_MS,
    // OFFLOAD_DECODE_GRACE_MS and OFFLOAD_MAX_IN_FLIGHT onto `base`.
    // Unset, unparseable or zero values keep the value from `base`.
    static SupervisorOptions FromEnv();
    static SupervisorOptions FromEnv(SupervisorOptions base);
};

// ============================================================================
// TaskSupervisor
// ============================================================================
class TaskSupervisor : public PollTarget {
   public:
    static Result<std::unique_ptr<TaskSupervisor>, Error> Create(SupervisorOptions options);

    // Kills and cleans up every task still held
    ~TaskSupervisor() override;

    TaskSupervisor(const TaskSupervisor&) = delete;
    TaskSupervisor& operator=(const TaskSupervisor&) = delete;

    // ========================================================================
    // Task Lifecycle
    // ========================================================================

    // Write the request, spawn the worker, return at once
    Result<TaskHandle, Error> Submit(const nlohmann::json& request);
    Result<TaskHandle, Error> Submit(const nlohmann::json& request, std::chrono::milliseconds timeout);

    // Advance the task's state machine. Terminal tasks keep returning the
    // same Done outcome; unknown handles get Done(Failure(UnknownTask)).
    PollOutcome Poll(const TaskHandle& handle) override;

    // Kill the worker and settle on Cancelled. No effect once terminal.
    Result<void, Error> Cancel(const TaskHandle& handle);

    // Forget the task: remove its files, release its process. A worker that
    // is still running is killed. Idempotent.
    void Cleanup(const TaskHandle& handle) noexcept;

    // ========================================================================
    // Introspection
    // ========================================================================

    [[nodiscard]] std::optional<TaskState> State(const TaskHandle& handle) const;

    [[nodiscard]] std::optional<TaskPaths> Paths(const TaskHandle& handle) const;

    // Tasks currently Running
    [[nodiscard]] std::size_t InFlight() const;

    [[nodiscard]] const SupervisorOptions& Options() const noexcept { return options_; }

   private:
    struct Task {
        TaskId id;
        TaskPaths paths;
        ProcessHandle process;
        std::chrono::steady_clock::time_point submitted;
        std::optional<std::chrono::milliseconds> timeout;
        TaskState state = TaskState::Running;
        std::optional<Outcome> outcome;
        std::optional<std::chrono::steady_clock::time_point> first_unreadable;
    };

    TaskSupervisor(SupervisorOptions options, HandshakeDirectory handshake);

    Result<TaskHandle, Error> SubmitTask(const nlohmann::json& request, std::optional<std::chrono::milliseconds> timeout);

    // Step 1 of Poll: nullopt means "no verdict from the result file yet"
    std::optional<PollOutcome> InspectResult(Task& task, bool worker_exited);

    PollOutcome Finish(Task& task, TaskState state, Outcome outcome);

    void RemoveFiles(const Task& task) const noexcept;

    SupervisorOptions options_;
    HandshakeDirectory handshake_;
    std::unordered_map<TaskId, std::unique_ptr<Task>> tasks_;
};

}  // namespace offload
