// ============================================================================
// offload/supervisor/task_supervisor.cpp - Process-Isolated Task Supervisor
// ============================================================================

#include "offload/supervisor/task_supervisor.hpp"

#include "offload/core/defer.hpp"
#include "offload/core/log.hpp"
#include "offload/protocol/result_decoder.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace offload {

namespace {

using Clock = std::chrono::steady_clock;

std::optional<std::uint64_t> EnvNumber(const char* name) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return std::nullopt;
    }
    try {
        auto parsed = std::stoull(val);
        if (parsed == 0) return std::nullopt;
        return parsed;
    } catch (const std::exception&) {
        Log().warn("Ignoring invalid {}='{}'", name, val);
        return std::nullopt;
    }
}

std::chrono::milliseconds ElapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

}  // namespace

// ============================================================================
// SupervisorOptions
// ============================================================================

SupervisorOptions SupervisorOptions::FromEnv() {
    return FromEnv(SupervisorOptions{});
}

SupervisorOptions SupervisorOptions::FromEnv(SupervisorOptions base) {
    if (const char* dir = std::getenv("OFFLOAD_HANDSHAKE_DIR"); dir && *dir) {
        base.handshake_dir = dir;
    }
    if (auto ms = EnvNumber("OFFLOAD_TASK_TIMEOUT_MS")) {
        base.default_timeout = std::chrono::milliseconds(*ms);
    }
    if (auto ms = EnvNumber("OFFLOAD_DECODE_GRACE_MS")) {
        base.decode_grace = std::chrono::milliseconds(*ms);
    }
    if (auto n = EnvNumber("OFFLOAD_MAX_IN_FLIGHT")) {
        base.max_in_flight = static_cast<std::size_t>(*n);
    }
    return base;
}

// ============================================================================
// Construction / Destruction
// ============================================================================

TaskSupervisor::TaskSupervisor(SupervisorOptions options, HandshakeDirectory handshake)
    : options_(std::move(options)), handshake_(std::move(handshake)) {}

Result<std::unique_ptr<TaskSupervisor>, Error> TaskSupervisor::Create(SupervisorOptions options) {
    if (options.worker.program.empty() || options.max_in_flight == 0) {
        return Err(make_error_code(Errc::InvalidArgument));
    }

    auto handshake = HandshakeDirectory::Open(options.handshake_dir);
    if (handshake.IsErr()) {
        return Err(handshake.Error());
    }

    return Ok(std::unique_ptr<TaskSupervisor>(new TaskSupervisor(std::move(options), std::move(handshake).Value())));
}

TaskSupervisor::~TaskSupervisor() {
    std::vector<TaskId> ids;
    ids.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        ids.push_back(id);
    }
    for (auto& id : ids) {
        Cleanup(TaskHandle{std::move(id)});
    }
}

// ============================================================================
// Task Lifecycle
// ============================================================================

Result<TaskHandle, Error> TaskSupervisor::Submit(const nlohmann::json& request) {
    return SubmitTask(request, options_.default_timeout);
}

Result<TaskHandle, Error> TaskSupervisor::Submit(const nlohmann::json& request, std::chrono::milliseconds timeout) {
    return SubmitTask(request, timeout);
}

Result<TaskHandle, Error> TaskSupervisor::SubmitTask(const nlohmann::json& request,
                                                     std::optional<std::chrono::milliseconds> timeout) {
    auto submitted = Clock::now();

    if (timeout && timeout->count() <= 0) {
        return Err(make_error_code(Errc::InvalidArgument));
    }
    if (InFlight() >= options_.max_in_flight) {
        Log().warn("Rejecting submit: {} task(s) already in flight", InFlight());
        return Err(make_error_code(Errc::TaskInFlight));
    }

    std::string bytes;
    try {
        bytes = request.dump();
    } catch (const nlohmann::json::exception& e) {
        Log().error("Cannot serialize request: {}", e.what());
        return Err(make_error_code(Errc::InvalidArgument));
    }

    auto task = std::make_unique<Task>();
    task->id = GenerateTaskId();
    task->submitted = submitted;
    task->timeout = timeout;

    auto paths = handshake_.Prepare(task->id);
    if (paths.IsErr()) {
        return Err(paths.Error());
    }
    task->paths = std::move(paths).Value();

    Defer remove_dir([&] { handshake_.Remove(task->paths); });

    if (WriteFileAtomic(task->paths.request, bytes).IsErr()) {
        return Err(make_error_code(Errc::RequestWriteFailed));
    }

    auto process = LaunchWorker(options_.worker, task->paths.request, task->paths.result, options_.working_dir);
    if (process.IsErr()) {
        return Err(process.Error());
    }
    remove_dir.Dismiss();
    task->process = std::move(process).Value();

    TaskHandle handle{task->id};
    Log().info("Task {} submitted (pid={}, timeout={})", task->id, task->process.Pid(),
               timeout ? std::to_string(timeout->count()) + "ms" : std::string("none"));
    tasks_.emplace(task->id, std::move(task));
    return Ok(std::move(handle));
}

PollOutcome TaskSupervisor::Poll(const TaskHandle& handle) {
    auto it = tasks_.find(handle.id);
    if (it == tasks_.end()) {
        return PollOutcome::Done(Outcome::Failure(Errc::UnknownTask, "unknown task '" + handle.id + "'"));
    }
    Task& task = *it->second;
    if (task.outcome) {
        return PollOutcome::Done(*task.outcome);
    }

    // 1. The result file is the only completion signal
    if (FileExists(task.paths.result)) {
        bool exited = !task.process.IsAlive();
        if (auto verdict = InspectResult(task, exited)) {
            return std::move(*verdict);
        }
    } else if (!task.process.IsAlive()) {
        // 2. The worker may have written its result between the two checks
        if (FileExists(task.paths.result)) {
            if (auto verdict = InspectResult(task, true)) {
                return std::move(*verdict);
            }
        }
        auto status = task.process.ExitStatus();
        return Finish(task, TaskState::Failed,
                      Outcome::Failure(Errc::WorkerExitedWithoutResult,
                                       "worker exited without result (exit status " +
                                           (status ? std::to_string(*status) : std::string("unknown")) + ")"));
    }

    // 3. Deadline
    if (task.timeout && Clock::now() - task.submitted >= *task.timeout) {
        task.process.Terminate();
        return Finish(task, TaskState::TimedOut, Outcome::Timeout(*task.timeout));
    }

    Log().trace("Task {} pending ({} ms)", task.id, ElapsedSince(task.submitted).count());
    return PollOutcome::Pending();
}

std::optional<PollOutcome> TaskSupervisor::InspectResult(Task& task, bool worker_exited) {
    auto bytes = ReadFile(task.paths.result);
    auto decoded = bytes.IsOk() ? DecodeResult(bytes.Value())
                                : Result<nlohmann::json, DecodeError>(Err(DecodeError{
                                      Errc::ResultIncomplete, "result file could not be read"}));

    if (decoded.IsOk()) {
        return Finish(task, TaskState::Succeeded, Outcome::Success(std::move(decoded).Value()));
    }

    DecodeError error = std::move(decoded).Error();
    if (!error.IsTransient()) {
        return Finish(task, TaskState::Failed, Outcome::Failure(error.code, std::move(error.reason)));
    }

    // Incomplete content from a dead worker will never be completed
    if (worker_exited) {
        return Finish(task, TaskState::Failed,
                      Outcome::Failure(Errc::MalformedResult, error.reason + " after the worker exited"));
    }

    auto now = Clock::now();
    if (!task.first_unreadable) {
        task.first_unreadable = now;
    } else if (now - *task.first_unreadable >= options_.decode_grace) {
        task.process.Terminate();
        return Finish(task, TaskState::Failed,
                      Outcome::Failure(Errc::MalformedResult,
                                       error.reason + " for longer than " +
                                           std::to_string(options_.decode_grace.count()) + " ms"));
    }

    Log().debug("Task {}: {}, retrying next tick", task.id, error.reason);
    return std::nullopt;
}

Result<void, Error> TaskSupervisor::Cancel(const TaskHandle& handle) {
    auto it = tasks_.find(handle.id);
    if (it == tasks_.end()) {
        return Err(make_error_code(Errc::UnknownTask));
    }
    Task& task = *it->second;
    if (IsTerminal(task.state)) {
        return Ok();
    }

    task.process.Terminate();
    Finish(task, TaskState::Cancelled, Outcome::Cancelled());

    // Whatever the worker managed to write is discarded, never decoded
    RemoveFiles(task);
    return Ok();
}

void TaskSupervisor::Cleanup(const TaskHandle& handle) noexcept {
    auto it = tasks_.find(handle.id);
    if (it == tasks_.end()) {
        return;
    }
    Task& task = *it->second;

    // Release() kills a worker that is still running; nothing else is
    // recorded since the entry goes away
    RemoveFiles(task);
    task.process.Release();
    tasks_.erase(it);
}

PollOutcome TaskSupervisor::Finish(Task& task, TaskState state, Outcome outcome) {
    task.state = state;
    outcome.exit_status = task.process.ExitStatus();
    outcome.elapsed = ElapsedSince(task.submitted);
    task.outcome = outcome;

    if (outcome.IsSuccess()) {
        Log().info("Task {} succeeded in {} ms", task.id, outcome.elapsed.count());
    } else {
        Log().info("Task {} {} after {} ms: {}", task.id, ToString(state), outcome.elapsed.count(), outcome.reason);
    }
    return PollOutcome::Done(std::move(outcome));
}

void TaskSupervisor::RemoveFiles(const Task& task) const noexcept {
    if (options_.keep_files) {
        return;
    }
    handshake_.Remove(task.paths);
}

// ============================================================================
// Introspection
// ============================================================================

std::optional<TaskState> TaskSupervisor::State(const TaskHandle& handle) const {
    auto it = tasks_.find(handle.id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second->state;
}

std::optional<TaskPaths> TaskSupervisor::Paths(const TaskHandle& handle) const {
    auto it = tasks_.find(handle.id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second->paths;
}

std::size_t TaskSupervisor::InFlight() const {
    return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(), [](const auto& entry) {
        return entry.second->state == TaskState::Running;
    }));
}

}  // namespace offload
