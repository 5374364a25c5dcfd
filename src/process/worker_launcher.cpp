// ============================================================================
// offload/process/worker_launcher.cpp - Worker Process Spawning
// ============================================================================

#include "offload/process/worker_launcher.hpp"

#include "offload/core/defer.hpp"
#include "offload/core/log.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string_view>

extern char** environ;

namespace offload {

namespace {

// Killed-but-unreaped workers whose handles were released
std::mutex g_released_mutex;
std::vector<pid_t> g_released;

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

bool IsExecutableFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> BuildEnvironment(const WorkerCommand& command) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view var(*entry);
        std::string_view key = var.substr(0, var.find('='));
        bool overridden = std::any_of(command.env.begin(), command.env.end(),
                                      [&](const auto& kv) { return kv.first == key; });
        if (!overridden) {
            env.emplace_back(var);
        }
    }
    for (const auto& [key, value] : command.env) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> ToCStrings(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

}  // namespace

// ============================================================================
// ProcessHandle
// ============================================================================

ProcessHandle::~ProcessHandle() {
    Release();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), exit_status_(other.exit_status_) {
    other.pid_ = -1;
    other.reaped_ = false;
    other.exit_status_.reset();
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        Release();
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_status_ = other.exit_status_;
        other.pid_ = -1;
        other.reaped_ = false;
        other.exit_status_.reset();
    }
    return *this;
}

bool ProcessHandle::IsAlive() {
    if (!IsValid() || reaped_) {
        return false;
    }

    int status = 0;
    pid_t rc;
    do {
        rc = waitpid(pid_, &status, WNOHANG);
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) {
        return true;
    }
    if (rc == pid_) {
        Reap(status);
        return false;
    }

    // ECHILD: reaped elsewhere (e.g. SIGCHLD set to SIG_IGN by the host)
    Log().debug("waitpid({}) failed: {}", pid_, std::strerror(errno));
    reaped_ = true;
    return false;
}

std::optional<int> ProcessHandle::ExitStatus() {
    if (IsValid() && !reaped_) {
        (void)IsAlive();
    }
    return exit_status_;
}

bool ProcessHandle::Terminate() {
    if (!IsAlive()) {
        return false;
    }

    // The worker leads its own process group; take its children down too
    if (kill(-pid_, SIGKILL) != 0 && kill(pid_, SIGKILL) != 0) {
        Log().warn("Failed to kill worker (pid={}): {}", pid_, std::strerror(errno));
        return false;
    }
    Log().warn("Killed worker (pid={})", pid_);
    return true;
}

void ProcessHandle::Release() noexcept {
    if (!IsValid()) {
        return;
    }

    if (IsAlive()) {
        Terminate();
        if (IsAlive()) {
            std::lock_guard<std::mutex> lock(g_released_mutex);
            g_released.push_back(pid_);
        }
    } else {
        // Helpers the worker left behind still carry its process group
        kill(-pid_, SIGKILL);
    }

    pid_ = -1;
    reaped_ = false;
    exit_status_.reset();
}

void ProcessHandle::Reap(int status) {
    reaped_ = true;
    exit_status_ = DecodeWaitStatus(status);
    Log().debug("Worker (pid={}) exited with status {}", pid_, *exit_status_);
}

// ============================================================================
// Launching
// ============================================================================

std::optional<std::filesystem::path> FindProgram(const std::filesystem::path& program) {
    if (program.empty()) {
        return std::nullopt;
    }

    if (program.native().find('/') != std::string::npos) {
        if (IsExecutableFile(program)) return program;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string_view search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    while (true) {
        auto colon = search.find(':');
        std::string_view dir = search.substr(0, colon);
        auto candidate = (dir.empty() ? std::filesystem::path(".") : std::filesystem::path(dir)) / program;
        if (IsExecutableFile(candidate)) {
            return candidate;
        }
        if (colon == std::string_view::npos) break;
        search.remove_prefix(colon + 1);
    }
    return std::nullopt;
}

Result<ProcessHandle, Error> LaunchWorker(const WorkerCommand& command, const std::filesystem::path& request_path,
                                          const std::filesystem::path& result_path,
                                          const std::filesystem::path& working_dir) {
    ReapReleasedWorkers();

    auto program = FindProgram(command.program);
    if (!program) {
        Log().error("Worker program not found: '{}'", command.program.string());
        return Err(make_error_code(Errc::WorkerNotFound));
    }

    // Found relative to our cwd; the child starts in working_dir
    std::error_code ec;
    program = std::filesystem::absolute(*program, ec);
    if (ec) {
        Log().error("Cannot resolve worker program '{}': {}", command.program.string(), ec.message());
        return Err(make_error_code(Errc::WorkerNotFound));
    }

    if (!command.entry_point.empty()) {
        auto entry = command.entry_point.is_absolute() || working_dir.empty() ? command.entry_point
                                                                              : working_dir / command.entry_point;
        if (!std::filesystem::exists(entry, ec)) {
            Log().error("Worker entry point not found: '{}'", entry.string());
            return Err(make_error_code(Errc::WorkerNotFound));
        }
    }
    if (!working_dir.empty() && !std::filesystem::is_directory(working_dir, ec)) {
        Log().error("Worker working directory does not exist: '{}'", working_dir.string());
        return Err(make_error_code(Errc::SpawnFailed));
    }

    std::vector<std::string> args;
    args.push_back(program->string());
    args.insert(args.end(), command.args.begin(), command.args.end());
    if (!command.entry_point.empty()) {
        args.push_back(command.entry_point.string());
    }
    args.push_back(request_path.string());
    args.push_back(result_path.string());

    std::vector<std::string> env = BuildEnvironment(command);
    std::vector<char*> argv = ToCStrings(args);
    std::vector<char*> envp = ToCStrings(env);

    // File actions: detach stdin, optionally silence output, set cwd
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    OFFLOAD_DEFER([&] { posix_spawn_file_actions_destroy(&actions); });

    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (command.quiet) {
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
    }
    if (!working_dir.empty()) {
        posix_spawn_file_actions_addchdir_np(&actions, working_dir.c_str());
    }

    // Attributes: clean signal state, own process group
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    OFFLOAD_DEFER([&] { posix_spawnattr_destroy(&attr); });

    sigset_t no_signals;
    sigemptyset(&no_signals);
    posix_spawnattr_setsigmask(&attr, &no_signals);

    sigset_t default_signals;
    sigfillset(&default_signals);
    sigdelset(&default_signals, SIGKILL);
    sigdelset(&default_signals, SIGSTOP);
    posix_spawnattr_setsigdefault(&attr, &default_signals);

    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETPGROUP);

    pid_t pid = -1;
    int rc = posix_spawn(&pid, program->c_str(), &actions, &attr, argv.data(), envp.data());
    if (rc != 0) {
        Log().error("posix_spawn '{}' failed: {}", program->string(), std::strerror(rc));
        return Err(make_error_code(rc == ENOENT || rc == EACCES ? Errc::WorkerNotFound : Errc::SpawnFailed));
    }

    Log().info("Spawned worker '{}' (pid={})", program->string(), pid);
    return Ok(ProcessHandle(pid));
}

void ReapReleasedWorkers() {
    std::lock_guard<std::mutex> lock(g_released_mutex);
    g_released.erase(std::remove_if(g_released.begin(), g_released.end(),
                                    [](pid_t pid) {
                                        int status = 0;
                                        return waitpid(pid, &status, WNOHANG) != 0;
                                    }),
                     g_released.end());
}

}  // namespace offload
