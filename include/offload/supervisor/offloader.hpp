// ============================================================================
// offload/supervisor/offloader.hpp - Submit-and-Callback Facade
// ============================================================================
//
// Offloader wires a TaskSupervisor to a Poller on one Executor so callers
// only deal with "submit this, call me when it is over":
//
//   auto offloader = Offloader::Create(loop, options).Value();
//   offloader->Submit({{"query", "hello"}}, 30s, [](Outcome outcome) {
//       if (outcome.IsSuccess()) Show(outcome.value);
//       else ShowError(outcome.reason);
//   });
//
// Every accepted task reaches its callback exactly once, on the loop thread,
// including cancelled ones. Handshake files are removed and the worker
// released as soon as the callback returns. Tasks still outstanding when the
// Offloader is destroyed are killed and never reach their callback.
//
// ============================================================================

#pragma once

#include "offload/core/error.hpp"
#include "offload/core/result.hpp"
#include "offload/io/executor.hpp"
#include "offload/supervisor/poller.hpp"
#include "offload/supervisor/task_supervisor.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <unordered_map>

namespace offload {

class Offloader {
   public:
    using Callback = std::function<void(Outcome)>;

    static Result<std::unique_ptr<Offloader>, Error> Create(Executor& executor, SupervisorOptions options,
                                                            PollerOptions poller_options = {});

    Offloader(const Offloader&) = delete;
    Offloader& operator=(const Offloader&) = delete;

    Result<TaskHandle, Error> Submit(const nlohmann::json& request, Callback on_done);
    Result<TaskHandle, Error> Submit(const nlohmann::json& request, std::chrono::milliseconds timeout,
                                     Callback on_done);

    // Kill the worker and deliver Cancelled to the task's callback on the
    // next loop iteration. UnknownTask once the callback has been delivered.
    Result<void, Error> Cancel(const TaskHandle& handle);

    [[nodiscard]] std::size_t InFlight() const { return supervisor_->InFlight(); }

    [[nodiscard]] TaskSupervisor& Supervisor() noexcept { return *supervisor_; }

   private:
    Offloader(Executor& executor, std::unique_ptr<TaskSupervisor> supervisor, PollerOptions poller_options);

    Result<TaskHandle, Error> Track(Result<TaskHandle, Error> submitted, Callback on_done);
    void Deliver(const TaskHandle& handle, Outcome outcome);

    Executor& executor_;
    std::unique_ptr<TaskSupervisor> supervisor_;
    Poller poller_;
    std::unordered_map<TaskHandle, Callback> callbacks_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace offload
