// ============================================================================
// offload/supervisor/offloader.cpp - Submit-and-Callback Facade
// ============================================================================

#include "offload/supervisor/offloader.hpp"

#include "offload/core/defer.hpp"
#include "offload/core/log.hpp"

namespace offload {

Offloader::Offloader(Executor& executor, std::unique_ptr<TaskSupervisor> supervisor, PollerOptions poller_options)
    : executor_(executor), supervisor_(std::move(supervisor)), poller_(executor, *supervisor_, poller_options) {}

Result<std::unique_ptr<Offloader>, Error> Offloader::Create(Executor& executor, SupervisorOptions options,
                                                            PollerOptions poller_options) {
    if (poller_options.interval.count() <= 0) {
        return Err(make_error_code(Errc::InvalidArgument));
    }

    auto supervisor = TaskSupervisor::Create(std::move(options));
    if (supervisor.IsErr()) {
        return Err(supervisor.Error());
    }

    return Ok(std::unique_ptr<Offloader>(new Offloader(executor, std::move(supervisor).Value(), poller_options)));
}

Result<TaskHandle, Error> Offloader::Submit(const nlohmann::json& request, Callback on_done) {
    return Track(supervisor_->Submit(request), std::move(on_done));
}

Result<TaskHandle, Error> Offloader::Submit(const nlohmann::json& request, std::chrono::milliseconds timeout,
                                            Callback on_done) {
    return Track(supervisor_->Submit(request, timeout), std::move(on_done));
}

Result<TaskHandle, Error> Offloader::Track(Result<TaskHandle, Error> submitted, Callback on_done) {
    if (submitted.IsErr()) {
        return submitted;
    }
    const TaskHandle& handle = submitted.Value();

    callbacks_.emplace(handle, std::move(on_done));
    poller_.StartPolling(handle, [this, handle](Outcome outcome) { Deliver(handle, std::move(outcome)); });
    return submitted;
}

Result<void, Error> Offloader::Cancel(const TaskHandle& handle) {
    auto it = callbacks_.find(handle);
    if (it == callbacks_.end()) {
        return Err(make_error_code(Errc::UnknownTask));
    }

    poller_.StopPolling(handle);
    auto cancelled = supervisor_->Cancel(handle);
    if (cancelled.IsErr()) {
        return cancelled;
    }

    auto on_done = std::move(it->second);
    callbacks_.erase(it);

    // Poll on a terminal task only returns the stored outcome
    auto outcome = supervisor_->Poll(handle);
    executor_.Post([this, handle, on_done = std::move(on_done), outcome = std::move(outcome).Get(),
                    token = std::weak_ptr<bool>(alive_)]() mutable {
        if (token.expired()) return;
        OFFLOAD_DEFER([&] { supervisor_->Cleanup(handle); });
        if (on_done) on_done(std::move(outcome));
    });
    return Ok();
}

void Offloader::Deliver(const TaskHandle& handle, Outcome outcome) {
    auto it = callbacks_.find(handle);
    if (it == callbacks_.end()) {
        Log().warn("Dropping outcome for untracked task {}", handle.id);
        supervisor_->Cleanup(handle);
        return;
    }
    auto on_done = std::move(it->second);
    callbacks_.erase(it);

    OFFLOAD_DEFER([&] { supervisor_->Cleanup(handle); });
    if (on_done) on_done(std::move(outcome));
}

}  // namespace offload
