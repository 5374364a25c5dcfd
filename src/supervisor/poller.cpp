// ============================================================================
// offload/supervisor/poller.cpp - Cooperative Completion Polling
// ============================================================================

#include "offload/supervisor/poller.hpp"

#include "offload/core/check.hpp"
#include "offload/core/log.hpp"

#include <cstdlib>
#include <string>

namespace offload {

PollerOptions PollerOptions::FromEnv() {
    return FromEnv(PollerOptions{});
}

PollerOptions PollerOptions::FromEnv(PollerOptions base) {
    const char* val = std::getenv("OFFLOAD_POLL_INTERVAL_MS");
    if (!val || !*val) {
        return base;
    }
    try {
        auto ms = std::stoull(val);
        if (ms > 0) base.interval = std::chrono::milliseconds(ms);
    } catch (const std::exception&) {
        Log().warn("Ignoring invalid OFFLOAD_POLL_INTERVAL_MS='{}'", val);
    }
    return base;
}

Poller::Poller(Executor& executor, PollTarget& target, PollerOptions options)
    : executor_(executor), target_(target), options_(options) {}

Poller::~Poller() {
    for (auto& [handle, entry] : entries_) {
        if (entry.timer != 0) executor_.CancelTimer(entry.timer);
    }
}

void Poller::StartPolling(const TaskHandle& handle, DoneCallback on_done) {
    StartPolling(handle, options_.interval, std::move(on_done));
}

void Poller::StartPolling(const TaskHandle& handle, std::chrono::milliseconds interval, DoneCallback on_done) {
    OFFLOAD_CHECK(interval.count() > 0, "poll interval must be positive");
    OFFLOAD_CHECK(!entries_.contains(handle), "task is already being polled");

    auto [it, inserted] = entries_.emplace(handle, Entry{interval, std::move(on_done), 0, next_generation_++});
    Log().debug("Polling task {} every {} ms", handle.id, interval.count());
    Arm(it->first, it->second);
}

bool Poller::StopPolling(const TaskHandle& handle) {
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return false;
    }
    if (it->second.timer != 0) {
        executor_.CancelTimer(it->second.timer);
    }
    entries_.erase(it);
    Log().debug("Stopped polling task {}", handle.id);
    return true;
}

bool Poller::IsPolling(const TaskHandle& handle) const {
    return entries_.contains(handle);
}

void Poller::Arm(const TaskHandle& handle, Entry& entry) {
    entry.timer = executor_.ScheduleAfter(
        entry.interval, [this, handle, generation = entry.generation, token = std::weak_ptr<bool>(alive_)] {
            if (token.expired()) return;
            Tick(handle, generation);
        });
}

void Poller::Tick(const TaskHandle& handle, std::uint64_t generation) {
    auto it = entries_.find(handle);
    // Stopped, or stopped and restarted since this timer was armed
    if (it == entries_.end() || it->second.generation != generation) {
        return;
    }
    it->second.timer = 0;

    auto poll = target_.Poll(handle);

    it = entries_.find(handle);
    if (it == entries_.end() || it->second.generation != generation) {
        return;
    }

    if (poll.IsPending()) {
        Arm(it->first, it->second);
        return;
    }

    // Erase before invoking so on_done may start polling this handle again
    auto on_done = std::move(it->second.on_done);
    entries_.erase(it);
    if (on_done) {
        on_done(std::move(poll).Get());
    }
}

}  // namespace offload
