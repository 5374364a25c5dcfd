// ============================================================================
// offload/io/tick_executor.cpp - Frame-Driven Host Loop
// ============================================================================

#include "offload/io/tick_executor.hpp"

#include "offload/core/log.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace offload {

// ============================================================================
// Construction / Destruction
// ============================================================================

TickExecutor::TickExecutor(Options options, int eventfd) : options_(options), eventfd_(eventfd) {}

Result<std::unique_ptr<TickExecutor>, std::error_code> TickExecutor::Create() {
    return Create(Options{});
}

Result<std::unique_ptr<TickExecutor>, std::error_code> TickExecutor::Create(Options options) {
    int efd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (efd < 0) {
        Log().error("eventfd failed: {}", std::strerror(errno));
        return Err(make_error_code(Errc::EventfdFailed));
    }
    return Ok(std::unique_ptr<TickExecutor>(new TickExecutor(options, efd)));
}

TickExecutor::~TickExecutor() {
    if (eventfd_ >= 0) {
        close(eventfd_);
    }
}

// ============================================================================
// Loop Control
// ============================================================================

void TickExecutor::Run() {
    running_ = true;
    while (true) {
        RunOnce();
        if (stop_requested_.exchange(false)) {
            break;
        }
        WaitForWork();
    }
    running_ = false;
}

void TickExecutor::RunOnce() {
    // Consume the wakeup signal first so work posted while we run re-arms it
    std::uint64_t val;
    [[maybe_unused]] auto ret = read(eventfd_, &val, sizeof(val));

    RunDueTimers();
    RunPosted();
}

void TickExecutor::Stop() {
    stop_requested_ = true;
    WakeUp();
}

bool TickExecutor::IsRunning() const {
    return running_;
}

// ============================================================================
// Callbacks and Timers
// ============================================================================

void TickExecutor::Post(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        posted_.push_back(std::move(callback));
    }
    WakeUp();
}

TimerId TickExecutor::ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> callback) {
    TimerId id = next_timer_id_.fetch_add(1);
    auto deadline = Clock::now() + std::max(delay, std::chrono::milliseconds::zero());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timer_heap_.push(TimerEntry{deadline, id});
        timer_callbacks_.emplace(id, std::move(callback));
    }
    WakeUp();
    return id;
}

bool TickExecutor::CancelTimer(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return timer_callbacks_.erase(id) > 0;
}

std::optional<TickExecutor::Clock::time_point> TickExecutor::NextDeadline() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!timer_heap_.empty() && timer_callbacks_.count(timer_heap_.top().id) == 0) {
        timer_heap_.pop();
    }
    if (timer_heap_.empty()) {
        return std::nullopt;
    }
    return timer_heap_.top().deadline;
}

std::size_t TickExecutor::PendingTimers() {
    std::lock_guard<std::mutex> lock(mutex_);
    return timer_callbacks_.size();
}

// ============================================================================
// Internal Methods
// ============================================================================

void TickExecutor::RunDueTimers() {
    auto now = Clock::now();

    std::vector<std::function<void()>> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!timer_heap_.empty() && timer_heap_.top().deadline <= now) {
            TimerId id = timer_heap_.top().id;
            timer_heap_.pop();

            auto it = timer_callbacks_.find(id);
            if (it == timer_callbacks_.end()) {
                continue;  // cancelled
            }
            due.push_back(std::move(it->second));
            timer_callbacks_.erase(it);
        }
    }

    for (auto& callback : due) {
        callback();
    }
}

void TickExecutor::RunPosted() {
    std::vector<std::function<void()>> posted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(posted, posted_);
    }

    for (auto& callback : posted) {
        callback();
    }
}

void TickExecutor::WaitForWork() {
    auto timeout = options_.max_wait;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!posted_.empty()) {
            return;
        }
        if (!timer_heap_.empty()) {
            auto until_due = std::chrono::ceil<std::chrono::milliseconds>(timer_heap_.top().deadline - Clock::now());
            timeout = std::clamp(until_due, std::chrono::milliseconds::zero(), timeout);
        }
    }

    pollfd pfd{};
    pfd.fd = eventfd_;
    pfd.events = POLLIN;
    [[maybe_unused]] int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
}

void TickExecutor::WakeUp() {
    std::uint64_t val = 1;
    [[maybe_unused]] auto ret = write(eventfd_, &val, sizeof(val));
}

}  // namespace offload
