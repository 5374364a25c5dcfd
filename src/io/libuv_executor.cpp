// ============================================================================
// offload/io/libuv_executor.cpp - libuv-based Host Loop Implementation
// ============================================================================

#include "offload/io/libuv_executor.hpp"

#include "offload/core/log.hpp"

#include <algorithm>
#include <cstdint>

namespace offload {

// ============================================================================
// Construction / Destruction
// ============================================================================

Result<std::unique_ptr<LibuvExecutor>, std::error_code> LibuvExecutor::Create() {
    auto executor = std::unique_ptr<LibuvExecutor>(new LibuvExecutor());

    int rc = uv_loop_init(&executor->loop_);
    if (rc != 0) {
        Log().error("uv_loop_init failed: {}", uv_strerror(rc));
        return Err(make_error_code(Errc::IoError));
    }
    executor->loop_.data = executor.get();

    rc = uv_async_init(&executor->loop_, &executor->async_, OnAsync);
    if (rc != 0) {
        Log().error("uv_async_init failed: {}", uv_strerror(rc));
        uv_loop_close(&executor->loop_);
        return Err(make_error_code(Errc::IoError));
    }
    executor->async_.data = executor.get();
    executor->initialized_ = true;

    return Ok(std::move(executor));
}

LibuvExecutor::~LibuvExecutor() {
    if (!initialized_) return;

    // Close the async handle and any timers still pending, then let the
    // close callbacks run so every TimerSlot is freed.
    uv_walk(
        &loop_,
        [](uv_handle_t* handle, void*) {
            if (uv_is_closing(handle)) return;
            uv_close(handle, handle->type == UV_TIMER ? OnTimerClosed : nullptr);
        },
        nullptr);

    while (uv_loop_alive(&loop_)) {
        uv_run(&loop_, UV_RUN_NOWAIT);
    }
    uv_loop_close(&loop_);
}

// ============================================================================
// Loop Control
// ============================================================================

void LibuvExecutor::Run() {
    running_ = true;
    uv_run(&loop_, UV_RUN_DEFAULT);
    running_ = false;
}

void LibuvExecutor::RunOnce() {
    uv_run(&loop_, UV_RUN_NOWAIT);
}

void LibuvExecutor::Stop() {
    stop_requested_ = true;
    uv_async_send(&async_);
}

bool LibuvExecutor::IsRunning() const {
    return running_;
}

// ============================================================================
// Callbacks and Timers
// ============================================================================

void LibuvExecutor::Post(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        callback_queue_.push_back(std::move(callback));
    }
    uv_async_send(&async_);
}

TimerId LibuvExecutor::ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> callback) {
    TimerId id = next_timer_id_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending_timers_.insert(id);
        timer_queue_.push_back(TimerRequest{id, delay, std::move(callback)});
    }
    uv_async_send(&async_);
    return id;
}

bool LibuvExecutor::CancelTimer(TimerId id) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (pending_timers_.erase(id) == 0) {
            return false;
        }
        cancel_queue_.push_back(id);
    }
    uv_async_send(&async_);
    return true;
}

// ============================================================================
// libuv Callbacks
// ============================================================================

void LibuvExecutor::OnAsync(uv_async_t* handle) {
    auto* self = static_cast<LibuvExecutor*>(handle->data);
    self->DrainQueues();

    if (self->stop_requested_.exchange(false)) {
        uv_stop(&self->loop_);
    }
}

void LibuvExecutor::OnTimer(uv_timer_t* handle) {
    auto* slot = static_cast<TimerSlot*>(handle->data);
    LibuvExecutor* self = slot->owner;

    bool live;
    {
        std::lock_guard<std::mutex> lock(self->queue_mutex_);
        live = self->pending_timers_.erase(slot->id) > 0;
    }
    self->active_timers_.erase(slot->id);

    auto callback = std::move(slot->callback);
    uv_close(reinterpret_cast<uv_handle_t*>(handle), OnTimerClosed);

    if (live && callback) {
        callback();
    }
}

void LibuvExecutor::OnTimerClosed(uv_handle_t* handle) {
    delete static_cast<TimerSlot*>(handle->data);
}

// ============================================================================
// Internal Helpers
// ============================================================================

void LibuvExecutor::DrainQueues() {
    std::vector<std::function<void()>> callbacks;
    std::vector<TimerRequest> timers;
    std::vector<TimerId> cancels;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(callbacks, callback_queue_);
        std::swap(timers, timer_queue_);
        std::swap(cancels, cancel_queue_);
    }

    for (auto& request : timers) {
        StartTimer(std::move(request));
    }
    for (TimerId id : cancels) {
        CloseTimer(id);
    }
    for (auto& callback : callbacks) {
        callback();
    }
}

void LibuvExecutor::StartTimer(TimerRequest request) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (pending_timers_.count(request.id) == 0) {
            return;  // cancelled before it reached the loop
        }
    }

    auto* slot = new TimerSlot;
    slot->id = request.id;
    slot->owner = this;
    slot->callback = std::move(request.callback);

    int rc = uv_timer_init(&loop_, &slot->timer);
    if (rc != 0) {
        // No timer available: run it now rather than drop it
        Log().warn("uv_timer_init failed ({}), running timer {} immediately", uv_strerror(rc), request.id);
        auto callback = std::move(slot->callback);
        delete slot;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            pending_timers_.erase(request.id);
        }
        callback();
        return;
    }

    slot->timer.data = slot;
    auto timeout = static_cast<std::uint64_t>(std::max<std::chrono::milliseconds::rep>(0, request.delay.count()));
    uv_timer_start(&slot->timer, OnTimer, timeout, 0);
    active_timers_.emplace(request.id, slot);
}

void LibuvExecutor::CloseTimer(TimerId id) {
    auto it = active_timers_.find(id);
    if (it == active_timers_.end()) {
        return;
    }
    uv_timer_stop(&it->second->timer);
    uv_close(reinterpret_cast<uv_handle_t*>(&it->second->timer), OnTimerClosed);
    active_timers_.erase(it);
}

}  // namespace offload
