// ============================================================================
// offload/io/libuv_executor.hpp - libuv-based Host Loop
// ============================================================================
//
// LibuvExecutor adapts a libuv event loop to the Executor interface, for
// applications whose foreground loop already is (or can be) libuv.
//
// ARCHITECTURE:
// -------------
// - uv_loop_t:  the event loop, owned by the executor
// - uv_async_t: wakes the loop when Post/ScheduleAfter/CancelTimer/Stop are
//               called, from any thread
// - uv_timer_t: one per pending ScheduleAfter, created and destroyed on the
//               loop thread only (libuv timers are not thread-safe)
//
// ============================================================================

#pragma once

#include "offload/core/error.hpp"
#include "offload/core/result.hpp"
#include "offload/io/executor.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <uv.h>
#include <vector>

namespace offload {

class LibuvExecutor : public Executor {
   public:
    static Result<std::unique_ptr<LibuvExecutor>, std::error_code> Create();

    ~LibuvExecutor() override;

    // libuv handles hold pointers back into this object
    LibuvExecutor(const LibuvExecutor&) = delete;
    LibuvExecutor& operator=(const LibuvExecutor&) = delete;

    // ========================================================================
    // Executor Interface Implementation
    // ========================================================================

    void Run() override;
    void RunOnce() override;
    void Stop() override;
    bool IsRunning() const override;

    void Post(std::function<void()> callback) override;
    TimerId ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> callback) override;
    bool CancelTimer(TimerId id) override;

    uv_loop_t* GetLoop() { return &loop_; }

   private:
    LibuvExecutor() = default;

    // Heap-allocated; freed by the timer's close callback
    struct TimerSlot {
        uv_timer_t timer;
        TimerId id = 0;
        LibuvExecutor* owner = nullptr;
        std::function<void()> callback;
    };

    struct TimerRequest {
        TimerId id;
        std::chrono::milliseconds delay;
        std::function<void()> callback;
    };

    static void OnAsync(uv_async_t* handle);
    static void OnTimer(uv_timer_t* handle);
    static void OnTimerClosed(uv_handle_t* handle);

    // Loop thread only
    void DrainQueues();
    void StartTimer(TimerRequest request);
    void CloseTimer(TimerId id);

    uv_loop_t loop_;
    uv_async_t async_;
    bool initialized_ = false;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<TimerId> next_timer_id_{1};

    // Guarded by queue_mutex_
    std::mutex queue_mutex_;
    std::vector<std::function<void()>> callback_queue_;
    std::vector<TimerRequest> timer_queue_;
    std::vector<TimerId> cancel_queue_;
    std::unordered_set<TimerId> pending_timers_;  // scheduled, not yet fired or cancelled

    // Loop thread only
    std::unordered_map<TimerId, TimerSlot*> active_timers_;
};

}  // namespace offload
