// ============================================================================
// offload/io/tick_executor.hpp - Frame-Driven Host Loop
// ============================================================================
//
// TickExecutor is a self-contained Executor for applications that already
// own a redraw loop (a game loop, an immediate-mode GUI, a terminal UI).
// Call RunOnce() once per frame: it runs posted callbacks and any timers
// that have come due, and returns without waiting. Run() drives the same
// machinery standalone, sleeping on an eventfd until the next deadline.
//
// DESIGN:
// -------
// 1. Timer heap: min-heap of (deadline, id). Cancelled timers are dropped
//    lazily when they reach the top.
// 2. eventfd: wakes Run() when another thread posts work or stops the loop.
// 3. Callbacks run outside the lock, so they may freely Post/ScheduleAfter.
//
// USAGE:
// ------
//   auto loop = TickExecutor::Create().Value();
//   while (window.IsOpen()) {
//       loop->RunOnce();
//       window.Draw();
//   }
//
// ============================================================================

#pragma once

#include "offload/core/error.hpp"
#include "offload/core/result.hpp"
#include "offload/io/executor.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <unordered_map>
#include <vector>

namespace offload {

class TickExecutor : public Executor {
   public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        // Upper bound on a single wait inside Run()
        std::chrono::milliseconds max_wait{100};

        Options() = default;
    };

    static Result<std::unique_ptr<TickExecutor>, std::error_code> Create();
    static Result<std::unique_ptr<TickExecutor>, std::error_code> Create(Options options);

    ~TickExecutor() override;

    TickExecutor(const TickExecutor&) = delete;
    TickExecutor& operator=(const TickExecutor&) = delete;

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

    // ========================================================================
    // Introspection
    // ========================================================================

    // Earliest pending deadline, for frame loops that want to sleep precisely
    [[nodiscard]] std::optional<Clock::time_point> NextDeadline();

    [[nodiscard]] std::size_t PendingTimers();

   private:
    TickExecutor(Options options, int eventfd);

    struct TimerEntry {
        Clock::time_point deadline;
        TimerId id;

        bool operator>(const TimerEntry& other) const {
            if (deadline != other.deadline) return deadline > other.deadline;
            return id > other.id;
        }
    };

    void RunDueTimers();
    void RunPosted();
    void WaitForWork();
    void WakeUp();

    Options options_;
    int eventfd_ = -1;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<TimerId> next_timer_id_{1};

    std::mutex mutex_;
    std::vector<std::function<void()>> posted_;
    std::priority_queue<TimerEntry, std::vector<TimerEntry>, std::greater<TimerEntry>> timer_heap_;
    std::unordered_map<TimerId, std::function<void()>> timer_callbacks_;
};

}  // namespace offload
