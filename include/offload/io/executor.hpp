// ============================================================================
// offload/io/executor.hpp - Abstract Host Loop Interface
// ============================================================================
//
// The Executor is the host loop as seen by offload: the foreground
// application's own event/redraw loop. offload never blocks it. All waiting
// is expressed as "call me back later" through ScheduleAfter().
//
// DESIGN PHILOSOPHY:
// ------------------
// 1. SINGLE-THREADED: Callbacks run on the thread that drives the loop.
//    Everything offload does on completion (polling, delivering outcomes)
//    happens there, so no locks are needed around task state.
//
// 2. PLUGGABLE BACKENDS: LibuvExecutor wraps a libuv loop; TickExecutor is a
//    self-contained loop a redrawing application can pump once per frame.
//    Applications with their own loop implement this interface directly.
//
// 3. CANCELLABLE TIMERS: ScheduleAfter returns a TimerId so a pending
//    reschedule can be withdrawn when a task is cancelled.
//
// USAGE:
// ------
//   Executor& loop = ...;
//   TimerId id = loop.ScheduleAfter(500ms, [] { CheckWorker(); });
//   loop.CancelTimer(id);
//   loop.Post([] { RequestRedraw(); });
//
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace offload {

// Zero is never handed out
using TimerId = std::uint64_t;

// ============================================================================
// Executor - Abstract Host Loop
// ============================================================================
class Executor {
   public:
    virtual ~Executor() = default;

    // ========================================================================
    // Loop Control
    // ========================================================================

    // Run until Stop() is called
    virtual void Run() = 0;

    // Run whatever is due right now without waiting (one frame's worth)
    virtual void RunOnce() = 0;

    // Ask Run() to return. Safe to call from any thread.
    virtual void Stop() = 0;

    [[nodiscard]] virtual bool IsRunning() const = 0;

    // ========================================================================
    // Callbacks
    // ========================================================================

    // Run callback on the loop thread as soon as possible. Safe from any thread.
    virtual void Post(std::function<void()> callback) = 0;

    // Run callback once on the loop thread after at least `delay`.
    virtual TimerId ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> callback) = 0;

    // Withdraw a pending ScheduleAfter. Returns false if the timer already
    // fired, was already cancelled, or is unknown.
    virtual bool CancelTimer(TimerId id) = 0;
};

}  // namespace offload
