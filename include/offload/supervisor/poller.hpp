// ============================================================================
// offload/supervisor/poller.hpp - Cooperative Completion Polling
// ============================================================================
//
// The Poller turns "is the task done yet?" into a chain of host-loop timers.
// Each tick asks the PollTarget once and either re-arms a timer or delivers
// the outcome. Nothing here ever sleeps or waits; between ticks the host
// loop is free to redraw and handle input.
//
//   StartPolling ──> [interval] ──> Poll ──Pending──> [interval] ──> Poll ...
//                                     │
//                                    Done ──> on_done(outcome)   (once)
//
// All callbacks run on the executor's loop thread. The Poller itself is not
// thread-safe and must only be touched from that thread.
//
// USAGE:
// ------
//   Poller poller(loop, *supervisor);
//   poller.StartPolling(handle, [](Outcome outcome) { Show(outcome); });
//   ...
//   poller.StopPolling(handle);  // e.g. on cancel
//
// ============================================================================

#pragma once

#include "offload/io/executor.hpp"
#include "offload/supervisor/task.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

namespace offload {

struct PollerOptions {
    // Delay between consecutive checks of one task
    std::chrono::milliseconds interval{500};

    // Overlay OFFLOAD_POLL_INTERVAL_MS onto `base` (or the defaults)
    static PollerOptions FromEnv();
    static PollerOptions FromEnv(PollerOptions base);
};

// ============================================================================
// Poller
// ============================================================================
class Poller {
   public:
    using DoneCallback = std::function<void(Outcome)>;

    // Both references must outlive the Poller
    Poller(Executor& executor, PollTarget& target, PollerOptions options = {});

    // Withdraws every pending check; no on_done fires afterwards
    ~Poller();

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    // Begin checking `handle` every interval. Polling an already polled
    // handle is a programming error.
    void StartPolling(const TaskHandle& handle, DoneCallback on_done);
    void StartPolling(const TaskHandle& handle, std::chrono::milliseconds interval, DoneCallback on_done);

    // Withdraw the pending check. Returns false if the handle was not being
    // polled (never started, already done, or already stopped).
    bool StopPolling(const TaskHandle& handle);

    [[nodiscard]] bool IsPolling(const TaskHandle& handle) const;

    [[nodiscard]] std::size_t Active() const noexcept { return entries_.size(); }

    [[nodiscard]] const PollerOptions& Options() const noexcept { return options_; }

   private:
    struct Entry {
        std::chrono::milliseconds interval;
        DoneCallback on_done;
        TimerId timer = 0;
        std::uint64_t generation = 0;
    };

    void Arm(const TaskHandle& handle, Entry& entry);
    void Tick(const TaskHandle& handle, std::uint64_t generation);

    Executor& executor_;
    PollTarget& target_;
    PollerOptions options_;
    std::unordered_map<TaskHandle, Entry> entries_;
    std::uint64_t next_generation_ = 1;

    // Expires with the Poller so timers that slip past CancelTimer are inert
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace offload
