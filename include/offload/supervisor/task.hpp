// ============================================================================
// offload/supervisor/task.hpp - Task States and Outcomes
// ============================================================================
//
// A task moves Running -> {Succeeded, Failed, TimedOut, Cancelled}. Running
// is entered only by Submit; the other four are terminal.
//
// Every task ends in exactly one Outcome, delivered through the same channel
// whether the worker succeeded, failed, hung or was cancelled:
//
//   kind      | error                          | value
//   ----------+--------------------------------+-----------------------
//   Success   | (none)                         | the worker's result
//   Failure   | WorkerReportedError,           | null
//             | MalformedResult,               |
//             | WorkerExitedWithoutResult      |
//   Timeout   | TimedOut                       | null
//   Cancelled | Cancelled                      | null
//
// ============================================================================

#pragma once

#include "offload/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace offload {

using TaskId = std::string;

struct TaskHandle {
    TaskId id;

    bool operator==(const TaskHandle&) const = default;
};

enum class TaskState : std::uint8_t { Running, Succeeded, Failed, TimedOut, Cancelled };

[[nodiscard]] constexpr bool IsTerminal(TaskState state) noexcept {
    return state != TaskState::Running;
}

[[nodiscard]] const char* ToString(TaskState state) noexcept;

// ============================================================================
// Outcome
// ============================================================================

enum class OutcomeKind : std::uint8_t { Success, Failure, Timeout, Cancelled };

[[nodiscard]] const char* ToString(OutcomeKind kind) noexcept;

struct Outcome {
    OutcomeKind kind = OutcomeKind::Failure;
    nlohmann::json value;
    Error error;
    std::string reason;  // human-readable, empty on success
    std::optional<int> exit_status;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool IsSuccess() const noexcept { return kind == OutcomeKind::Success; }

    static Outcome Success(nlohmann::json value);
    static Outcome Failure(Error error, std::string reason);
    static Outcome Timeout(std::chrono::milliseconds limit);
    static Outcome Cancelled();
};

// ============================================================================
// PollOutcome - Pending | Done(Outcome)
// ============================================================================
class PollOutcome {
   public:
    static PollOutcome Pending() { return PollOutcome(); }
    static PollOutcome Done(Outcome outcome) { return PollOutcome(std::move(outcome)); }

    [[nodiscard]] bool IsPending() const noexcept { return !outcome_.has_value(); }
    [[nodiscard]] bool IsDone() const noexcept { return outcome_.has_value(); }

    // Precondition: IsDone()
    [[nodiscard]] const Outcome& Get() const& { return *outcome_; }
    [[nodiscard]] Outcome&& Get() && { return std::move(*outcome_); }

   private:
    PollOutcome() = default;
    explicit PollOutcome(Outcome outcome) : outcome_(std::move(outcome)) {}

    std::optional<Outcome> outcome_;
};

// ============================================================================
// PollTarget - Anything a Poller Can Ask "Are You Done?"
// ============================================================================
//
// TaskSupervisor is the production implementation. Poll must not block.
//
class PollTarget {
   public:
    virtual ~PollTarget() = default;

    virtual PollOutcome Poll(const TaskHandle& handle) = 0;
};

}  // namespace offload

namespace std {
template <>
struct hash<offload::TaskHandle> {
    size_t operator()(const offload::TaskHandle& handle) const noexcept { return hash<string>{}(handle.id); }
};
}  // namespace std
