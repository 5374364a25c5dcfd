// ============================================================================
// offload/supervisor/task.cpp - Task States and Outcomes
// ============================================================================

#include "offload/supervisor/task.hpp"

namespace offload {

const char* ToString(TaskState state) noexcept {
    switch (state) {
        case TaskState::Running:
            return "running";
        case TaskState::Succeeded:
            return "succeeded";
        case TaskState::Failed:
            return "failed";
        case TaskState::TimedOut:
            return "timed-out";
        case TaskState::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

const char* ToString(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Success:
            return "success";
        case OutcomeKind::Failure:
            return "failure";
        case OutcomeKind::Timeout:
            return "timeout";
        case OutcomeKind::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

Outcome Outcome::Success(nlohmann::json value) {
    Outcome outcome;
    outcome.kind = OutcomeKind::Success;
    outcome.value = std::move(value);
    return outcome;
}

Outcome Outcome::Failure(Error error, std::string reason) {
    Outcome outcome;
    outcome.kind = OutcomeKind::Failure;
    outcome.error = error;
    outcome.reason = std::move(reason);
    return outcome;
}

Outcome Outcome::Timeout(std::chrono::milliseconds limit) {
    Outcome outcome;
    outcome.kind = OutcomeKind::Timeout;
    outcome.error = Errc::TimedOut;
    outcome.reason = "task exceeded its " + std::to_string(limit.count()) + " ms timeout";
    return outcome;
}

Outcome Outcome::Cancelled() {
    Outcome outcome;
    outcome.kind = OutcomeKind::Cancelled;
    outcome.error = Errc::Cancelled;
    outcome.reason = "task cancelled";
    return outcome;
}

}  // namespace offload
