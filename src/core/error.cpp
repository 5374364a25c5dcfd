// ============================================================================
// offload/core/error.cpp - Error Category Implementation
// ============================================================================

#include "offload/core/error.hpp"

#include <string>

namespace offload {

namespace {

class OffloadCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "offload"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::InvalidArgument:
                return "Invalid argument";
            case Errc::IoError:
                return "I/O error";
            case Errc::HandshakeDirFailed:
                return "Failed to prepare handshake directory";
            case Errc::RequestWriteFailed:
                return "Failed to write request file";
            case Errc::WorkerNotFound:
                return "Worker entry point not found";
            case Errc::SpawnFailed:
                return "Failed to spawn worker process";
            case Errc::TaskInFlight:
                return "A task is already in flight";
            case Errc::UnknownTask:
                return "Unknown task handle";
            case Errc::ResultIncomplete:
                return "Result file is incomplete";
            case Errc::MalformedResult:
                return "Malformed result";
            case Errc::WorkerReportedError:
                return "Worker reported an error";
            case Errc::WorkerExitedWithoutResult:
                return "Worker exited without result";
            case Errc::TimedOut:
                return "Task timed out";
            case Errc::Cancelled:
                return "Task cancelled";
            case Errc::EventfdFailed:
                return "Failed to create eventfd";
            default:
                return "Unknown offload error";
        }
    }
};

}  // namespace

const std::error_category& OffloadCategory() noexcept {
    static const OffloadCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), OffloadCategory()};
}

}  // namespace offload
