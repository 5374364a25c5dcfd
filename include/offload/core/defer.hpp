// ============================================================================
// offload/core/defer.hpp - Deferred Cleanup
// ============================================================================
//
// Runs a cleanup action when the scope exits, unless dismissed first.
// Used around C APIs that hand out resources needing an explicit destroy
// call (posix_spawn attributes, file descriptors, half-built task dirs).
//
// USAGE:
// ------
//   posix_spawnattr_t attr;
//   posix_spawnattr_init(&attr);
//   OFFLOAD_DEFER([&] { posix_spawnattr_destroy(&attr); });
//
//   Defer remove_dir([&] { RemoveTaskDir(); });
//   ...
//   remove_dir.Dismiss();  // success: keep the directory
//
// ============================================================================

#pragma once

#include <utility>

namespace offload {

template <typename F>
class Defer {
   public:
    explicit Defer(F func) : func_(std::move(func)) {}

    ~Defer() {
        if (armed_) func_();
    }

    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;

    Defer(Defer&& other) noexcept : func_(std::move(other.func_)), armed_(other.armed_) { other.armed_ = false; }
    Defer& operator=(Defer&&) = delete;

    void Dismiss() noexcept { armed_ = false; }

   private:
    F func_;
    bool armed_ = true;
};

}  // namespace offload

#define OFFLOAD_DEFER_CONCAT_IMPL(a, b) a##b
#define OFFLOAD_DEFER_CONCAT(a, b) OFFLOAD_DEFER_CONCAT_IMPL(a, b)
#define OFFLOAD_DEFER(lambda) ::offload::Defer OFFLOAD_DEFER_CONCAT(_offload_defer_, __LINE__){lambda}
