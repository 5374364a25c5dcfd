// ============================================================================
// offload/core/result.hpp - Result Type for Error Handling
// ============================================================================
//
// Result<T, E> holds either a success value or an error. Nothing in the
// public API throws; anything that can fail returns a Result instead, so a
// failure can never unwind into the host loop.
//
// Three error types travel in it:
//   Error (std::error_code)  submission, spawning and file operations
//   DecodeError              result file classification, code plus reason
//   std::string              a worker handler's own failure message
//
// There is no bool conversion; test with IsOk() / IsErr().
//
// USAGE:
// ------
//   Result<std::string, Error> ReadFile(const std::filesystem::path& path);
//
//   auto bytes = ReadFile(path);
//   if (bytes.IsErr()) {
//       Log().warn("read failed: {}", bytes.Error().message());
//       return;
//   }
//   Consume(bytes.Value());
//
// ============================================================================

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace offload {

// ============================================================================
// Ok / Err Tags
// ============================================================================

template <typename T>
struct OkTag {
    T value;
};

template <typename E>
struct ErrTag {
    E error;
};

template <typename T>
OkTag<std::decay_t<T>> Ok(T&& value) {
    return OkTag<std::decay_t<T>>{std::forward<T>(value)};
}

template <typename E>
ErrTag<std::decay_t<E>> Err(E&& error) {
    return ErrTag<std::decay_t<E>>{std::forward<E>(error)};
}

// Value-less success, for Result<void, E>
struct Unit {};

inline OkTag<Unit> Ok() {
    return OkTag<Unit>{Unit{}};
}

// ============================================================================
// Result<T, E>
// ============================================================================
template <typename T, typename E>
class Result {
   public:
    template <typename U>
    Result(OkTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template <typename U>
    Result(ErrTag<U>&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool IsOk() const noexcept { return data_.index() == 0; }
    bool IsErr() const noexcept { return data_.index() == 1; }

    // Precondition: IsOk()
    T& Value() & { return std::get<0>(data_); }
    const T& Value() const& { return std::get<0>(data_); }
    T&& Value() && { return std::get<0>(std::move(data_)); }

    // Precondition: IsErr()
    E& Error() & { return std::get<1>(data_); }
    const E& Error() const& { return std::get<1>(data_); }
    E&& Error() && { return std::get<1>(std::move(data_)); }

    T ValueOr(T fallback) const {
        if (IsOk()) return std::get<0>(data_);
        return fallback;
    }

   private:
    std::variant<T, E> data_;
};

// ============================================================================
// Result<void, E>
// ============================================================================
template <typename E>
class Result<void, E> {
   public:
    Result(OkTag<Unit>&&) {}

    template <typename U>
    Result(ErrTag<U>&& err) : error_(std::move(err.error)) {}

    bool IsOk() const noexcept { return !error_.has_value(); }
    bool IsErr() const noexcept { return error_.has_value(); }

    E& Error() & { return *error_; }
    const E& Error() const& { return *error_; }
    E&& Error() && { return std::move(*error_); }

   private:
    std::optional<E> error_;
};

}  // namespace offload
