/**
 * @file result.hpp
 * @brief Error-carrying result type for codebox.
 *
 * Result<T, E> is the error-handling currency between modules. Exceptions
 * thrown by libraries (filesystem, JSON, TOML) are caught at module
 * boundaries and folded into an Error with the matching ErrorCode.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace codebox {

/**
 * @brief Failure categories surfaced to the request layer.
 *
 * A user program that times out, runs out of memory or exits non-zero is
 * not an error; those are classified results.
 */
enum class ErrorCode : uint8_t {
    Internal,
    NotFound,           ///< Unknown language/version
    InvalidRequest,     ///< Malformed files or non-clampable limits
    StagingFailed,      ///< Filesystem failure while writing the workspace
    EngineUnavailable,  ///< Control API unreachable or timed out
    EngineRejected,     ///< Control API answered with an error status
    DeadlineExceeded    ///< A bounded engine call ran out of time
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Internal:          return "internal";
        case ErrorCode::NotFound:          return "not_found";
        case ErrorCode::InvalidRequest:    return "invalid_request";
        case ErrorCode::StagingFailed:     return "staging_failed";
        case ErrorCode::EngineUnavailable: return "engine_unavailable";
        case ErrorCode::EngineRejected:    return "engine_rejected";
        case ErrorCode::DeadlineExceeded:  return "deadline_exceeded";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a category and a descriptive message.
 */
struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that can fail but return nothing.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace codebox
