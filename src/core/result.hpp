/**
 * @file result.hpp
 * @brief Monadic error handling type for EdgeSentinel.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Errors carry
 * an ErrorCode so callers can tell transient delivery failures apart from
 * lifecycle and persistence failures without string matching.
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

namespace edge_sentinel {

// ─────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    Internal,
    DuplicateName,      ///< Registry key already taken
    NotFound,
    InvalidState,       ///< Illegal state-machine edge
    Spawn,              ///< fork/exec failure
    Signal,             ///< kill(2) failure
    Io,                 ///< Generic I/O (transient for delivery)
    Parse,              ///< Malformed persisted or configured data
    Connection,         ///< Transient: peer refused / unreachable
    Timeout,            ///< Transient: deadline exceeded
    CircuitOpen,        ///< Breaker refused the attempt
    Config
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Internal:      return "internal";
        case ErrorCode::DuplicateName: return "duplicate_name";
        case ErrorCode::NotFound:      return "not_found";
        case ErrorCode::InvalidState:  return "invalid_state";
        case ErrorCode::Spawn:         return "spawn";
        case ErrorCode::Signal:        return "signal";
        case ErrorCode::Io:            return "io";
        case ErrorCode::Parse:         return "parse";
        case ErrorCode::Connection:    return "connection";
        case ErrorCode::Timeout:       return "timeout";
        case ErrorCode::CircuitOpen:   return "circuit_open";
        case ErrorCode::Config:        return "config";
    }
    return "unknown";
}

/**
 * @brief Errors worth retrying on the telemetry delivery path.
 */
[[nodiscard]] constexpr bool is_transient(ErrorCode code) noexcept {
    return code == ErrorCode::Connection
        || code == ErrorCode::Timeout
        || code == ErrorCode::Io;
}

/**
 * @brief Error type carrying a classification and a descriptive message.
 */
struct Error {
    ErrorCode code{ErrorCode::Internal};
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E>, a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
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

    // ── Monadic operations ────────────────────

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

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
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

}  // namespace edge_sentinel
