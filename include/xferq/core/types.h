#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace xferq {

using TimePoint = std::chrono::system_clock::time_point;
using JobId = std::string;

enum class ErrorCode {
    Success = 0,
    InvalidArgument,   ///< caller passed something unusable
    ValidationError,   ///< a job request failed validation
    NotFound,          ///< unknown job id
    InvalidTransition, ///< job status does not allow the operation
    InvalidState,      ///< component is in the wrong lifecycle phase
    InvalidData,       ///< a stored row or tool output could not be decoded
    DatabaseError,     ///< the job store could not read or write
    TransferFailed,    ///< the transfer tool could not be launched
    NotInitialized,    ///< used before start()
    SystemShutdown,    ///< rejected because the service is stopping
    NotSupported,
    InternalError
};

/**
 * @brief Stable snake_case name for an error code.
 *
 * This is the "code" field of API error bodies, so the names must not change.
 */
constexpr std::string_view errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "ok";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::ValidationError: return "validation_error";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::InvalidTransition: return "invalid_transition";
        case ErrorCode::InvalidState: return "invalid_state";
        case ErrorCode::InvalidData: return "invalid_data";
        case ErrorCode::DatabaseError: return "database_error";
        case ErrorCode::TransferFailed: return "transfer_failed";
        case ErrorCode::NotInitialized: return "not_initialized";
        case ErrorCode::SystemShutdown: return "shutting_down";
        case ErrorCode::NotSupported: return "not_supported";
        case ErrorCode::InternalError: return "internal_error";
    }
    return "internal_error";
}

struct Error {
    ErrorCode code = ErrorCode::Success;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorCodeName(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }
};

/**
 * @brief Value-or-error return type used across xferq.
 *
 * Converts implicitly from a T, an Error or a bare ErrorCode so that
 * functions can `return job;` or `return Error{...};` alike. Calling
 * value() on an error (or error() on a value) throws std::logic_error.
 */
template <typename T> class Result {
public:
    Result(const T& value) : state_(std::in_place_index<0>, value) {}
    Result(T&& value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}
    Result(ErrorCode code) : Result(Error{code}) {}

    [[nodiscard]] bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        requireValue();
        return std::get<0>(state_);
    }
    T&& value() && {
        requireValue();
        return std::get<0>(std::move(state_));
    }

    const Error& error() const {
        if (has_value())
            throw std::logic_error("Result holds a value, not an error");
        return std::get<1>(state_);
    }

private:
    void requireValue() const {
        if (!has_value())
            throw std::logic_error("Result holds an error: " + std::get<1>(state_).message);
    }

    std::variant<T, Error> state_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code) : error_(code) {}

    [[nodiscard]] bool has_value() const noexcept { return error_.code == ErrorCode::Success; }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value())
            throw std::logic_error("Result holds an error: " + error_.message);
    }

    const Error& error() const {
        if (has_value())
            throw std::logic_error("Result holds a value, not an error");
        return error_;
    }

private:
    Error error_;
};

} // namespace xferq

template <> struct fmt::formatter<xferq::ErrorCode> : fmt::formatter<std::string_view> {
    template <typename FormatContext> auto format(xferq::ErrorCode code, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(xferq::errorCodeName(code), ctx);
    }
};
