#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace cartograph {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using NodeId = int64_t;

// Error types
enum class ErrorCode {
    Success = 0,
    FileNotFound,
    PermissionDenied,
    InvalidArgument,
    DatabaseError,
    TransactionFailed,
    OperationCancelled,
    InvalidState,
    InvalidData,
    InternalError,
    NotFound,
    NotSupported,
    Timeout,
    ResourceExhausted,
    NotInitialized,
    // Graph store could not be reached or stayed busy past the retry budget.
    StoreUnavailable,
    // Natural-key conflict or other schema invariant breach.
    ConstraintViolation,
    // Source file could not be parsed at all.
    MalformedInput,
    // Inference capability failed, timed out or is not configured.
    InferenceUnavailable,
    // Legacy construct without a derivable target mapping.
    UnmappableConstruct,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::TransactionFailed: return "Transaction failed";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::StoreUnavailable: return "Store unavailable";
        case ErrorCode::ConstraintViolation: return "Constraint violation";
        case ErrorCode::MalformedInput: return "Malformed input";
        case ErrorCode::InferenceUnavailable: return "Inference unavailable";
        case ErrorCode::UnmappableConstruct: return "Unmappable construct";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Stable identifier used in Report/Feedback records
constexpr const char* errorKindName(ErrorCode error) {
    switch (error) {
        case ErrorCode::StoreUnavailable:
        case ErrorCode::DatabaseError:
        case ErrorCode::ResourceExhausted: return "TransientStoreError";
        case ErrorCode::InferenceUnavailable:
        case ErrorCode::Timeout: return "TransientInferenceError";
        case ErrorCode::MalformedInput: return "MalformedInputError";
        case ErrorCode::ConstraintViolation: return "ConstraintViolationError";
        case ErrorCode::UnmappableConstruct: return "UnmappableConstructError";
        default: return "InternalError";
    }
}

// Retryable errors are retried by the pipeline with backoff
constexpr bool isRetryable(ErrorCode error) {
    switch (error) {
        case ErrorCode::StoreUnavailable:
        case ErrorCode::InferenceUnavailable:
        case ErrorCode::Timeout:
        case ErrorCode::ResourceExhausted:
            return true;
        default:
            return false;
    }
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }
    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    T value_or(T fallback) const& { return has_value() ? std::get<T>(data_) : std::move(fallback); }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace cartograph

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<cartograph::ErrorCode> : fmt::formatter<const char*> {
    template <typename FormatContext>
    auto format(cartograph::ErrorCode error, FormatContext& ctx) const {
        return fmt::formatter<const char*>::format(cartograph::errorToString(error), ctx);
    }
};
