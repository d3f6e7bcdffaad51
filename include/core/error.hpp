#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace dbsurvey {

/**
 * @brief Error codes for collection operations
 *
 * Connection-level codes are the only ones the retry policy considers
 * transient (see is_retryable).
 */
enum class ErrorCode {
    NONE,
    CONNECTION_FAILED,
    CONNECTION_TIMEOUT,
    QUERY_TIMEOUT,
    QUERY_FAILED,
    INSUFFICIENT_PRIVILEGE,
    INVALID_CONNECTION_TARGET,
    ADAPTER_NOT_FOUND,
    PARTIAL_COLLECTION,
    SAMPLING_WARNING,
    CONFIGURATION_ERROR,
    UNSUPPORTED_FEATURE,
    CANCELLED,
    INTERNAL_ERROR
};

[[nodiscard]] inline std::string_view error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "None";
        case ErrorCode::CONNECTION_FAILED: return "ConnectionFailed";
        case ErrorCode::CONNECTION_TIMEOUT: return "ConnectionTimeout";
        case ErrorCode::QUERY_TIMEOUT: return "QueryTimeout";
        case ErrorCode::QUERY_FAILED: return "QueryFailed";
        case ErrorCode::INSUFFICIENT_PRIVILEGE: return "InsufficientPrivilege";
        case ErrorCode::INVALID_CONNECTION_TARGET: return "InvalidConnectionTarget";
        case ErrorCode::ADAPTER_NOT_FOUND: return "AdapterNotFound";
        case ErrorCode::PARTIAL_COLLECTION: return "PartialCollection";
        case ErrorCode::SAMPLING_WARNING: return "SamplingWarning";
        case ErrorCode::CONFIGURATION_ERROR: return "ConfigurationError";
        case ErrorCode::UNSUPPORTED_FEATURE: return "UnsupportedFeature";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::INTERNAL_ERROR: return "InternalError";
        default: return "Unknown";
    }
}

[[nodiscard]] inline bool is_retryable(ErrorCode code) {
    return code == ErrorCode::CONNECTION_FAILED || code == ErrorCode::CONNECTION_TIMEOUT;
}

/**
 * @brief Result type for operations that can fail
 *
 * Messages must already be sanitized: callers never interpolate raw
 * connection strings into them.
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /**
     * @brief Re-type the error of another result (value-less propagation)
     */
    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    T take_value() { return std::move(*value_); }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

} // namespace dbsurvey
