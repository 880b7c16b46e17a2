#pragma once

#include <optional>
#include <string>

namespace redactor {

/**
 * @brief Error categories surfaced to callers
 *
 * VALIDATION_ERROR  - request is missing content/policy_id or is malformed
 * POLICY_NOT_FOUND  - no active policy with that id for the caller
 * CONFIG_ERROR      - policy carries a rule that cannot be evaluated
 * INTERNAL_ERROR    - unexpected failure (hashing, matcher runtime), retryable
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_ERROR,
    POLICY_NOT_FOUND,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::VALIDATION_ERROR: return "VALIDATION_ERROR";
        case ErrorCategory::POLICY_NOT_FOUND: return "POLICY_NOT_FOUND";
        case ErrorCategory::CONFIG_ERROR: return "CONFIG_ERROR";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "INTERNAL_ERROR";
    }
}

inline bool is_retryable(ErrorCategory category) {
    return category == ErrorCategory::INTERNAL_ERROR;
}

/**
 * @brief Result type for operations that can fail
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

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace redactor
