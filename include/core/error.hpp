#pragma once

#include <string>
#include <optional>
#include <utility>

namespace joinscout {

/**
 * @brief Error categories surfaced by the schema and inference layers
 */
enum class ErrorCategory {
    NONE,
    TABLE_NOT_FOUND,
    METADATA_UNAVAILABLE,
    AMBIGUOUS_IDENTIFIER,
    INVALID_REQUEST,
    CANCELLED,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::TABLE_NOT_FOUND: return "TABLE_NOT_FOUND";
        case ErrorCategory::METADATA_UNAVAILABLE: return "METADATA_UNAVAILABLE";
        case ErrorCategory::AMBIGUOUS_IDENTIFIER: return "AMBIGUOUS_IDENTIFIER";
        case ErrorCategory::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCategory::CANCELLED: return "CANCELLED";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

// Only provider failures are transient; everything else is a caller or schema problem
[[nodiscard]] inline constexpr bool is_retryable(ErrorCategory category) noexcept {
    return category == ErrorCategory::METADATA_UNAVAILABLE;
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

    /**
     * @brief Re-wrap another result's error (value type may differ)
     */
    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
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

} // namespace joinscout
