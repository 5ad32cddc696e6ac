#pragma once

#include <optional>
#include <string>

namespace tracehook {

/**
 * @brief Error categories for tracing operations
 */
enum class ErrorCategory {
    NONE,
    ENTITY_MISSING,
    ENTITY_TYPE_MISMATCH,
    ENTITY_CLOSED,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                 return "none";
        case ErrorCategory::ENTITY_MISSING:       return "entity_missing";
        case ErrorCategory::ENTITY_TYPE_MISMATCH: return "entity_type_mismatch";
        case ErrorCategory::ENTITY_CLOSED:        return "entity_closed";
        case ErrorCategory::INTERNAL_ERROR:       return "internal_error";
    }
    return "unknown";
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

/**
 * @brief Outcome of an operation with no value (success or categorized error)
 */
class Status {
public:
    static Status ok() { return Status{}; }

    static Status error(ErrorCategory category, std::string message) {
        Status s;
        s.error_category_ = category;
        s.error_message_ = std::move(message);
        return s;
    }

    bool is_ok() const { return error_category_ == ErrorCategory::NONE; }
    bool is_error() const { return !is_ok(); }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace tracehook
