#pragma once

#include <string>
#include <optional>

namespace logictest {

/**
 * @brief Error categories for the runner
 */
enum class ErrorCategory {
    NONE,
    PARSE_ERROR,
    IO_ERROR,
    EXECUTION_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "none";
        case ErrorCategory::PARSE_ERROR: return "parse error";
        case ErrorCategory::IO_ERROR: return "I/O error";
        case ErrorCategory::EXECUTION_ERROR: return "execution error";
        case ErrorCategory::CONFIG_ERROR: return "config error";
        case ErrorCategory::INTERNAL_ERROR: return "internal error";
        default: return "unknown";
    }
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

} // namespace logictest
