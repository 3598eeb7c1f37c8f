#pragma once

#include <optional>
#include <string>

namespace apmcore {

/**
 * @brief Error categories for the tracing core
 *
 * None of these ever reach instrumented application code; they are logged
 * where they are produced and the affected feature degrades.
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,       // malformed or missing configuration
    DECODE_ERROR,       // unparsable remote payload
    UNTRUSTED_DATA      // payload from an account not on the trust list
};

[[nodiscard]] inline constexpr const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "none";
        case ErrorCategory::CONFIG_ERROR:   return "config_error";
        case ErrorCategory::DECODE_ERROR:   return "decode_error";
        case ErrorCategory::UNTRUSTED_DATA: return "untrusted_data";
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

} // namespace apmcore
