#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tablegate {

/**
 * @brief Error categories surfaced by the engine
 *
 * Catalog and request errors are actionable and reported verbatim.
 * POLICY_DENIED never carries detail about which policy rejected a write.
 */
enum class ErrorCategory {
    NONE,
    NOT_FOUND,
    CATALOG_ERROR,
    INVALID_COLUMN_SET,
    EMPTY_WRITE_SET,
    INVALID_PAYLOAD,
    POLICY_DENIED,
    EXECUTION_ERROR,
    SIGNATURE_INVALID,
    EXPIRED,
    NOT_YET_VALID,
    AUDIENCE_MISMATCH,
    ISSUER_MISMATCH,
    CONFIG_ERROR
};

[[nodiscard]] inline constexpr std::string_view error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:               return "none";
        case ErrorCategory::NOT_FOUND:          return "not_found";
        case ErrorCategory::CATALOG_ERROR:      return "catalog_error";
        case ErrorCategory::INVALID_COLUMN_SET: return "invalid_column_set";
        case ErrorCategory::EMPTY_WRITE_SET:    return "empty_write_set";
        case ErrorCategory::INVALID_PAYLOAD:    return "invalid_payload";
        case ErrorCategory::POLICY_DENIED:      return "policy_denied";
        case ErrorCategory::EXECUTION_ERROR:    return "execution_error";
        case ErrorCategory::SIGNATURE_INVALID:  return "signature_invalid";
        case ErrorCategory::EXPIRED:            return "expired";
        case ErrorCategory::NOT_YET_VALID:      return "not_yet_valid";
        case ErrorCategory::AUDIENCE_MISMATCH:  return "audience_mismatch";
        case ErrorCategory::ISSUER_MISMATCH:    return "issuer_mismatch";
        case ErrorCategory::CONFIG_ERROR:       return "config_error";
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

    // Re-wrap another result's failure under a different value type
    template<typename U>
    static Result error_from(const Result<U>& other) {
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

} // namespace tablegate
