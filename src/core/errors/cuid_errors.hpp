#pragma once
#include <string>
#include <variant>

namespace cuid::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,        // E.g., a malformed identifier or an invalid CLI flag
        Environment,  // E.g., hostname or process id could not be read
        Entropy,      // E.g., the random device failed to produce a value
        Internal      // E.g., C++ logic bug
    };

    // The standardized error payload
    struct CuidError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a CuidError.
    template <typename T>
    using Result = std::variant<T, CuidError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<CuidError>(result);
    }

    template <typename T>
    const CuidError& get_error(const Result<T>& result) {
        return std::get<CuidError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Environment: return "environment";
            case ErrorCategory::Entropy: return "entropy";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace cuid::core::errors
