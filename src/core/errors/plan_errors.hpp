#pragma once
#include <string>
#include <variant>

namespace callplan::core::errors {

    enum class ErrorCategory {
        Input,      // E.g., malformed batch JSON or an invalid CLI flag
        Config,     // E.g., classifier config file has a wrong field type
        Internal    // E.g., unable to write the plan artifact
    };

    struct PlanError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a value of type T or a PlanError.
    template <typename T>
    using Result = std::variant<T, PlanError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<PlanError>(result);
    }

    template <typename T>
    const PlanError& get_error(const Result<T>& result) {
        return std::get<PlanError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Config:
                return "config";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace callplan::core::errors
