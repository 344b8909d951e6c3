/**
 * @file errors.hpp
 * @brief Structured error handling for glasscheck.
 *
 * This file defines error codes and error structures for reporting
 * design calculation failures in a machine-readable format. A fatal
 * error always aborts the whole calculation; the error travels as a
 * DesignException carrying the DesignError.
 */

#ifndef GLASSCHECK_ERRORS_HPP
#define GLASSCHECK_ERRORS_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace glasscheck {

/**
 * @brief Error codes for glasscheck failures.
 *
 * These codes provide machine-readable error identification.
 * Each code corresponds to a specific type of failure.
 */
enum class ErrorCode {
    /// No error
    OK = 0,

    // === Material Table Errors (100-199) ===

    /// Interlayer product is not present in the material table
    UNKNOWN_PRODUCT = 100,

    /// Product has no samples at all for the requested load duration class
    UNSUPPORTED_DURATION_CLASS = 101,

    /// Two samples of one product share the same (temperature, duration) pair
    DUPLICATE_SAMPLE = 102,

    /// Tabular source could not be parsed
    INVALID_TABLE_FORMAT = 103,

    /// Tabular source file could not be opened
    FILE_NOT_FOUND = 104,

    // === Laminate Errors (200-299) ===

    /// Layer stack has no plies, bad ordering or bad layer data
    INVALID_STACK_CONFIGURATION = 200,

    // === Factor Errors (300-399) ===

    /// Selected standard does not define the categorical input tuple
    UNSUPPORTED_COMBINATION = 300,

    // === Request Errors (400-499) ===

    /// Malformed request or missing required field
    INVALID_REQUEST = 400,

    // === Generic Errors (900-999) ===

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::UNKNOWN_PRODUCT: return "UNKNOWN_PRODUCT";
        case ErrorCode::UNSUPPORTED_DURATION_CLASS: return "UNSUPPORTED_DURATION_CLASS";
        case ErrorCode::DUPLICATE_SAMPLE: return "DUPLICATE_SAMPLE";
        case ErrorCode::INVALID_TABLE_FORMAT: return "INVALID_TABLE_FORMAT";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::INVALID_STACK_CONFIGURATION: return "INVALID_STACK_CONFIGURATION";
        case ErrorCode::UNSUPPORTED_COMBINATION: return "UNSUPPORTED_COMBINATION";
        case ErrorCode::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for glasscheck.
 *
 * Contains machine-readable error code, human-readable message,
 * the load case that failed (if any) and diagnostic details.
 */
struct DesignError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Index of the load case being evaluated when the error occurred (-1 if none)
    int load_case_index = -1;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    DesignError()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code and message.
     */
    DesignError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    bool is_ok() const { return code == ErrorCode::OK; }

    bool is_error() const { return code != ErrorCode::OK; }

    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (load_case_index >= 0) {
            result += "\n  Load case: " + std::to_string(load_case_index);
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    static DesignError unknown_product(const std::string& product_id) {
        DesignError err(ErrorCode::UNKNOWN_PRODUCT,
            "Interlayer product '" + product_id + "' is not in the material table");
        err.details["product"] = product_id;
        err.suggestion = "Check the product id spelling or load a table that contains the product.";
        return err;
    }

    static DesignError unsupported_duration(const std::string& product_id,
                                            const std::string& duration) {
        DesignError err(ErrorCode::UNSUPPORTED_DURATION_CLASS,
            "Product '" + product_id + "' has no samples for load duration '" + duration + "'");
        err.details["product"] = product_id;
        err.details["duration"] = duration;
        err.suggestion = "Duration classes are not interpolated; add samples for this duration.";
        return err;
    }

    static DesignError invalid_stack(const std::string& reason) {
        DesignError err(ErrorCode::INVALID_STACK_CONFIGURATION,
            "Invalid laminate stack: " + reason);
        err.suggestion = "Use a single ply, or plies separated by interlayers of one product.";
        return err;
    }

    static DesignError unsupported_combination(const std::string& standard,
                                               const std::string& reason) {
        DesignError err(ErrorCode::UNSUPPORTED_COMBINATION,
            "Combination not covered by " + standard + ": " + reason);
        err.details["standard"] = standard;
        return err;
    }

    static DesignError invalid_request(const std::string& reason) {
        return DesignError(ErrorCode::INVALID_REQUEST, "Invalid request: " + reason);
    }

    static DesignError invalid_table(const std::string& reason, int line = -1) {
        DesignError err(ErrorCode::INVALID_TABLE_FORMAT, "Invalid material table: " + reason);
        if (line > 0) {
            err.details["line"] = std::to_string(line);
        }
        return err;
    }
};

/**
 * @brief Exception carrying a DesignError.
 *
 * Thrown by every fatal path; what() returns DesignError::to_string().
 */
class DesignException : public std::runtime_error {
public:
    explicit DesignException(DesignError error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    const DesignError& error() const noexcept { return error_; }

    ErrorCode code() const noexcept { return error_.code; }

private:
    DesignError error_;
};

}  // namespace glasscheck

#endif  // GLASSCHECK_ERRORS_HPP
